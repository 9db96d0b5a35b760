#pragma once

namespace ledcast::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Schema statements are idempotent and run on every start.
*/

static constexpr int kSchemaVersion = 1;

static constexpr const char* kBootstrapSql[] = {
    "CREATE TABLE IF NOT EXISTS sources ("
    " id TEXT PRIMARY KEY, filename TEXT NOT NULL, display_name TEXT NOT NULL,"
    " kind INTEGER NOT NULL, byte_size INTEGER NOT NULL, ingested_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS artifacts ("
    " source_id TEXT NOT NULL REFERENCES sources(id) ON DELETE CASCADE,"
    " geometry TEXT NOT NULL, encoder_version TEXT NOT NULL, path TEXT NOT NULL,"
    " frame_count INTEGER NOT NULL, byte_size INTEGER NOT NULL, looping INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL, last_served_ms INTEGER NOT NULL DEFAULT 0,"
    " served_count INTEGER NOT NULL DEFAULT 0,"
    " PRIMARY KEY (source_id, geometry, encoder_version));",

    "CREATE INDEX IF NOT EXISTS artifacts_by_recency ON artifacts(last_served_ms, created_at_ms);",

    "CREATE TABLE IF NOT EXISTS conversion_jobs ("
    " source_id TEXT PRIMARY KEY, state INTEGER NOT NULL, attempts INTEGER NOT NULL,"
    " last_error TEXT NOT NULL, encoder_version TEXT NOT NULL,"
    " updated_at_ms INTEGER NOT NULL, not_before_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS job_outcomes ("
    " source_id TEXT NOT NULL REFERENCES conversion_jobs(source_id) ON DELETE CASCADE,"
    " geometry TEXT NOT NULL, ok INTEGER NOT NULL, error_kind INTEGER NOT NULL, reason TEXT NOT NULL,"
    " PRIMARY KEY (source_id, geometry));",

    "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
};

static constexpr const char* RECORD_SCHEMA_VERSION =
    "INSERT OR IGNORE INTO schema_migrations(version,applied_at_ms) VALUES(?,?);";

// sources

static constexpr const char* UPSERT_SOURCE =
    "INSERT INTO sources(id,filename,display_name,kind,byte_size,ingested_at_ms)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " filename=excluded.filename,"
    " display_name=excluded.display_name,"
    " kind=excluded.kind,"
    " byte_size=excluded.byte_size;";

static constexpr const char* SELECT_SOURCE =
    "SELECT id,filename,display_name,kind,byte_size,ingested_at_ms"
    " FROM sources WHERE id=?;";

static constexpr const char* SELECT_SOURCES =
    "SELECT id,filename,display_name,kind,byte_size,ingested_at_ms"
    " FROM sources ORDER BY id;";

static constexpr const char* DELETE_SOURCE =
    "DELETE FROM sources WHERE id=?;";

// artifacts

static constexpr const char* UPSERT_ARTIFACT =
    "INSERT INTO artifacts(source_id,geometry,encoder_version,path,frame_count,byte_size,looping,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(source_id,geometry,encoder_version) DO UPDATE SET"
    " path=excluded.path,"
    " frame_count=excluded.frame_count,"
    " byte_size=excluded.byte_size,"
    " looping=excluded.looping,"
    " created_at_ms=excluded.created_at_ms;";

#define LEDCAST_ARTIFACT_COLUMNS \
  "source_id,geometry,encoder_version,path,frame_count,byte_size,looping,created_at_ms,last_served_ms,served_count"

static constexpr const char* SELECT_ARTIFACT =
    "SELECT " LEDCAST_ARTIFACT_COLUMNS
    " FROM artifacts WHERE source_id=? AND geometry=? AND encoder_version=?;";

static constexpr const char* SELECT_ARTIFACTS =
    "SELECT " LEDCAST_ARTIFACT_COLUMNS
    " FROM artifacts ORDER BY source_id,geometry,encoder_version;";

static constexpr const char* SELECT_ARTIFACTS_FOR_SOURCE =
    "SELECT " LEDCAST_ARTIFACT_COLUMNS
    " FROM artifacts WHERE source_id=? ORDER BY geometry,encoder_version;";

#undef LEDCAST_ARTIFACT_COLUMNS

static constexpr const char* DELETE_ARTIFACT =
    "DELETE FROM artifacts WHERE source_id=? AND geometry=? AND encoder_version=?;";

static constexpr const char* TOUCH_ARTIFACT =
    "UPDATE artifacts SET served_count=served_count+1, last_served_ms=?"
    " WHERE source_id=? AND geometry=? AND encoder_version=?;";

// jobs

static constexpr const char* UPSERT_JOB =
    "INSERT INTO conversion_jobs(source_id,state,attempts,last_error,encoder_version,updated_at_ms,not_before_ms)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(source_id) DO UPDATE SET"
    " state=excluded.state,"
    " attempts=excluded.attempts,"
    " last_error=excluded.last_error,"
    " encoder_version=excluded.encoder_version,"
    " updated_at_ms=excluded.updated_at_ms,"
    " not_before_ms=excluded.not_before_ms;";

static constexpr const char* SELECT_JOB =
    "SELECT source_id,state,attempts,last_error,encoder_version,updated_at_ms,not_before_ms"
    " FROM conversion_jobs WHERE source_id=?;";

static constexpr const char* SELECT_JOBS =
    "SELECT source_id,state,attempts,last_error,encoder_version,updated_at_ms,not_before_ms"
    " FROM conversion_jobs ORDER BY source_id;";

static constexpr const char* DELETE_JOB =
    "DELETE FROM conversion_jobs WHERE source_id=?;";

static constexpr const char* DELETE_JOB_OUTCOMES =
    "DELETE FROM job_outcomes WHERE source_id=?;";

static constexpr const char* INSERT_JOB_OUTCOME =
    "INSERT INTO job_outcomes(source_id,geometry,ok,error_kind,reason) VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_JOB_OUTCOMES =
    "SELECT geometry,ok,error_kind,reason FROM job_outcomes WHERE source_id=? ORDER BY rowid;";

} // namespace ledcast::db::sql
