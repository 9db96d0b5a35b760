#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "ledcast/v1.hpp"

namespace ledcast::db::sqlite {

using ledcast::db::ErrorCode;
using ledcast::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

  // Read paths throw: an unreadable catalog is not an empty one.
  void RequirePrepared(const char* what) const {
    if (!st_) throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

void StepOrThrow(sqlite3* db, int rc, const char* what) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

model::SourceRecord ReadSource(sqlite3_stmt* st) {
  model::SourceRecord r;
  r.id             = ColText(st, 0);
  r.filename       = ColText(st, 1);
  r.display_name   = ColText(st, 2);
  r.kind           = static_cast<ledcast::v1::MediaKind>(ColI32(st, 3));
  r.byte_size      = ColU64(st, 4);
  r.ingested_at_ms = ColU64(st, 5);
  return r;
}

model::ArtifactRecord ReadArtifact(sqlite3_stmt* st) {
  model::ArtifactRecord r;
  r.source_id       = ColText(st, 0);
  r.geometry        = ColText(st, 1);
  r.encoder_version = ColText(st, 2);
  r.path            = ColText(st, 3);
  r.frame_count     = static_cast<uint32_t>(ColU64(st, 4));
  r.byte_size       = ColU64(st, 5);
  r.loop            = ColI32(st, 6) != 0;
  r.created_at_ms   = ColU64(st, 7);
  r.last_served_ms  = ColU64(st, 8);
  r.served_count    = ColU64(st, 9);
  return r;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.source_id       = ColText(st, 0);
  r.state           = static_cast<ledcast::v1::JobState>(ColI32(st, 1));
  r.attempts        = static_cast<uint32_t>(ColU64(st, 2));
  r.last_error      = ColText(st, 3);
  r.encoder_version = ColText(st, 4);
  r.updated_at_ms   = ColU64(st, 5);
  r.not_before_ms   = ColU64(st, 6);
  return r;
}

void BindArtifactKey(sqlite3_stmt* st, int first, const std::string& source_id, const std::string& geometry, const std::string& encoder_version) {
  BindText(st, first, source_id);
  BindText(st, first + 1, geometry);
  BindText(st, first + 2, encoder_version);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSource(Transaction& t, const model::SourceRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_SOURCE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.filename);
  BindText(st.get(), 3, r.display_name);
  BindI32(st.get(), 4, static_cast<int>(r.kind));
  BindU64(st.get(), 5, r.byte_size);
  BindU64(st.get(), 6, r.ingested_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SourceRecord> SqliteRepository::GetSource(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_SOURCE);
  st.RequirePrepared("select source");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc, "select source");
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadSource(st.get());
}

std::vector<model::SourceRecord> SqliteRepository::ListSources(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_SOURCES);
  st.RequirePrepared("list sources");

  std::vector<model::SourceRecord> out;
  int                              rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSource(st.get()));
  }
  StepOrThrow(db, rc, "list sources");
  return out;
}

Result SqliteRepository::DeleteSource(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_SOURCE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "source " + id);
  return result;
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_ARTIFACT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindArtifactKey(st.get(), 1, r.source_id, r.geometry, r.encoder_version);
  BindText(st.get(), 4, r.path);
  BindU64(st.get(), 5, r.frame_count);
  BindU64(st.get(), 6, r.byte_size);
  BindI32(st.get(), 7, r.loop ? 1 : 0);
  BindU64(st.get(), 8, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ArtifactRecord> SqliteRepository::GetArtifact(Transaction& t, const std::string& source_id, const std::string& geometry,
                                                                    const std::string& encoder_version) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_ARTIFACT);
  st.RequirePrepared("select artifact");
  BindArtifactKey(st.get(), 1, source_id, geometry, encoder_version);

  const int rc = sqlite3_step(st.get());
  StepOrThrow(db, rc, "select artifact");
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadArtifact(st.get());
}

std::vector<model::ArtifactRecord> SqliteRepository::ListArtifacts(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_ARTIFACTS);
  st.RequirePrepared("list artifacts");

  std::vector<model::ArtifactRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadArtifact(st.get()));
  }
  StepOrThrow(db, rc, "list artifacts");
  return out;
}

std::vector<model::ArtifactRecord> SqliteRepository::ListArtifactsForSource(Transaction& t, const std::string& source_id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_ARTIFACTS_FOR_SOURCE);
  st.RequirePrepared("list source artifacts");
  BindText(st.get(), 1, source_id);

  std::vector<model::ArtifactRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadArtifact(st.get()));
  }
  StepOrThrow(db, rc, "list source artifacts");
  return out;
}

Result SqliteRepository::DeleteArtifact(Transaction& t, const std::string& source_id, const std::string& geometry,
                                        const std::string& encoder_version) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_ARTIFACT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindArtifactKey(st.get(), 1, source_id, geometry, encoder_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "artifact " + source_id + "/" + geometry);
  return result;
}

Result SqliteRepository::TouchArtifact(Transaction& t, const std::string& source_id, const std::string& geometry,
                                       const std::string& encoder_version, uint64_t served_at_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::TOUCH_ARTIFACT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, served_at_ms);
  BindArtifactKey(st.get(), 2, source_id, geometry, encoder_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "artifact " + source_id + "/" + geometry);
  return result;
}

// ------------------------------------------------------------------
// Conversion jobs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  {
    Statement st(db, sql::UPSERT_JOB);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, r.source_id);
    BindI32(st.get(), 2, static_cast<int>(r.state));
    BindU64(st.get(), 3, r.attempts);
    BindText(st.get(), 4, r.last_error);
    BindText(st.get(), 5, r.encoder_version);
    BindU64(st.get(), 6, r.updated_at_ms);
    BindU64(st.get(), 7, r.not_before_ms);
    if (auto result = Translate(db, sqlite3_step(st.get())); !result) return result;
  }

  {
    Statement st(db, sql::DELETE_JOB_OUTCOMES);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, r.source_id);
    if (auto result = Translate(db, sqlite3_step(st.get())); !result) return result;
  }

  for (const auto& outcome : r.outcomes) {
    Statement st(db, sql::INSERT_JOB_OUTCOME);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, r.source_id);
    BindText(st.get(), 2, outcome.geometry);
    BindI32(st.get(), 3, outcome.ok ? 1 : 0);
    BindI32(st.get(), 4, static_cast<int>(outcome.error_kind));
    BindText(st.get(), 5, outcome.reason);
    if (auto result = Translate(db, sqlite3_step(st.get())); !result) return result;
  }

  return Result::Ok();
}

std::vector<model::GeometryOutcomeRecord> SqliteRepository::LoadOutcomes(sqlite3* db, const std::string& source_id) {
  Statement st(db, sql::SELECT_JOB_OUTCOMES);
  st.RequirePrepared("select job outcomes");
  BindText(st.get(), 1, source_id);

  std::vector<model::GeometryOutcomeRecord> out;
  int                                       rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::GeometryOutcomeRecord o;
    o.geometry   = ColText(st.get(), 0);
    o.ok         = ColI32(st.get(), 1) != 0;
    o.error_kind = static_cast<ledcast::v1::ErrorKind>(ColI32(st.get(), 2));
    o.reason     = ColText(st.get(), 3);
    out.push_back(std::move(o));
  }
  StepOrThrow(db, rc, "select job outcomes");
  return out;
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& source_id) {
  auto* db = TX(t).Handle();

  std::optional<model::JobRecord> job;
  {
    Statement st(db, sql::SELECT_JOB);
    st.RequirePrepared("select job");
    BindText(st.get(), 1, source_id);

    const int rc = sqlite3_step(st.get());
    StepOrThrow(db, rc, "select job");
    if (rc != SQLITE_ROW) return std::nullopt;
    job = ReadJob(st.get());
  }
  job->outcomes = LoadOutcomes(db, source_id);
  return job;
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::JobRecord> out;
  {
    Statement st(db, sql::SELECT_JOBS);
    st.RequirePrepared("list jobs");
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      out.push_back(ReadJob(st.get()));
    }
    StepOrThrow(db, rc, "list jobs");
  }
  for (auto& job : out) {
    job.outcomes = LoadOutcomes(db, job.source_id);
  }
  return out;
}

Result SqliteRepository::DeleteJob(Transaction& t, const std::string& source_id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_JOB);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, source_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job " + source_id);
  return result;
}

} // namespace ledcast::db::sqlite
