#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/artifact_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/source_record.hpp"

namespace ledcast::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - List results are ordered by primary key on every backend
  - Deleting a source deletes its artifact rows

  The DB is the source of truth for:
    sources
    artifact metadata (never pixel data)
    conversion jobs and their per-geometry outcomes
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sources
  // ---------------------------------------------------------------------

  // Insert or refresh. ingested_at_ms of an existing row is preserved.
  virtual Result UpsertSource(Transaction&, const model::SourceRecord&) = 0;

  virtual std::optional<model::SourceRecord> GetSource(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::SourceRecord> ListSources(Transaction&) = 0;

  // NotFound when absent.
  virtual Result DeleteSource(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Artifacts
  // ---------------------------------------------------------------------

  // Requires the source row. served_count/last_served_ms of an existing
  // row are preserved.
  virtual Result UpsertArtifact(Transaction&, const model::ArtifactRecord&) = 0;

  virtual std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& source_id, const std::string& geometry,
                                                           const std::string& encoder_version) = 0;

  virtual std::vector<model::ArtifactRecord> ListArtifacts(Transaction&) = 0;

  virtual std::vector<model::ArtifactRecord> ListArtifactsForSource(Transaction&, const std::string& source_id) = 0;

  // NotFound when absent.
  virtual Result DeleteArtifact(Transaction&, const std::string& source_id, const std::string& geometry, const std::string& encoder_version) = 0;

  // served_count += 1, last_served_ms = served_at_ms. NotFound when absent.
  virtual Result TouchArtifact(Transaction&, const std::string& source_id, const std::string& geometry, const std::string& encoder_version,
                               uint64_t served_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Conversion jobs
  // ---------------------------------------------------------------------

  virtual Result UpsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& source_id) = 0;

  virtual std::vector<model::JobRecord> ListJobs(Transaction&) = 0;

  // NotFound when absent.
  virtual Result DeleteJob(Transaction&, const std::string& source_id) = 0;
};

} // namespace ledcast::db
