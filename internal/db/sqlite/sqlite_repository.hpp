#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledcast::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertSource(Transaction&, const model::SourceRecord&) override;
  std::optional<model::SourceRecord> GetSource(Transaction&, const std::string&) override;
  std::vector<model::SourceRecord> ListSources(Transaction&) override;
  Result DeleteSource(Transaction&, const std::string&) override;

  Result UpsertArtifact(Transaction&, const model::ArtifactRecord&) override;
  std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& source_id, const std::string& geometry,
                                                   const std::string& encoder_version) override;
  std::vector<model::ArtifactRecord> ListArtifacts(Transaction&) override;
  std::vector<model::ArtifactRecord> ListArtifactsForSource(Transaction&, const std::string& source_id) override;
  Result DeleteArtifact(Transaction&, const std::string& source_id, const std::string& geometry,
                        const std::string& encoder_version) override;
  Result TouchArtifact(Transaction&, const std::string& source_id, const std::string& geometry,
                       const std::string& encoder_version, uint64_t served_at_ms) override;

  Result UpsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListJobs(Transaction&) override;
  Result DeleteJob(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::GeometryOutcomeRecord> LoadOutcomes(sqlite3* db, const std::string& source_id);
};

} // namespace ledcast::db::sqlite
