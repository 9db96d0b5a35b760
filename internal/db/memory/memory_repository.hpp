#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>

#include "internal/db/api/repository.hpp"

namespace ledcast::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // (source_id, geometry, encoder_version)
  using ArtifactKey = std::tuple<std::string, std::string, std::string>;

  // Ordered maps give the same list order as the SQL backend.
  struct State {
    std::map<std::string, model::SourceRecord>   sources;
    std::map<ArtifactKey, model::ArtifactRecord> artifacts;
    std::map<std::string, model::JobRecord>      jobs;
  };

  std::mutex tx_mutex_;
  std::mutex mutex_;
  State      committed_;
};

} // namespace ledcast::db::memory
