#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace ledcast::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSource(Transaction& t, const model::SourceRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sources.find(r.id);
  if (it == s.sources.end()) {
    s.sources.emplace(r.id, r);
    return Result::Ok();
  }
  const auto ingested_at    = it->second.ingested_at_ms;
  it->second                = r;
  it->second.ingested_at_ms = ingested_at;
  return Result::Ok();
}

std::optional<model::SourceRecord> MemoryRepository::GetSource(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sources.find(id);
  if (it == s.sources.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SourceRecord> MemoryRepository::ListSources(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::SourceRecord> records;
  records.reserve(s.sources.size());
  for (const auto& [_, record] : s.sources) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteSource(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.sources.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "source " + id);

  // artifact rows cascade with their source
  for (auto it = s.artifacts.begin(); it != s.artifacts.end();) {
    if (std::get<0>(it->first) == id) {
      it = s.artifacts.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sources.contains(r.source_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "artifact references unknown source " + r.source_id);
  }

  ArtifactKey key{r.source_id, r.geometry, r.encoder_version};
  auto        it = s.artifacts.find(key);
  if (it == s.artifacts.end()) {
    auto fresh           = r;
    fresh.served_count   = 0;
    fresh.last_served_ms = 0;
    s.artifacts.emplace(std::move(key), std::move(fresh));
    return Result::Ok();
  }

  const auto served_count   = it->second.served_count;
  const auto last_served_ms = it->second.last_served_ms;
  it->second                = r;
  it->second.served_count   = served_count;
  it->second.last_served_ms = last_served_ms;
  return Result::Ok();
}

std::optional<model::ArtifactRecord> MemoryRepository::GetArtifact(Transaction& t, const std::string& source_id, const std::string& geometry,
                                                                    const std::string& encoder_version) {
  const auto& s  = TX(t).View();
  auto        it = s.artifacts.find(ArtifactKey{source_id, geometry, encoder_version});
  if (it == s.artifacts.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ArtifactRecord> MemoryRepository::ListArtifacts(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::ArtifactRecord> out;
  out.reserve(s.artifacts.size());
  for (const auto& [_, record] : s.artifacts) {
    out.push_back(record);
  }
  return out;
}

std::vector<model::ArtifactRecord> MemoryRepository::ListArtifactsForSource(Transaction& t, const std::string& source_id) {
  const auto&                        s = TX(t).View();
  std::vector<model::ArtifactRecord> out;
  for (auto it = s.artifacts.lower_bound(ArtifactKey{source_id, {}, {}}); it != s.artifacts.end() && std::get<0>(it->first) == source_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::DeleteArtifact(Transaction& t, const std::string& source_id, const std::string& geometry,
                                        const std::string& encoder_version) {
  auto& s = TX(t).Mutable();
  if (s.artifacts.erase(ArtifactKey{source_id, geometry, encoder_version}) == 0) {
    return Result::Err(ErrorCode::NotFound, "artifact " + source_id + "/" + geometry);
  }
  return Result::Ok();
}

Result MemoryRepository::TouchArtifact(Transaction& t, const std::string& source_id, const std::string& geometry,
                                       const std::string& encoder_version, uint64_t served_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.artifacts.find(ArtifactKey{source_id, geometry, encoder_version});
  if (it == s.artifacts.end()) return Result::Err(ErrorCode::NotFound, "artifact " + source_id + "/" + geometry);
  it->second.served_count++;
  it->second.last_served_ms = served_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Conversion jobs
// ------------------------------------------------------------------

Result MemoryRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  TX(t).Mutable().jobs[r.source_id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& source_id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(source_id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;
  out.reserve(s.jobs.size());
  for (const auto& [_, record] : s.jobs) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteJob(Transaction& t, const std::string& source_id) {
  if (TX(t).Mutable().jobs.erase(source_id) == 0) return Result::Err(ErrorCode::NotFound, "job " + source_id);
  return Result::Ok();
}

} // namespace ledcast::db::memory
