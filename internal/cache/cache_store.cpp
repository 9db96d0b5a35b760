#include "cache_store.hpp"

#include <arrow/buffer.h>

#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "internal/codec/artifact_format.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledcast::cache {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kMinPrefixLength = 8;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) return;
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound(context + ": " + result.message);
  }
  throw std::runtime_error(context + ": " + result.message);
}

} // namespace

CacheStore::CacheStore(std::shared_ptr<db::Repository> repository,
                       storage::ArtifactStorePtr       store,
                       std::string                     encoder_version,
                       CacheOptions                    options)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      encoder_version_(std::move(encoder_version)),
      options_(options),
      policy_(options.limits) {
  if (!repository_ || !store_) {
    throw std::invalid_argument("cache store requires a repository and an artifact store");
  }
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

void CacheStore::RegisterSource(const db::model::SourceRecord& source) {
  if (!util::IsHexIdentity(source.id)) {
    throw std::invalid_argument("source id must be a hex content hash: " + source.id);
  }

  std::unique_lock lock(rw_mutex_);
  auto             tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertSource(*tx, source), "register source");
  tx->Commit();
}

std::optional<db::model::SourceRecord> CacheStore::GetSource(const std::string& source_id) {
  std::shared_lock lock(rw_mutex_);
  auto             tx = repository_->Begin();
  return repository_->GetSource(*tx, source_id);
}

std::optional<db::model::SourceRecord> CacheStore::FindSource(const std::string& selector) {
  if (selector.empty()) return std::nullopt;

  std::shared_lock lock(rw_mutex_);
  auto             tx = repository_->Begin();

  if (auto exact = repository_->GetSource(*tx, selector)) return exact;

  const auto sources = repository_->ListSources(*tx);

  if (selector.size() >= kMinPrefixLength && util::IsHexIdentity(selector)) {
    std::optional<db::model::SourceRecord> match;
    std::size_t                            matches = 0;
    for (const auto& source : sources) {
      if (source.id.compare(0, selector.size(), selector) == 0) {
        match = source;
        ++matches;
      }
    }
    if (matches == 1) return match;
    if (matches > 1) {
      LEDCAST_LOG_DEBUG("ambiguous source prefix", {StringField("selector", selector), IntField("matches", static_cast<int64_t>(matches))});
      return std::nullopt;
    }
  }

  for (const auto& source : sources) {
    if (source.display_name == selector) return source;
  }
  for (const auto& source : sources) {
    if (source.filename == selector) return source;
  }
  return std::nullopt;
}

std::size_t CacheStore::Delete(const std::string& source_id) {
  std::unique_lock lock(rw_mutex_);

  std::vector<db::model::ArtifactRecord> removed;
  {
    auto tx = repository_->Begin();
    if (!repository_->GetSource(*tx, source_id)) {
      throw util::NotFound("source " + source_id);
    }
    removed = repository_->ListArtifactsForSource(*tx, source_id);
    for (const auto& artifact : removed) {
      ThrowIfDbError(repository_->DeleteArtifact(*tx, artifact.source_id, artifact.geometry, artifact.encoder_version), "delete artifact");
    }
    ThrowIfDbError(repository_->DeleteSource(*tx, source_id), "delete source");
    tx->Commit();
  }

  for (const auto& artifact : removed) {
    UnlinkQuietly(artifact.path);
  }

  LEDCAST_LOG_INFO("source deleted", {StringField("source", source_id), IntField("artifacts", static_cast<int64_t>(removed.size()))});
  PublishUsage();
  return removed.size();
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

db::model::ArtifactRecord CacheStore::Put(const std::string& source_id, const model::FrameSequence& frames) {
  const auto geometry = frames.geometry.Tag();
  auto       bytes    = codec::SerializeArtifact(frames);
  const auto size     = static_cast<uint64_t>(bytes.size());

  if (!policy_.Limits().FitsAlone(size)) {
    throw util::CapacityError("artifact " + source_id + "/" + geometry + " is " + std::to_string(size) + " bytes, cache bound is " +
                              std::to_string(policy_.Limits().max_bytes));
  }

  std::unique_lock lock(rw_mutex_);

  const auto relative_path = storage::common::ArtifactRelativePath(geometry, source_id, encoder_version_);

  std::vector<db::model::ArtifactRecord> stale;
  std::vector<db::model::ArtifactRecord> evicted;
  db::model::ArtifactRecord              record;
  {
    auto tx = repository_->Begin();
    if (!repository_->GetSource(*tx, source_id)) {
      throw util::NotFound("source " + source_id);
    }

    auto existing = repository_->GetArtifact(*tx, source_id, geometry, encoder_version_);
    if (existing && store_->Exists(existing->path)) {
      return *existing;
    }

    CapacityUsage                          usage;
    std::vector<db::model::ArtifactRecord> candidates;
    for (auto& artifact : repository_->ListArtifacts(*tx)) {
      if (artifact.source_id == source_id && artifact.encoder_version != encoder_version_) {
        stale.push_back(std::move(artifact));
        continue;
      }
      if (artifact.source_id == source_id && artifact.geometry == geometry) {
        // same key, bytes missing; replaced below
        continue;
      }
      usage.artifacts++;
      usage.bytes += artifact.byte_size;
      candidates.push_back(std::move(artifact));
    }
    evicted = policy_.ChooseEvictions(std::move(candidates), usage, size);

    store_->Write(relative_path, arrow::Buffer::FromVector(std::move(bytes)), options_.fsync);

    try {
      for (const auto* group : {&stale, &evicted}) {
        for (const auto& victim : *group) {
          ThrowIfDbError(repository_->DeleteArtifact(*tx, victim.source_id, victim.geometry, victim.encoder_version), "delete artifact");
        }
      }

      record.source_id       = source_id;
      record.geometry        = geometry;
      record.encoder_version = encoder_version_;
      record.path            = relative_path;
      record.frame_count     = static_cast<uint32_t>(frames.FrameCount());
      record.byte_size       = size;
      record.loop            = frames.loop;
      record.created_at_ms   = util::NowMs();
      ThrowIfDbError(repository_->UpsertArtifact(*tx, record), "upsert artifact");
      tx->Commit();
    } catch (...) {
      UnlinkQuietly(relative_path);
      throw;
    }
  }

  for (const auto* group : {&stale, &evicted}) {
    for (const auto& victim : *group) {
      UnlinkQuietly(victim.path);
    }
  }

  for (const auto& victim : evicted) {
    LEDCAST_LOG_INFO("artifact evicted", {StringField("source", victim.source_id), StringField("geometry", victim.geometry),
                                          IntField("bytes", static_cast<int64_t>(victim.byte_size)),
                                          IntField("served_count", static_cast<int64_t>(victim.served_count))});
  }
  if (!evicted.empty()) {
    evictions_ += evicted.size();
    observability::Metrics::Instance().RecordEvictions(evicted.size());
  }

  LEDCAST_LOG_INFO("artifact stored", {StringField("source", source_id), StringField("geometry", geometry),
                                       IntField("frames", record.frame_count), IntField("bytes", static_cast<int64_t>(size)),
                                       IntField("replaced_stale", static_cast<int64_t>(stale.size()))});
  PublishUsage();
  return record;
}

std::optional<CachedArtifact> CacheStore::Get(const std::string& source_id, const std::string& geometry) {
  std::optional<db::model::ArtifactRecord> record;
  std::shared_ptr<arrow::Buffer>           buffer;
  std::string                              failure;
  {
    std::shared_lock lock(rw_mutex_);
    {
      auto tx = repository_->Begin();
      record  = repository_->GetArtifact(*tx, source_id, geometry, encoder_version_);
    }
    if (!record) return std::nullopt;

    try {
      buffer = store_->Read(record->path);
    } catch (const std::exception& e) {
      failure = e.what();
    }
  }

  model::FrameSequence frames;
  if (buffer) {
    try {
      frames = codec::DeserializeArtifact(buffer->data(), static_cast<std::size_t>(buffer->size()));
      if (frames.geometry.Tag() != geometry) {
        throw util::DecodeError("artifact holds " + frames.geometry.Tag() + " frames");
      }
    } catch (const util::DecodeError& e) {
      failure = e.what();
    }
  }

  std::unique_lock lock(rw_mutex_);

  if (!failure.empty()) {
    LEDCAST_LOG_WARN("dropping unreadable artifact",
                     {StringField("source", source_id), StringField("geometry", geometry), StringField("path", record->path), StringField("reason", failure)});
    {
      auto       tx      = repository_->Begin();
      const auto deleted = repository_->DeleteArtifact(*tx, source_id, geometry, encoder_version_);
      if (!deleted && deleted.code != db::ErrorCode::NotFound) ThrowIfDbError(deleted, "delete unreadable artifact");
      tx->Commit();
    }
    UnlinkQuietly(record->path);
    return std::nullopt;
  }

  const auto now = util::NowMs();
  {
    auto       tx      = repository_->Begin();
    const auto touched = repository_->TouchArtifact(*tx, source_id, geometry, encoder_version_, now);
    if (!touched && touched.code == db::ErrorCode::NotFound) {
      // evicted between read and touch
      return std::nullopt;
    }
    ThrowIfDbError(touched, "touch artifact");
    tx->Commit();
  }

  record->served_count++;
  record->last_served_ms = now;
  return CachedArtifact{std::move(*record), std::move(frames)};
}

bool CacheStore::Contains(const std::string& source_id, const std::string& geometry) {
  std::shared_lock lock(rw_mutex_);
  auto             tx = repository_->Begin();
  return repository_->GetArtifact(*tx, source_id, geometry, encoder_version_).has_value();
}

std::vector<SourceListing> CacheStore::List() {
  std::shared_lock lock(rw_mutex_);
  auto             tx = repository_->Begin();

  std::vector<SourceListing>                   listings;
  std::unordered_map<std::string, std::size_t> index;
  for (auto& source : repository_->ListSources(*tx)) {
    index.emplace(source.id, listings.size());
    listings.push_back(SourceListing{std::move(source), {}});
  }
  for (auto& artifact : repository_->ListArtifacts(*tx)) {
    if (artifact.encoder_version != encoder_version_) continue;
    auto it = index.find(artifact.source_id);
    if (it == index.end()) continue;
    listings[it->second].artifacts.push_back(std::move(artifact));
  }
  return listings;
}

std::vector<db::model::ArtifactRecord> CacheStore::ListArtifacts(const std::string& geometry) {
  std::shared_lock lock(rw_mutex_);
  auto             tx = repository_->Begin();

  std::vector<db::model::ArtifactRecord> out;
  for (auto& artifact : repository_->ListArtifacts(*tx)) {
    if (artifact.geometry == geometry && artifact.encoder_version == encoder_version_) {
      out.push_back(std::move(artifact));
    }
  }
  return out;
}

CacheStats CacheStore::Stats() {
  std::shared_lock lock(rw_mutex_);
  auto             tx = repository_->Begin();

  CacheStats stats;
  stats.limits       = policy_.Limits();
  stats.evictions    = evictions_.load();
  stats.source_count = repository_->ListSources(*tx).size();
  for (const auto& artifact : repository_->ListArtifacts(*tx)) {
    stats.artifact_count++;
    stats.total_bytes += artifact.byte_size;
  }
  return stats;
}

std::size_t CacheStore::ReclaimOrphans() {
  std::unique_lock lock(rw_mutex_);

  std::unordered_set<std::string>        referenced;
  std::vector<db::model::ArtifactRecord> missing;
  {
    auto tx = repository_->Begin();
    for (auto& artifact : repository_->ListArtifacts(*tx)) {
      if (store_->Exists(artifact.path)) {
        referenced.insert(artifact.path);
      } else {
        missing.push_back(std::move(artifact));
      }
    }
    for (const auto& artifact : missing) {
      ThrowIfDbError(repository_->DeleteArtifact(*tx, artifact.source_id, artifact.geometry, artifact.encoder_version), "delete orphan row");
    }
    tx->Commit();
  }

  std::size_t orphan_files = 0;
  for (const auto& file : store_->ListFiles()) {
    if (referenced.contains(file)) continue;
    UnlinkQuietly(file);
    ++orphan_files;
  }

  const auto reclaimed = missing.size() + orphan_files;
  if (reclaimed > 0) {
    LEDCAST_LOG_INFO("reclaimed cache orphans",
                     {IntField("rows_without_file", static_cast<int64_t>(missing.size())), IntField("files_without_row", static_cast<int64_t>(orphan_files))});
    PublishUsage();
  }
  return reclaimed;
}

// ------------------------------------------------------------------
// Internals
// ------------------------------------------------------------------

void CacheStore::UnlinkQuietly(const std::string& relative_path) {
  try {
    store_->Remove(relative_path);
  } catch (const std::exception& e) {
    // left for ReclaimOrphans
    LEDCAST_LOG_WARN("artifact unlink failed", {StringField("path", relative_path), StringField("error", e.what())});
  }
}

void CacheStore::PublishUsage() {
  auto     tx    = repository_->Begin();
  uint64_t bytes = 0;
  for (const auto& artifact : repository_->ListArtifacts(*tx)) {
    bytes += artifact.byte_size;
  }
  observability::Metrics::Instance().SetCacheBytes(bytes);
}

} // namespace ledcast::cache
