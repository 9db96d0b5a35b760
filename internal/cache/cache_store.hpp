#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/cache/eviction_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/frame_sequence.hpp"
#include "internal/storage/artifact_store.hpp"

namespace ledcast::cache {

struct CacheOptions {
  CapacityLimits limits;
  bool           fsync = true;
};

/*
  Artifact returned by Get(): metadata plus deserialized frames.
*/
struct CachedArtifact {
  db::model::ArtifactRecord record;
  model::FrameSequence      frames;
};

struct SourceListing {
  db::model::SourceRecord                source;
  // Current encoder version only.
  std::vector<db::model::ArtifactRecord> artifacts;
};

struct CacheStats {
  uint64_t artifact_count = 0;
  uint64_t total_bytes    = 0;
  uint64_t source_count   = 0;
  uint64_t evictions      = 0;
  CapacityLimits limits;
};

/*
  Content-addressed artifact cache.

  Sole writer of source and artifact rows and of artifact files.
  Ordering rules that keep a crash from leaving a row without bytes:
    - bytes are written (tmp -> rename) before the row commits
    - rows are deleted and committed before files are unlinked

  Readers share rw_mutex_; put, delete and touch take it exclusively.
*/
class CacheStore {
 public:
  CacheStore(std::shared_ptr<db::Repository> repository,
             storage::ArtifactStorePtr       store,
             std::string                     encoder_version,
             CacheOptions                    options);

  const std::string& EncoderVersion() const {
    return encoder_version_;
  }

  // ---------------------------------------------------------------------
  // Sources
  // ---------------------------------------------------------------------

  void RegisterSource(const db::model::SourceRecord& source);

  // Full identity, unique identity prefix (8+ hex chars), display name,
  // then filename.
  std::optional<db::model::SourceRecord> FindSource(const std::string& selector);

  std::optional<db::model::SourceRecord> GetSource(const std::string& source_id);

  // Removes every artifact of the source and the source row. Returns the
  // number of artifacts removed; throws util::NotFound for an unknown id.
  std::size_t Delete(const std::string& source_id);

  // ---------------------------------------------------------------------
  // Artifacts
  // ---------------------------------------------------------------------

  // Idempotent per (source, geometry, encoder version). Evicts to make
  // room; throws util::CapacityError if the artifact alone exceeds the
  // bound.
  db::model::ArtifactRecord Put(const std::string& source_id, const model::FrameSequence& frames);

  // Current-version artifact with frames; counts as one serve.
  std::optional<CachedArtifact> Get(const std::string& source_id, const std::string& geometry);

  // Metadata only, no serve recorded.
  bool Contains(const std::string& source_id, const std::string& geometry);

  std::vector<SourceListing> List();

  // Ready current-version artifacts for one geometry.
  std::vector<db::model::ArtifactRecord> ListArtifacts(const std::string& geometry);

  CacheStats Stats();

  // Deletes artifact files without a row and rows without a file.
  // Returns the number of files plus rows removed.
  std::size_t ReclaimOrphans();

 private:
  void UnlinkQuietly(const std::string& relative_path);
  void PublishUsage();

  std::shared_ptr<db::Repository> repository_;
  storage::ArtifactStorePtr       store_;
  std::string                     encoder_version_;
  CacheOptions                    options_;
  EvictionPolicy                  policy_;

  std::shared_mutex     rw_mutex_;
  std::atomic<uint64_t> evictions_{0};
};

} // namespace ledcast::cache
