#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/model/artifact_record.hpp"

namespace ledcast::cache {

/*
  Capacity bounds of the cache. Zero means unbounded.
*/
struct CapacityLimits {
  uint64_t max_artifacts = 0;
  uint64_t max_bytes     = 0;

  bool FitsAlone(uint64_t incoming_bytes) const {
    return max_bytes == 0 || incoming_bytes <= max_bytes;
  }
};

/*
  Live usage the policy decides against.
*/
struct CapacityUsage {
  uint64_t artifacts = 0;
  uint64_t bytes     = 0;
};

/*
  Least-recently-served eviction.

  Never-served artifacts (last_served_ms == 0) go first, then the oldest
  last-served; ties fall back to the oldest creation time.
*/
class EvictionPolicy {
public:
  explicit EvictionPolicy(CapacityLimits limits);

  const CapacityLimits& Limits() const { return limits_; }

  // Victims, in eviction order, that make room for one more artifact of
  // incoming_bytes. Returns as many as needed; callers check FitsAlone()
  // first.
  std::vector<db::model::ArtifactRecord>
  ChooseEvictions(std::vector<db::model::ArtifactRecord> candidates,
                  CapacityUsage usage,
                  uint64_t incoming_bytes) const;

  bool OverCapacity(const CapacityUsage& usage, uint64_t incoming_bytes) const;

private:
  CapacityLimits limits_;
};

} // namespace ledcast::cache
