#include "eviction_policy.hpp"

#include <algorithm>
#include <tuple>

namespace ledcast::cache {

EvictionPolicy::EvictionPolicy(CapacityLimits limits) : limits_(limits) {}

bool EvictionPolicy::OverCapacity(const CapacityUsage& usage, uint64_t incoming_bytes) const {
  if (limits_.max_artifacts != 0 && usage.artifacts + 1 > limits_.max_artifacts) return true;
  if (limits_.max_bytes != 0 && usage.bytes + incoming_bytes > limits_.max_bytes) return true;
  return false;
}

std::vector<db::model::ArtifactRecord>
EvictionPolicy::ChooseEvictions(std::vector<db::model::ArtifactRecord> candidates,
                                CapacityUsage usage,
                                uint64_t incoming_bytes) const {

  std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
    return std::tie(a.last_served_ms, a.created_at_ms, a.source_id, a.geometry) <
           std::tie(b.last_served_ms, b.created_at_ms, b.source_id, b.geometry);
  });

  std::vector<db::model::ArtifactRecord> victims;
  for (auto& candidate : candidates) {
    if (!OverCapacity(usage, incoming_bytes)) break;
    usage.artifacts -= std::min<uint64_t>(usage.artifacts, 1);
    usage.bytes -= std::min(usage.bytes, candidate.byte_size);
    victims.push_back(std::move(candidate));
  }
  return victims;
}

} // namespace ledcast::cache
