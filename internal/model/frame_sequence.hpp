#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/geometry.hpp"

namespace ledcast::model {

/*
  Device-ready frames for one geometry.

  Every frame is RGB888, row-major, top-left origin and exactly
  geometry.FrameBytes() long. durations_ms is parallel to frames.
*/
struct FrameSequence {
  TargetGeometry                    geometry;
  std::vector<std::vector<uint8_t>> frames;
  std::vector<uint32_t>             durations_ms;
  bool                              loop = true;

  std::size_t FrameCount() const {
    return frames.size();
  }

  uint64_t TotalDurationMs() const {
    uint64_t total = 0;
    for (auto d : durations_ms) total += d;
    return total;
  }
};

} // namespace ledcast::model
