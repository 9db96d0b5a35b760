#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledcast::model {

inline constexpr uint32_t kMaxGeometrySide = 1024;

/*
  A target display resolution, identified by its "<W>x<H>" tag.
*/
struct TargetGeometry {
  uint32_t width  = 0;
  uint32_t height = 0;

  std::string Tag() const;

  // RGB888 bytes of one frame.
  uint64_t FrameBytes() const {
    return static_cast<uint64_t>(width) * height * 3;
  }

  bool operator==(const TargetGeometry&) const = default;
};

std::optional<TargetGeometry> TryParseGeometryTag(std::string_view tag);

// Throws util::ConfigurationError for malformed tags or sides outside 1..1024.
TargetGeometry ParseGeometryTag(std::string_view tag);

// Parses and de-duplicates, preserving order.
std::vector<TargetGeometry> ParseGeometryTags(const std::vector<std::string>& tags);

} // namespace ledcast::model
