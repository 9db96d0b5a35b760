#include "geometry.hpp"

#include <charconv>

#include "internal/util/errors.hpp"

namespace ledcast::model {
namespace {

std::optional<uint32_t> ParseSide(std::string_view text) {
  if (text.empty() || text.size() > 4) {
    return std::nullopt;
  }
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string TargetGeometry::Tag() const {
  return std::to_string(width) + "x" + std::to_string(height);
}

std::optional<TargetGeometry> TryParseGeometryTag(std::string_view tag) {
  const auto sep = tag.find('x');
  if (sep == std::string_view::npos) {
    return std::nullopt;
  }

  auto width  = ParseSide(tag.substr(0, sep));
  auto height = ParseSide(tag.substr(sep + 1));
  if (!width || !height) {
    return std::nullopt;
  }
  if (*width == 0 || *height == 0 || *width > kMaxGeometrySide || *height > kMaxGeometrySide) {
    return std::nullopt;
  }
  return TargetGeometry{*width, *height};
}

TargetGeometry ParseGeometryTag(std::string_view tag) {
  auto geometry = TryParseGeometryTag(tag);
  if (!geometry) {
    throw util::ConfigurationError("invalid geometry '" + std::string(tag) + "': expected <W>x<H> with sides in 1..1024");
  }
  return *geometry;
}

std::vector<TargetGeometry> ParseGeometryTags(const std::vector<std::string>& tags) {
  std::vector<TargetGeometry> out;
  out.reserve(tags.size());
  for (const auto& tag : tags) {
    auto geometry = ParseGeometryTag(tag);
    bool seen     = false;
    for (const auto& existing : out) {
      seen = seen || existing == geometry;
    }
    if (!seen) {
      out.push_back(geometry);
    }
  }
  return out;
}

} // namespace ledcast::model
