#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/util/content_hash.hpp"

namespace ledcast::storage::common {

inline constexpr const char* kArtifactExtension = ".lcf";
inline constexpr const char* kTempSuffix        = ".tmp";

inline void ValidatePathComponent(const std::string& component) {
  if (component.empty()) {
    throw std::invalid_argument("path component must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("path component contains invalid character");
    }
  }
  if (component == "." || component == "..") {
    throw std::invalid_argument("path component must not be a relative path component");
  }
}

/*
  "<geometry>/<source>-<version-hash>.lcf"

  The encoder version is hashed so a new version lands in a new file and
  never overwrites bytes a committed row still points at.
*/
inline std::string ArtifactRelativePath(const std::string& geometry, const std::string& source_id, const std::string& encoder_version) {
  ValidatePathComponent(geometry);
  ValidatePathComponent(source_id);
  const auto version_hash = util::Sha256Hex(encoder_version).substr(0, 12);
  return geometry + "/" + source_id + "-" + version_hash + kArtifactExtension;
}

// Accepts only "<component>/<component>" below the root.
inline std::filesystem::path ResolveArtifactPath(const std::filesystem::path& root, const std::string& relative_path) {
  const auto slash = relative_path.find('/');
  if (slash == std::string::npos) {
    throw std::invalid_argument("artifact path must be <geometry>/<file>: " + relative_path);
  }
  const auto dir  = relative_path.substr(0, slash);
  const auto file = relative_path.substr(slash + 1);
  ValidatePathComponent(dir);
  ValidatePathComponent(file);
  return root / dir / file;
}

} // namespace ledcast::storage::common
