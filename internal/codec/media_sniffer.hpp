#pragma once

#include <filesystem>
#include <string_view>

namespace ledcast::codec {

enum class Container {
  kGif,
  kPng,
  kJpeg,
  kWebp,
  kBmp,
  kIsoBmff,
  kMatroska,
  kAvi,
};

constexpr std::string_view ToString(Container container) {
  switch (container) {
    case Container::kGif:
      return "gif";
    case Container::kPng:
      return "png";
    case Container::kJpeg:
      return "jpeg";
    case Container::kWebp:
      return "webp";
    case Container::kBmp:
      return "bmp";
    case Container::kIsoBmff:
      return "mp4";
    case Container::kMatroska:
      return "matroska";
    case Container::kAvi:
    default:
      return "avi";
  }
}

struct SniffResult {
  Container container = Container::kPng;
  bool      is_video  = false;
  // GIF: NETSCAPE2.0 / ANIMEXTS1.0 application extension present.
  bool loops = true;
};

/*
  Identifies a media container from its leading bytes.

  Throws util::DecodeError for empty, unreadable or unrecognised input,
  so no decoder process is spawned for junk uploads.
*/
SniffResult Sniff(const std::filesystem::path& path);
SniffResult SniffBytes(std::string_view head);

bool GifHasLoopExtension(std::string_view bytes);

} // namespace ledcast::codec
