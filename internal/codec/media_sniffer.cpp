#include "media_sniffer.hpp"

#include <fstream>
#include <string>

#include "internal/util/errors.hpp"

namespace ledcast::codec {
namespace {

constexpr std::size_t kSniffBytes = 64 * 1024;

bool StartsWith(std::string_view bytes, std::string_view prefix) {
  return bytes.size() >= prefix.size() && bytes.substr(0, prefix.size()) == prefix;
}

bool At(std::string_view bytes, std::size_t offset, std::string_view marker) {
  return bytes.size() >= offset + marker.size() && bytes.substr(offset, marker.size()) == marker;
}

} // namespace

bool GifHasLoopExtension(std::string_view bytes) {
  return bytes.find("NETSCAPE2.0") != std::string_view::npos || bytes.find("ANIMEXTS1.0") != std::string_view::npos;
}

SniffResult SniffBytes(std::string_view head) {
  if (head.empty()) {
    throw util::DecodeError("empty file");
  }

  if (StartsWith(head, "GIF87a") || StartsWith(head, "GIF89a")) {
    return {Container::kGif, false, GifHasLoopExtension(head)};
  }
  if (StartsWith(head, "\x89PNG\r\n\x1a\n")) {
    return {Container::kPng, false, true};
  }
  if (StartsWith(head, "\xff\xd8\xff")) {
    return {Container::kJpeg, false, true};
  }
  if (StartsWith(head, "RIFF") && At(head, 8, "WEBP")) {
    return {Container::kWebp, false, true};
  }
  if (StartsWith(head, "RIFF") && At(head, 8, "AVI ")) {
    return {Container::kAvi, true, true};
  }
  if (StartsWith(head, "BM") && head.size() >= 26) {
    return {Container::kBmp, false, true};
  }
  if (At(head, 4, "ftyp")) {
    return {Container::kIsoBmff, true, true};
  }
  if (StartsWith(head, "\x1a\x45\xdf\xa3")) {
    return {Container::kMatroska, true, true};
  }

  throw util::DecodeError("unrecognised media format");
}

SniffResult Sniff(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::DecodeError("cannot open " + path.filename().string());
  }

  std::string head(kSniffBytes, '\0');
  in.read(head.data(), static_cast<std::streamsize>(head.size()));
  head.resize(static_cast<std::size_t>(in.gcount()));

  try {
    return SniffBytes(head);
  } catch (const util::DecodeError& e) {
    throw util::DecodeError(path.filename().string() + ": " + e.what());
  }
}

} // namespace ledcast::codec
