#pragma once

#include <filesystem>

#include "internal/codec/decoded_media.hpp"

namespace ledcast::codec {

/*
  Decoder seam used by the conversion pipeline.

  Implementations throw util::DecodeError for unreadable, unsupported or
  corrupt input. Decode must be safe to call from several threads.
*/
class MediaDecoder {
 public:
  virtual ~MediaDecoder() = default;

  virtual DecodedMedia Decode(const std::filesystem::path& path) = 0;
};

} // namespace ledcast::codec
