#pragma once

#include <cstdint>
#include <vector>

#include "ledcast/v1.hpp"

namespace ledcast::codec {

/*
  Source media decoded at (bounded) native resolution.

  frames hold RGB24 pixels, width * height * 3 bytes each. durations_ms is
  either empty (timing unknown) or parallel to frames.
*/
struct DecodedMedia {
  ledcast::v1::MediaKind            kind   = ledcast::v1::MEDIA_KIND_UNSPECIFIED;
  uint32_t                          width  = 0;
  uint32_t                          height = 0;
  std::vector<std::vector<uint8_t>> frames;
  std::vector<uint32_t>             durations_ms;
  bool                              loop = true;
};

} // namespace ledcast::codec
