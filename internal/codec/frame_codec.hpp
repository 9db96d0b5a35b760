#pragma once

#include <cstdint>
#include <string>

#include "internal/codec/decoded_media.hpp"
#include "internal/model/frame_sequence.hpp"
#include "internal/model/geometry.hpp"

namespace ledcast::codec {

// Bumped whenever resampling or layout changes output bytes.
inline constexpr int kCodecRevision = 1;

struct CodecOptions {
  uint32_t default_frame_ms     = 66;
  uint32_t min_frame_ms         = 20;
  uint32_t video_fps            = 15;
  uint32_t max_frames           = 900;
  uint32_t max_decode_dimension = 256;
};

/*
  Placement of the scaled source inside the target frame.

  Uniform scale, never cropped, centred; the remainder is black.
*/
struct Layout {
  uint32_t scaled_width  = 0;
  uint32_t scaled_height = 0;
  uint32_t offset_x      = 0;
  uint32_t offset_y      = 0;
};

// Throws util::DecodeError when the content collapses to zero rows or columns.
Layout ComputeLayout(uint32_t source_width, uint32_t source_height, const model::TargetGeometry& geometry);

/*
  Converts decoded media into device frames for one geometry.

  Pure and thread-safe. Still images produce one looping frame.
  Durations come from the source when known; values below min_frame_ms
  (and unknown timing) use default_frame_ms.

  Throws util::DecodeError for inconsistent decoded data and
  util::ConfigurationError for an empty geometry.
*/
model::FrameSequence EncodeFrames(const DecodedMedia& media, const model::TargetGeometry& geometry, const CodecOptions& options);

// Codec revision plus every option that changes output; keys cached artifacts.
std::string EncoderVersion(const CodecOptions& options);

} // namespace ledcast::codec
