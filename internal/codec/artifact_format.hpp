#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/model/frame_sequence.hpp"

namespace ledcast::codec {

/*
  On-disk artifact bytes (all integers big-endian):

    "LCFA"  u16 version  u16 flags(bit0 = loop)  u16 width  u16 height
    u32 frame_count
    u32 duration_ms[frame_count]
    frame_count * (width * height * 3) RGB888 pixels
*/

inline constexpr uint16_t    kArtifactFormatVersion = 1;
inline constexpr std::size_t kArtifactHeaderBytes   = 4 + 2 + 2 + 2 + 2 + 4;

std::vector<uint8_t> SerializeArtifact(const model::FrameSequence& sequence);

// Throws util::DecodeError for truncated or foreign data.
model::FrameSequence DeserializeArtifact(const uint8_t* data, std::size_t size);

uint64_t SerializedArtifactSize(const model::TargetGeometry& geometry, std::size_t frame_count);

} // namespace ledcast::codec
