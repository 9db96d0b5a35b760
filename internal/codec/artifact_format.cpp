#include "artifact_format.hpp"

#include <cstring>
#include <string>

#include "internal/util/errors.hpp"

namespace ledcast::codec {
namespace {

constexpr char     kMagic[4]  = {'L', 'C', 'F', 'A'};
constexpr uint16_t kFlagLoop  = 0x0001;

void PutU16(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back(static_cast<uint8_t>(value >> 8));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void PutU32(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value >> 24));
  out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

class Reader {
 public:
  Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {
  }

  const uint8_t* Take(std::size_t n) {
    if (size_ - offset_ < n) {
      throw util::DecodeError("artifact truncated at byte " + std::to_string(offset_));
    }
    const uint8_t* at = data_ + offset_;
    offset_ += n;
    return at;
  }

  uint16_t U16() {
    const uint8_t* p = Take(2);
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
  }

  uint32_t U32() {
    const uint8_t* p = Take(4);
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) | (static_cast<uint32_t>(p[2]) << 8) | p[3];
  }

  std::size_t Remaining() const {
    return size_ - offset_;
  }

 private:
  const uint8_t* data_;
  std::size_t    size_;
  std::size_t    offset_ = 0;
};

} // namespace

uint64_t SerializedArtifactSize(const model::TargetGeometry& geometry, std::size_t frame_count) {
  return kArtifactHeaderBytes + frame_count * (4 + geometry.FrameBytes());
}

std::vector<uint8_t> SerializeArtifact(const model::FrameSequence& sequence) {
  const auto& geometry = sequence.geometry;
  if (sequence.durations_ms.size() != sequence.frames.size()) {
    throw util::InvalidState("frame/duration count mismatch for " + geometry.Tag());
  }

  std::vector<uint8_t> out;
  out.reserve(SerializedArtifactSize(geometry, sequence.frames.size()));

  out.insert(out.end(), kMagic, kMagic + sizeof(kMagic));
  PutU16(out, kArtifactFormatVersion);
  PutU16(out, sequence.loop ? kFlagLoop : 0);
  PutU16(out, static_cast<uint16_t>(geometry.width));
  PutU16(out, static_cast<uint16_t>(geometry.height));
  PutU32(out, static_cast<uint32_t>(sequence.frames.size()));

  for (auto duration : sequence.durations_ms) {
    PutU32(out, duration);
  }
  for (const auto& frame : sequence.frames) {
    if (frame.size() != geometry.FrameBytes()) {
      throw util::InvalidState("frame size does not match geometry " + geometry.Tag());
    }
    out.insert(out.end(), frame.begin(), frame.end());
  }
  return out;
}

model::FrameSequence DeserializeArtifact(const uint8_t* data, std::size_t size) {
  Reader reader(data, size);

  if (std::memcmp(reader.Take(sizeof(kMagic)), kMagic, sizeof(kMagic)) != 0) {
    throw util::DecodeError("not an artifact (bad magic)");
  }
  const uint16_t version = reader.U16();
  if (version != kArtifactFormatVersion) {
    throw util::DecodeError("unsupported artifact format version " + std::to_string(version));
  }

  model::FrameSequence sequence;
  sequence.loop            = (reader.U16() & kFlagLoop) != 0;
  sequence.geometry.width  = reader.U16();
  sequence.geometry.height = reader.U16();
  const uint32_t count     = reader.U32();

  const uint64_t frame_bytes = sequence.geometry.FrameBytes();
  if (frame_bytes == 0 || reader.Remaining() != static_cast<uint64_t>(count) * (4 + frame_bytes)) {
    throw util::DecodeError("artifact size does not match its header");
  }

  sequence.durations_ms.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    sequence.durations_ms.push_back(reader.U32());
  }

  sequence.frames.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    const uint8_t* pixels = reader.Take(frame_bytes);
    sequence.frames.emplace_back(pixels, pixels + frame_bytes);
  }
  return sequence;
}

} // namespace ledcast::codec
