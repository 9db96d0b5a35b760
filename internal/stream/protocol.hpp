#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/geometry.hpp"
#include "ledcast/v1.hpp"

namespace ledcast::stream {

/*
  Display client wire protocol.

  Client -> server, one ASCII line:
    STREAM:<geometry>[:<selector>[:<pixel-format>]]\n

  Server -> client messages: u8 type, u32 BE payload length, payload.
    'I' INFO       "<W>:<H>:<name>:<frames>:<loop 0|1>:<source-id>"
    'F' FRAME      u32 BE index, u32 BE duration ms, pixels
    'N' NOT_READY  selector or geometry
    'E' ERROR      reason; the server closes afterwards
*/

enum class MessageType : uint8_t {
  kInfo     = 'I',
  kFrame    = 'F',
  kNotReady = 'N',
  kError    = 'E',
};

inline constexpr std::size_t kMaxHandshakeBytes = 256;
inline constexpr std::size_t kMessageHeaderBytes = 5;
inline constexpr std::string_view kHandshakePrefix = "STREAM:";

struct Handshake {
  model::TargetGeometry   geometry;
  // Empty = server rotation.
  std::string             selector;
  ledcast::v1::PixelFormat pixel_format = ledcast::v1::PIXEL_FORMAT_RGB888;
};

// Throws util::InvalidState with a client-facing reason.
Handshake ParseHandshake(std::string_view line);

struct StreamInfo {
  model::TargetGeometry geometry;
  std::string           source_name;
  uint32_t              frame_count = 0;
  bool                  loop        = true;
  std::string           source_id;
};

std::vector<uint8_t> EncodeMessage(MessageType type, const uint8_t* payload, std::size_t size);
std::vector<uint8_t> EncodeInfo(const StreamInfo& info);
std::vector<uint8_t> EncodeFrame(uint32_t index, uint32_t duration_ms, const std::vector<uint8_t>& pixels);
std::vector<uint8_t> EncodeNotReady(std::string_view what);
std::vector<uint8_t> EncodeError(std::string_view reason);

struct Message {
  MessageType          type = MessageType::kError;
  std::vector<uint8_t> payload;
};

// Decodes one message from the front of data. Returns nullopt when more
// bytes are needed; consumed is set on success. Throws util::InvalidState
// for an unknown type byte.
std::optional<Message> DecodeMessage(const uint8_t* data, std::size_t size, std::size_t& consumed);

struct FramePayload {
  uint32_t             index       = 0;
  uint32_t             duration_ms = 0;
  std::vector<uint8_t> pixels;
};

FramePayload DecodeFramePayload(const std::vector<uint8_t>& payload);

} // namespace ledcast::stream
