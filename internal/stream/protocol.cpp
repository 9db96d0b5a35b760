#include "protocol.hpp"

#include <algorithm>

#include "internal/codec/pixel_format.hpp"
#include "internal/util/errors.hpp"

namespace ledcast::stream {

namespace {

void PutU32(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value >> 24));
  out.push_back(static_cast<uint8_t>(value >> 16));
  out.push_back(static_cast<uint8_t>(value >> 8));
  out.push_back(static_cast<uint8_t>(value));
}

uint32_t GetU32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) | (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

std::vector<std::string_view> Split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  for (;;) {
    const auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::vector<uint8_t> TextMessage(MessageType type, std::string_view text) {
  return EncodeMessage(type, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool KnownType(uint8_t type) {
  switch (static_cast<MessageType>(type)) {
    case MessageType::kInfo:
    case MessageType::kFrame:
    case MessageType::kNotReady:
    case MessageType::kError:
      return true;
  }
  return false;
}

} // namespace

Handshake ParseHandshake(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.remove_suffix(1);

  if (line.size() > kMaxHandshakeBytes) {
    throw util::InvalidState("handshake too long");
  }
  if (line.substr(0, kHandshakePrefix.size()) != kHandshakePrefix) {
    throw util::InvalidState("malformed handshake");
  }

  const auto parts = Split(line.substr(kHandshakePrefix.size()), ':');

  Handshake handshake;
  const auto geometry = model::TryParseGeometryTag(parts[0]);
  if (!geometry) {
    throw util::InvalidState("malformed geometry " + std::string(parts[0]));
  }
  handshake.geometry = *geometry;

  if (parts.size() == 1) return handshake;

  // Display names may contain ':'; the pixel format is the last field
  // only when a selector field precedes it.
  std::size_t selector_end = parts.size();
  if (parts.size() >= 3) {
    const auto format = codec::ParsePixelFormat(parts.back());
    if (!format) {
      throw util::InvalidState("unsupported pixel format " + std::string(parts.back()));
    }
    handshake.pixel_format = *format;
    selector_end           = parts.size() - 1;
  }

  for (std::size_t i = 1; i < selector_end; ++i) {
    if (i > 1) handshake.selector.push_back(':');
    handshake.selector.append(parts[i]);
  }
  return handshake;
}

std::vector<uint8_t> EncodeMessage(MessageType type, const uint8_t* payload, std::size_t size) {
  std::vector<uint8_t> out;
  out.reserve(kMessageHeaderBytes + size);
  out.push_back(static_cast<uint8_t>(type));
  PutU32(out, static_cast<uint32_t>(size));
  out.insert(out.end(), payload, payload + size);
  return out;
}

std::vector<uint8_t> EncodeInfo(const StreamInfo& info) {
  // ':' separates fields, so it cannot appear inside the name
  std::string name = info.source_name;
  std::replace(name.begin(), name.end(), ':', '_');

  const auto text = std::to_string(info.geometry.width) + ":" + std::to_string(info.geometry.height) + ":" + name + ":" +
                    std::to_string(info.frame_count) + ":" + (info.loop ? "1" : "0") + ":" + info.source_id;
  return TextMessage(MessageType::kInfo, text);
}

std::vector<uint8_t> EncodeFrame(uint32_t index, uint32_t duration_ms, const std::vector<uint8_t>& pixels) {
  std::vector<uint8_t> out;
  out.reserve(kMessageHeaderBytes + 8 + pixels.size());
  out.push_back(static_cast<uint8_t>(MessageType::kFrame));
  PutU32(out, static_cast<uint32_t>(8 + pixels.size()));
  PutU32(out, index);
  PutU32(out, duration_ms);
  out.insert(out.end(), pixels.begin(), pixels.end());
  return out;
}

std::vector<uint8_t> EncodeNotReady(std::string_view what) {
  return TextMessage(MessageType::kNotReady, what);
}

std::vector<uint8_t> EncodeError(std::string_view reason) {
  return TextMessage(MessageType::kError, reason);
}

std::optional<Message> DecodeMessage(const uint8_t* data, std::size_t size, std::size_t& consumed) {
  if (size < kMessageHeaderBytes) return std::nullopt;
  if (!KnownType(data[0])) {
    throw util::InvalidState("unknown message type " + std::to_string(data[0]));
  }
  const auto length = GetU32(data + 1);
  if (size - kMessageHeaderBytes < length) return std::nullopt;

  Message message;
  message.type = static_cast<MessageType>(data[0]);
  message.payload.assign(data + kMessageHeaderBytes, data + kMessageHeaderBytes + length);
  consumed = kMessageHeaderBytes + length;
  return message;
}

FramePayload DecodeFramePayload(const std::vector<uint8_t>& payload) {
  if (payload.size() < 8) {
    throw util::InvalidState("frame payload too short");
  }
  FramePayload frame;
  frame.index       = GetU32(payload.data());
  frame.duration_ms = GetU32(payload.data() + 4);
  frame.pixels.assign(payload.begin() + 8, payload.end());
  return frame;
}

} // namespace ledcast::stream
