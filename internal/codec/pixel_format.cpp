#include "pixel_format.hpp"

namespace ledcast::codec {

using ledcast::v1::PixelFormat;

std::optional<PixelFormat> ParsePixelFormat(std::string_view name) {
  if (name.empty() || name == "rgb888") {
    return ledcast::v1::PIXEL_FORMAT_RGB888;
  }
  if (name == "rgb565") {
    return ledcast::v1::PIXEL_FORMAT_RGB565;
  }
  return std::nullopt;
}

std::string_view PixelFormatName(PixelFormat format) {
  return format == ledcast::v1::PIXEL_FORMAT_RGB565 ? "rgb565" : "rgb888";
}

uint32_t BytesPerPixel(PixelFormat format) {
  return format == ledcast::v1::PIXEL_FORMAT_RGB565 ? 2 : 3;
}

std::vector<uint8_t> ToRgb565BigEndian(const std::vector<uint8_t>& rgb888) {
  const std::size_t    pixels = rgb888.size() / 3;
  std::vector<uint8_t> out(pixels * 2);
  for (std::size_t i = 0; i < pixels; ++i) {
    const uint16_t r     = rgb888[i * 3];
    const uint16_t g     = rgb888[i * 3 + 1];
    const uint16_t b     = rgb888[i * 3 + 2];
    const uint16_t value = static_cast<uint16_t>(((r >> 3) << 11) | ((g >> 2) << 5) | (b >> 3));
    out[i * 2]           = static_cast<uint8_t>(value >> 8);
    out[i * 2 + 1]       = static_cast<uint8_t>(value & 0xFF);
  }
  return out;
}

std::vector<uint8_t> AdaptFrame(const std::vector<uint8_t>& rgb888, PixelFormat format) {
  if (format == ledcast::v1::PIXEL_FORMAT_RGB565) {
    return ToRgb565BigEndian(rgb888);
  }
  return rgb888;
}

} // namespace ledcast::codec
