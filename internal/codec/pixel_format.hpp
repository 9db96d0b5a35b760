#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "ledcast/v1.hpp"

namespace ledcast::codec {

std::optional<ledcast::v1::PixelFormat> ParsePixelFormat(std::string_view name);
std::string_view PixelFormatName(ledcast::v1::PixelFormat format);

uint32_t BytesPerPixel(ledcast::v1::PixelFormat format);

// RGB888 → 5-6-5 packed, high byte first (legacy panel wire format).
std::vector<uint8_t> ToRgb565BigEndian(const std::vector<uint8_t>& rgb888);

// Returns the frame in the requested wire format.
std::vector<uint8_t> AdaptFrame(const std::vector<uint8_t>& rgb888, ledcast::v1::PixelFormat format);

} // namespace ledcast::codec
