#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ledcast::util {

/*
  Content identity of source media: lowercase hex SHA-256 of the bytes.
*/

std::string Sha256Hex(std::string_view bytes);

// Streams the file; throws std::runtime_error if it cannot be read.
std::string Sha256HexOfFile(const std::filesystem::path& path);

bool IsHexIdentity(std::string_view value);

} // namespace ledcast::util
