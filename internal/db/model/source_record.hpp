#pragma once

#include <cstdint>
#include <string>

#include "ledcast/v1.hpp"

namespace ledcast::db::model {

/*
  One ingested media file.

  id is the hex SHA-256 of the file bytes, so renaming a file keeps its
  identity and its artifacts.
*/
struct SourceRecord {
  std::string id;
  std::string filename;
  std::string display_name;

  ledcast::v1::MediaKind kind = ledcast::v1::MEDIA_KIND_UNSPECIFIED;

  uint64_t byte_size      = 0;
  uint64_t ingested_at_ms = 0;
};

} // namespace ledcast::db::model
