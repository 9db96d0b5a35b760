#pragma once

#include <cstdint>
#include <string>

namespace ledcast::db::model {

/*
  Metadata row of one cached artifact.

  Keyed by (source_id, geometry, encoder_version). path is relative to the
  cache root. last_served_ms == 0 means never served.
*/
struct ArtifactRecord {
  std::string source_id;
  std::string geometry;
  std::string encoder_version;
  std::string path;

  uint32_t frame_count = 0;
  uint64_t byte_size   = 0;
  bool     loop        = true;

  uint64_t created_at_ms  = 0;
  uint64_t last_served_ms = 0;
  uint64_t served_count   = 0;
};

} // namespace ledcast::db::model
