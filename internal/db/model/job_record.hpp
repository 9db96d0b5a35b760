#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ledcast/v1.hpp"

namespace ledcast::db::model {

struct GeometryOutcomeRecord {
  std::string            geometry;
  bool                   ok         = false;
  ledcast::v1::ErrorKind error_kind = ledcast::v1::ERROR_KIND_UNSPECIFIED;
  std::string            reason;
};

/*
  Conversion job of one source across all geometries.

  At most one row per source. Outcomes are replaced as a whole on every
  upsert.
*/
struct JobRecord {
  std::string source_id;

  ledcast::v1::JobState state = ledcast::v1::JOB_STATE_QUEUED;

  uint32_t    attempts = 0;
  std::string last_error;
  std::string encoder_version;

  uint64_t updated_at_ms = 0;
  // Earliest time a retry may run (0 = now).
  uint64_t not_before_ms = 0;

  std::vector<GeometryOutcomeRecord> outcomes;
};

} // namespace ledcast::db::model
