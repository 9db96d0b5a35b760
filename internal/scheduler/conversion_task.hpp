#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace ledcast::scheduler {

/*
  A scheduled conversion of one source across all geometries.
*/
struct ConversionTask {
  std::string           source_id;
  std::filesystem::path path;

  // Unix ms before which the task must not run (0 = now).
  uint64_t not_before_ms = 0;
};

} // namespace ledcast::scheduler
