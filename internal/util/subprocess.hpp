#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ledcast::util {

struct ProcessResult {
  int         exit_code = -1;
  std::string stdout_data;
  // Last few KiB of stderr, for error messages.
  std::string stderr_tail;
};

// Exit status reported when the executable could not be started.
inline constexpr int kExecFailedExitCode = 127;

/*
  Runs argv[0] (PATH lookup) with the remaining arguments, no shell
  involved, and collects its output.

  stdout beyond max_stdout_bytes kills the child and throws
  std::runtime_error. A child killed by a signal reports 128 + signo.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv, std::size_t max_stdout_bytes);

} // namespace ledcast::util
