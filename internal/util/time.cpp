#include "time.hpp"

#include <chrono>

namespace ledcast::util {

uint64_t NowMs() {
  using std::chrono::system_clock;
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace ledcast::util
