#pragma once

#include <cstdint>

namespace ledcast::util {

// Wall-clock Unix milliseconds. Every persisted and reported timestamp
// uses it; pacing uses steady_clock directly.
uint64_t NowMs();

} // namespace ledcast::util
