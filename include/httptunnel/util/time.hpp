#pragma once

#include <chrono>
#include <cstdint>

namespace httptunnel::timeutil {

inline std::int64_t EpochMillisUtc() {
  using clock = std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock::now().time_since_epoch())
      .count();
}

// Milliseconds on the monotonic clock; used for activity bookkeeping that
// must survive wall-clock adjustments.
inline std::int64_t SteadyMillis() {
  using clock = std::chrono::steady_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock::now().time_since_epoch())
      .count();
}

} // namespace httptunnel::timeutil
