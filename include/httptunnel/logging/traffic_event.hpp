#pragma once

#include <algorithm>
#include <boost/lockfree/spsc_queue.hpp>
#include <cstdint>
#include <string_view>

namespace httptunnel::logging {

enum class Direction : std::uint8_t { sent, received };

// One byte-count observation. Fixed size so it fits the lock-free ring;
// longer destination addresses are truncated.
struct TrafficEvent {
  std::int64_t ts_ms = 0;
  std::int64_t bytes = 0;
  Direction direction = Direction::sent;
  char dest[64] = {};

  void SetDest(std::string_view d) {
    const std::size_t n = std::min(d.size(), sizeof(dest) - 1);
    std::copy_n(d.data(), n, dest);
    dest[n] = '\0';
  }
};

inline constexpr std::size_t kTrafficRingCapacity = 1u << 14;

using TrafficQueue = boost::lockfree::spsc_queue<
    TrafficEvent, boost::lockfree::capacity<kTrafficRingCapacity>>;

} // namespace httptunnel::logging
