#pragma once

#include "httptunnel/logging/traffic_logger.hpp"
#include "httptunnel/relay/relay_config.hpp"
#include "httptunnel/util/time.hpp"

namespace httptunnel::relay {

// Hooks that record every byte count in `logger`. The logger must outlive
// the relay they are installed in.
inline RelayHooks TrafficHooks(logging::TrafficLogger &logger) {
  auto record = [&logger](logging::Direction dir) {
    return [&logger, dir](const std::string &, const std::string &dest_addr,
                          const protocol::Request &, std::int64_t bytes) {
      logging::TrafficEvent ev;
      ev.ts_ms = timeutil::EpochMillisUtc();
      ev.bytes = bytes;
      ev.direction = dir;
      ev.SetDest(dest_addr);
      logger.Push(ev);
    };
  };
  RelayHooks hooks;
  hooks.on_bytes_sent = record(logging::Direction::sent);
  hooks.on_bytes_received = record(logging::Direction::received);
  return hooks;
}

} // namespace httptunnel::relay
