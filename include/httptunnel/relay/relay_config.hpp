#pragma once

#include "httptunnel/core/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace httptunnel::relay {

// Observational byte-count hooks, invoked on the relay's io thread.
// bytes_received: read from the destination and returned to the client.
// bytes_sent: taken from the client and written to the destination.
using BytesHook = std::function<void(
    const std::string &client_addr, const std::string &dest_addr,
    const protocol::Request &req, std::int64_t bytes)>;

struct RelayHooks {
  BytesHook on_bytes_received;
  BytesHook on_bytes_sent;
};

struct RelayConfig {
  std::string listen_host = "127.0.0.1";
  std::string listen_port = "0";
  // Pin handed to clients; random when empty.
  std::string instance_id;
  // Long-poll deadline of a read exchange with no destination data.
  std::chrono::milliseconds poll_timeout{5000};
  // Sessions without exchanges for this long are closed by the sweep.
  std::chrono::milliseconds session_idle_timeout{70000};
  std::chrono::milliseconds sweep_interval{1000};
  // Idle client keep-alive connections are closed after this.
  std::chrono::milliseconds keepalive_timeout{35000};
  std::chrono::milliseconds dial_timeout{10000};
  std::size_t max_body_bytes = 8 * 1024 * 1024;
  // Destination bytes held per session before the read pump pauses.
  std::size_t max_buffered_bytes = 1024 * 1024;
  std::size_t max_poll_bytes = 64 * 1024;
  RelayHooks hooks;
};

} // namespace httptunnel::relay
