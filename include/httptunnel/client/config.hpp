#pragma once

#include "httptunnel/core/error.hpp"
#include "httptunnel/net/address.hpp"
#include "httptunnel/net/http_ops.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace httptunnel {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Opens a connection to the relay on `ioc`. `addr` is the original destination
// address, for dialers that pick a relay per destination.
using DialProxyFn =
    std::function<Result<tcp::socket>(net::io_context &ioc,
                                      const std::string &addr)>;

inline constexpr std::chrono::milliseconds kDefaultIdleTimeout{70000};
inline constexpr std::chrono::milliseconds kDefaultFlushInterval{15};
inline constexpr std::chrono::milliseconds kDefaultExchangeTimeout{30000};
inline constexpr std::chrono::milliseconds kDefaultRelayConnIdleTimeout{25000};
inline constexpr std::size_t kDefaultMaxRequestBytes = 64 * 1024;
inline constexpr std::chrono::milliseconds kDefaultDialTimeout{10000};

struct Config {
  DialProxyFn dial_proxy;
  // Session self-terminates after this long without traffic.
  std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout;
  // Coalesce small writes into fewer exchanges.
  bool buffer_requests = false;
  std::chrono::milliseconds flush_interval = kDefaultFlushInterval;
  std::size_t max_request_bytes = kDefaultMaxRequestBytes;
  std::chrono::milliseconds exchange_timeout = kDefaultExchangeTimeout;
  // Must stay below the relay's keep-alive timeout.
  std::chrono::milliseconds relay_conn_idle_timeout =
      kDefaultRelayConnIdleTimeout;
  // Host header of exchanges; the destination address when empty.
  std::string relay_host;
  std::string user_agent = "httptunnel/0.1";
};

// Dialer that always connects to the relay at `relay_addr` ("host:port"),
// giving up after `connect_timeout`.
inline DialProxyFn
DialTcp(std::string relay_addr,
        std::chrono::milliseconds connect_timeout = kDefaultDialTimeout) {
  return [relay_addr = std::move(relay_addr), connect_timeout](
             net::io_context &ioc, const std::string &) -> Result<tcp::socket> {
    auto hp = address::SplitHostPort(relay_addr);
    if (!hp) {
      return std::unexpected(
          error::make_error_code(error::Code::invalid_config));
    }
    tcp::resolver resolver(ioc);
    auto results = httpops::Resolve(resolver, hp->host, hp->port);
    if (!results) {
      return std::unexpected(results.error());
    }
    auto sock = httpops::Connect(ioc, *results, connect_timeout);
    if (!sock) {
      return std::unexpected(sock.error());
    }
    httpops::SetTcpNoDelay(*sock);
    return std::move(*sock);
  };
}

} // namespace httptunnel
