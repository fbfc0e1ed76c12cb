#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>

namespace httptunnel::address {

struct HostPort {
  std::string host;
  std::string port;
};

// Splits "host:port", "[v6]:port" or "tcp://host:port" into its parts.
// Returns nullopt when the port is missing or empty.
inline std::optional<HostPort> SplitHostPort(const std::string &addr) {
  std::string rest = addr;
  if (boost::algorithm::istarts_with(rest, "tcp://")) {
    rest = rest.substr(6);
  }
  if (!rest.empty() && rest.front() == '[') {
    auto close = rest.find(']');
    if (close == std::string::npos || close + 1 >= rest.size() ||
        rest[close + 1] != ':') {
      return std::nullopt;
    }
    std::string port = rest.substr(close + 2);
    if (port.empty()) {
      return std::nullopt;
    }
    return HostPort{.host = rest.substr(1, close - 1), .port = port};
  }
  auto colon = rest.rfind(':');
  if (colon == std::string::npos || colon + 1 >= rest.size()) {
    return std::nullopt;
  }
  return HostPort{.host = rest.substr(0, colon), .port = rest.substr(colon + 1)};
}

inline std::string JoinHostPort(const std::string &host,
                                const std::string &port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + port;
  }
  return host + ":" + port;
}

} // namespace httptunnel::address
