#pragma once

#include <boost/system/error_code.hpp>
#include <expected>
#include <string>
#include <type_traits>

// namespace httptunnel::error — tunnel-specific error codes in their own
// boost::system category, so they travel alongside Asio/Beast codes through
// the same std::expected results.
namespace httptunnel::error {

enum class Code {
  // The session no longer accepts writes (closed locally or idle-expired).
  closed = 1,
  // A session worker stopped on a fault or on an earlier transport failure.
  abnormal_termination,
  // The relay has no live session for the presented token.
  session_lost,
  // The relay could not connect to the requested destination.
  destination_unreachable,
  // The relay's connection to the destination failed mid-session.
  destination_failed,
  // The exchange was routed to a relay instance other than the pinned one.
  misdirected,
  // The exchange sequence number is not the next one expected.
  out_of_sequence,
  // The exchange is missing or carries malformed tunnel headers.
  bad_request,
  // The relay answered with something that is not a valid tunnel response.
  bad_relay_response,
  // Dial was called with an unusable configuration.
  invalid_config,
};

class Category : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "httptunnel"; }

  std::string message(int val) const override {
    switch (static_cast<Code>(val)) {
    case Code::closed:
      return "Tunnel session is closed and accepts no more writes.";
    case Code::abnormal_termination:
      return "Tunnel session worker terminated abnormally.";
    case Code::session_lost:
      return "Relay has no live session for this token.";
    case Code::destination_unreachable:
      return "Relay could not connect to the destination.";
    case Code::destination_failed:
      return "Relay connection to the destination failed.";
    case Code::misdirected:
      return "Exchange reached a relay instance other than the pinned one.";
    case Code::out_of_sequence:
      return "Exchange sequence number out of order.";
    case Code::bad_request:
      return "Exchange is missing required tunnel headers.";
    case Code::bad_relay_response:
      return "Relay returned an invalid tunnel response.";
    case Code::invalid_config:
      return "Tunnel configuration is invalid.";
    }
    return "Unknown httptunnel error.";
  }
};

inline const boost::system::error_category &GetCategory() {
  static const Category category;
  return category;
}

inline boost::system::error_code make_error_code(Code code) {
  return {static_cast<int>(code), GetCategory()};
}

} // namespace httptunnel::error

namespace boost::system {
template <>
struct is_error_code_enum<httptunnel::error::Code> : std::true_type {};
} // namespace boost::system

namespace httptunnel {

using ErrorCode = boost::system::error_code;
using Status = std::expected<void, ErrorCode>;
template <typename T> using Result = std::expected<T, ErrorCode>;

inline Status MakeStatus(const ErrorCode &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

} // namespace httptunnel
