#pragma once

#include "httptunnel/core/error.hpp"
#include <boost/beast/http.hpp>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// namespace protocol — the wire contract between the tunnel client and the
// relay. Every exchange is one HTTP/1.1 request/response pair on a keep-alive
// connection; tunnel metadata rides in X-Tunnel-* headers and stream bytes in
// the bodies.
namespace httptunnel::protocol {

namespace beast = boost::beast;
namespace http = beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline constexpr char kHeaderOp[] = "X-Tunnel-Op";
inline constexpr char kHeaderSeq[] = "X-Tunnel-Seq";
inline constexpr char kHeaderSessionId[] = "X-Tunnel-Id";
inline constexpr char kHeaderDestAddr[] = "X-Tunnel-Dest-Addr";
inline constexpr char kHeaderRelayHost[] = "X-Tunnel-Relay-Host";
inline constexpr char kHeaderEof[] = "X-Tunnel-EOF";
inline constexpr char kHeaderError[] = "X-Tunnel-Error";

inline constexpr char kTarget[] = "/";

enum class Op { write, read };

inline const char *ToString(Op op) { return op == Op::write ? "write" : "read"; }

inline std::string_view ToStd(beast::string_view v) {
  return std::string_view(v.data(), v.size());
}

inline std::optional<Op> ParseOp(std::string_view v) {
  if (v == "write") {
    return Op::write;
  }
  if (v == "read") {
    return Op::read;
  }
  return std::nullopt;
}

inline std::optional<std::uint64_t> ParseSeq(std::string_view v) {
  std::uint64_t seq = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), seq);
  if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size()) {
    return std::nullopt;
  }
  return seq;
}

// Wire tokens for the errors a relay reports in X-Tunnel-Error.
inline const char *ErrorToken(error::Code code) {
  switch (code) {
  case error::Code::session_lost:
    return "session-lost";
  case error::Code::destination_unreachable:
    return "destination-unreachable";
  case error::Code::destination_failed:
    return "destination-failed";
  case error::Code::misdirected:
    return "misdirected";
  case error::Code::out_of_sequence:
    return "out-of-sequence";
  case error::Code::bad_request:
    return "bad-request";
  default:
    return "internal";
  }
}

inline std::optional<error::Code> ParseErrorToken(std::string_view v) {
  for (auto code :
       {error::Code::session_lost, error::Code::destination_unreachable,
        error::Code::destination_failed, error::Code::misdirected,
        error::Code::out_of_sequence, error::Code::bad_request}) {
    if (v == ErrorToken(code)) {
      return code;
    }
  }
  return std::nullopt;
}

inline http::status StatusFor(error::Code code) {
  switch (code) {
  case error::Code::session_lost:
    return http::status::gone;
  case error::Code::destination_unreachable:
  case error::Code::destination_failed:
    return http::status::bad_gateway;
  case error::Code::misdirected:
    return http::status::misdirected_request;
  case error::Code::out_of_sequence:
    return http::status::conflict;
  case error::Code::bad_request:
    return http::status::bad_request;
  default:
    return http::status::internal_server_error;
  }
}

// Tunnel metadata of one exchange. Empty strings are not sent.
struct ExchangeHeaders {
  Op op = Op::write;
  std::uint64_t seq = 0;
  std::string session_id;
  std::string dest_addr;
  std::string pin;
};

inline Request MakeRequest(const ExchangeHeaders &h, const std::string &host,
                           const std::string &user_agent, std::string body) {
  Request req{h.op == Op::write ? http::verb::post : http::verb::get, kTarget,
              11};
  req.set(http::field::host, host);
  req.set(http::field::user_agent, user_agent);
  req.set(kHeaderOp, ToString(h.op));
  req.set(kHeaderSeq, std::to_string(h.seq));
  if (!h.session_id.empty()) {
    req.set(kHeaderSessionId, h.session_id);
  }
  if (!h.dest_addr.empty()) {
    req.set(kHeaderDestAddr, h.dest_addr);
  }
  if (!h.pin.empty()) {
    req.set(kHeaderRelayHost, h.pin);
  }
  req.keep_alive(true);
  req.body() = std::move(body);
  req.prepare_payload();
  return req;
}

inline Response MakeResponse(const Request &req, http::status status,
                             std::string body = {}) {
  Response res{status, req.version()};
  res.set(http::field::content_type, "application/octet-stream");
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

inline Response MakeErrorResponse(const Request &req, error::Code code) {
  Response res = MakeResponse(req, StatusFor(code));
  res.set(kHeaderError, ErrorToken(code));
  return res;
}

inline bool IsEof(const Response &res) {
  return ToStd(res[kHeaderEof]) == "true";
}

// Maps a relay response to the error it reports; empty for 200 OK.
inline ErrorCode ErrorFromResponse(const Response &res) {
  if (res.result() == http::status::ok) {
    return {};
  }
  if (auto code = ParseErrorToken(ToStd(res[kHeaderError]))) {
    return error::make_error_code(*code);
  }
  return error::make_error_code(error::Code::bad_relay_response);
}

} // namespace httptunnel::protocol
