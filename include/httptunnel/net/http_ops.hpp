#pragma once

#include "httptunnel/core/error.hpp"
#include "httptunnel/core/protocol.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <chrono>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <string>

// namespace httpops — thin std::expected wrappers over the Asio/Beast calls the
// tunnel makes, in blocking and coroutine (yield) flavours.
namespace httptunnel::httpops {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

inline Result<tcp::resolver::results_type>
AsyncResolve(tcp::resolver &resolver, const std::string &host,
             const std::string &port, net::yield_context yield) {
  beast::error_code ec;
  auto r = resolver.async_resolve(host, port, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return r;
}

// Connects with a deadline; the returned socket belongs to the stream's
// executor.
inline Result<tcp::socket>
AsyncConnect(net::io_context &ioc, const tcp::resolver::results_type &endpoints,
             std::chrono::steady_clock::duration timeout,
             net::yield_context yield) {
  beast::error_code ec;
  beast::tcp_stream stream(ioc);
  stream.expires_after(timeout);
  stream.async_connect(endpoints, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  stream.expires_never();
  return stream.release_socket();
}

// Sync variants
inline Result<tcp::resolver::results_type>
Resolve(tcp::resolver &resolver, const std::string &host,
        const std::string &port) {
  beast::error_code ec;
  auto r = resolver.resolve(host, port, ec);
  if (ec)
    return std::unexpected(ec);
  return r;
}

// Connects on `ioc`, which must not be running elsewhere, giving up after
// `timeout`.
inline Result<tcp::socket>
Connect(net::io_context &ioc, const tcp::resolver::results_type &endpoints,
        std::chrono::steady_clock::duration timeout) {
  beast::error_code result = net::error::would_block;
  beast::tcp_stream stream(ioc);
  stream.expires_after(timeout);
  stream.async_connect(endpoints,
                       [&](beast::error_code ec, const tcp::endpoint &) {
                         result = ec;
                       });
  ioc.restart();
  ioc.run();
  if (result) {
    return std::unexpected(result);
  }
  stream.expires_never();
  return stream.release_socket();
}

inline void SetTcpNoDelay(tcp::socket &sock) {
  beast::error_code ec;
  sock.set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

// Runs one request/response pair to completion on `ioc`, which must not be
// running elsewhere. The deadline covers the write and the read together.
// Once `cancelled` is set no new operation is started: the exchange fails
// with operation_aborted before the write or between the write and the read.
inline Result<protocol::Response>
Exchange(net::io_context &ioc, beast::tcp_stream &stream,
         beast::flat_buffer &buffer, protocol::Request &req,
         std::chrono::steady_clock::duration timeout,
         const std::atomic<bool> &cancelled) {
  if (cancelled.load()) {
    return std::unexpected(
        net::error::make_error_code(net::error::operation_aborted));
  }
  beast::error_code result;
  protocol::Response res;
  stream.expires_after(timeout);
  http::async_write(
      stream, req, [&](beast::error_code ec, std::size_t) {
        if (ec) {
          result = ec;
          return;
        }
        if (cancelled.load()) {
          result = net::error::operation_aborted;
          return;
        }
        http::async_read(stream, buffer, res,
                         [&](beast::error_code ec2, std::size_t) {
                           result = ec2;
                         });
      });
  ioc.restart();
  ioc.run();
  if (result) {
    return std::unexpected(result);
  }
  stream.expires_never();
  return res;
}

template <typename SslLayer>
inline Status SetSni(SslLayer &ssl, const std::string &host) {
  if (!SSL_set_tlsext_host_name(ssl.native_handle(), host.c_str())) {
    beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category());
    return std::unexpected(ssl_ec);
  }
  return {};
}

template <typename SslLayer> inline Status TlsClientHandshake(SslLayer &ssl) {
  beast::error_code ec;
  ssl.handshake(net::ssl::stream_base::client, ec);
  return MakeStatus(ec);
}

} // namespace httptunnel::httpops
