#pragma once

#include "httptunnel/client/config.hpp"
#include "httptunnel/core/protocol.hpp"
#include "httptunnel/net/http_ops.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <boost/beast/core.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace httptunnel {

namespace beast = boost::beast;

// RelayLink
// Threading model:
// - Owned by exactly one session worker thread; every method except Cancel()
//   must be called from that thread
// - Holds a private io_context that only runs while an exchange is in flight,
//   so exchanges are blocking calls with Beast's timeout handling
// - Cancel() may be called from any thread and is final: the exchange in
//   flight is aborted and every later dial or exchange fails at once
class RelayLink {
public:
  RelayLink(const Config &cfg, std::string dest_addr)
      : cfg_(cfg), dest_addr_(std::move(dest_addr)) {}

  RelayLink(const RelayLink &) = delete;
  RelayLink &operator=(const RelayLink &) = delete;

  ~RelayLink() { Close(); }

  // Redials the relay unless the current connection can carry another
  // exchange.
  Status EnsureConnected() {
    if (Usable()) {
      return {};
    }
    Close();
    if (cancelled_.load()) {
      return std::unexpected(
          net::error::make_error_code(net::error::operation_aborted));
    }
    auto sock = cfg_.dial_proxy(ioc_, dest_addr_);
    if (!sock) {
      return std::unexpected(sock.error());
    }
    stream_.emplace(std::move(*sock));
    buffer_.clear();
    usable_ = true;
    last_used_ = std::chrono::steady_clock::now();
    ++dials_;
    return {};
  }

  Result<protocol::Response> Exchange(protocol::Request &req) {
    if (!stream_) {
      return std::unexpected(
          net::error::make_error_code(net::error::not_connected));
    }
    auto res = httpops::Exchange(ioc_, *stream_, buffer_, req,
                                 cfg_.exchange_timeout, cancelled_);
    last_used_ = std::chrono::steady_clock::now();
    usable_ = res.has_value() && res->keep_alive();
    return res;
  }

  void Cancel() {
    cancelled_.store(true);
    net::post(ioc_, [this] {
      if (stream_) {
        stream_->cancel();
      }
    });
  }

  void Close() {
    if (!stream_) {
      return;
    }
    beast::error_code ec;
    stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_->close();
    stream_.reset();
    usable_ = false;
  }

  // Number of relay connections opened so far.
  std::size_t dials() const { return dials_; }

private:
  bool Usable() const {
    if (!stream_ || !usable_ || !stream_->socket().is_open()) {
      return false;
    }
    return std::chrono::steady_clock::now() - last_used_ <
           cfg_.relay_conn_idle_timeout;
  }

  const Config &cfg_;
  std::string dest_addr_;
  net::io_context ioc_;
  std::optional<beast::tcp_stream> stream_;
  beast::flat_buffer buffer_;
  bool usable_ = false;
  std::chrono::steady_clock::time_point last_used_;
  std::size_t dials_ = 0;
  std::atomic<bool> cancelled_{false};
};

} // namespace httptunnel
