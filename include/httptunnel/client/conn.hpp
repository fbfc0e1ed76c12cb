#pragma once

#include "httptunnel/client/config.hpp"
#include "httptunnel/client/inbound_worker.hpp"
#include "httptunnel/client/outbound_worker.hpp"
#include "httptunnel/client/session_state.hpp"
#include "httptunnel/core/error.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/system/system_error.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace httptunnel {

// Conn — duplex byte stream tunnelled through a relay as a sequence of HTTP
// exchanges.
// Threading model:
// - Two workers per session (OutboundWorker, InboundWorker), each on its own
//   std::jthread and each with its own relay connection
// - Write/Read never touch a relay connection: they enqueue/dequeue through
//   the session channels, which is what keeps one exchange in flight per
//   direction
// - Write, Read and Close may be called concurrently from different threads
// Also models Asio's SyncReadStream/SyncWriteStream, so beast::http::read/write
// and asio::ssl::stream<Conn &> run directly on top of it.
class Conn {
public:
  using executor_type = net::io_context::executor_type;
  using lowest_layer_type = Conn;

  // Opens a session to `addr` through the relay. Returns the error of the first
  // exchange (relay dial failure, relay unreachable, destination unreachable).
  static Result<std::unique_ptr<Conn>> Dial(const std::string &addr,
                                            Config cfg) {
    if (!cfg.dial_proxy || cfg.max_request_bytes == 0) {
      return std::unexpected(
          error::make_error_code(error::Code::invalid_config));
    }
    auto state = std::make_shared<SessionState>(NextId(), addr, std::move(cfg));
    std::unique_ptr<Conn> conn(new Conn(state));
    OutboundItem open;
    open.kind = OutboundItem::Kind::open;
    if (!state->Submit(std::move(open))) {
      conn->Close();
      return std::unexpected(error::make_error_code(error::Code::closed));
    }
    const auto &initial = state->initial().get();
    if (!initial) {
      const ErrorCode ec = initial.error();
      conn->Close();
      return std::unexpected(ec);
    }
    conn->session_id_ = initial->session_id;
    conn->pin_ = initial->pin;
    return conn;
  }

  Conn(const Conn &) = delete;
  Conn &operator=(const Conn &) = delete;

  ~Conn() { Close(); }

  // Blocks until the bytes are acknowledged: sent to the relay, or accepted
  // into the coalescing buffer when buffer_requests is set. Larger writes are
  // split into max_request_bytes exchanges.
  Result<std::size_t> Write(std::string_view data) {
    const std::size_t chunk = state_->config().max_request_bytes;
    std::size_t written = 0;
    while (written < data.size()) {
      const std::size_t n = std::min(chunk, data.size() - written);
      OutboundItem item;
      item.payload.assign(data.substr(written, n));
      if (auto st = Submit(std::move(item)); !st) {
        return std::unexpected(st.error());
      }
      written += n;
    }
    return written;
  }

  // Forces coalesced bytes out in one exchange. No-op when unbuffered.
  Status Flush() {
    if (!state_->config().buffer_requests) {
      return {};
    }
    OutboundItem item;
    item.kind = OutboundItem::Kind::flush;
    return Submit(std::move(item));
  }

  // Returns at least one byte, or asio::error::eof at end of stream, or the
  // error that ended the session.
  Result<std::size_t> Read(char *data, std::size_t size) {
    if (size == 0) {
      return 0;
    }
    std::lock_guard lock(read_mutex_);
    if (!FillLeftover()) {
      return std::unexpected(read_ec_);
    }
    const std::size_t n = std::min(size, leftover_.size() - leftover_pos_);
    std::copy_n(leftover_.data() + leftover_pos_, n, data);
    leftover_pos_ += n;
    return n;
  }

  // Flushes coalesced bytes, stops both workers and waits for them. Pending
  // and later Write calls fail, Read drains what arrived and then reports
  // end of stream.
  Status Close() {
    if (closed_.exchange(true)) {
      return {};
    }
    Status flushed;
    if (state_->config().buffer_requests && state_->accepting()) {
      flushed = Flush();
    }
    state_->RequestStop();
    if (outbound_.joinable()) {
      outbound_.join();
    }
    if (inbound_.joinable()) {
      inbound_.join();
    }
    if (!flushed &&
        flushed.error() != error::make_error_code(error::Code::closed)) {
      return flushed;
    }
    return {};
  }

  const std::string &RemoteAddr() const { return state_->dest_addr(); }
  const std::string &SessionId() const { return session_id_; }
  const std::string &Pin() const { return pin_; }
  // False once the session stopped: closed, idle-expired or failed.
  bool Active() const { return !state_->stopped(); }

  // Asio stream concepts

  executor_type get_executor() { return ioc_.get_executor(); }
  lowest_layer_type &lowest_layer() { return *this; }
  const lowest_layer_type &lowest_layer() const { return *this; }

  template <typename ConstBufferSequence>
  std::size_t write_some(const ConstBufferSequence &buffers, ErrorCode &ec) {
    const std::string data = boost::beast::buffers_to_string(buffers);
    auto n = Write(data);
    if (!n) {
      ec = n.error();
      return 0;
    }
    ec = {};
    return *n;
  }

  template <typename ConstBufferSequence>
  std::size_t write_some(const ConstBufferSequence &buffers) {
    ErrorCode ec;
    const std::size_t n = write_some(buffers, ec);
    if (ec) {
      throw boost::system::system_error(ec);
    }
    return n;
  }

  template <typename MutableBufferSequence>
  std::size_t read_some(const MutableBufferSequence &buffers, ErrorCode &ec) {
    ec = {};
    if (net::buffer_size(buffers) == 0) {
      return 0;
    }
    std::lock_guard lock(read_mutex_);
    if (!FillLeftover()) {
      ec = read_ec_;
      return 0;
    }
    const std::size_t n = net::buffer_copy(
        buffers, net::buffer(leftover_.data() + leftover_pos_,
                             leftover_.size() - leftover_pos_));
    leftover_pos_ += n;
    return n;
  }

  template <typename MutableBufferSequence>
  std::size_t read_some(const MutableBufferSequence &buffers) {
    ErrorCode ec;
    const std::size_t n = read_some(buffers, ec);
    if (ec) {
      throw boost::system::system_error(ec);
    }
    return n;
  }

private:
  explicit Conn(std::shared_ptr<SessionState> state)
      : state_(std::move(state)) {
    outbound_ = std::jthread([s = state_] { OutboundWorker(s).Run(); });
    inbound_ = std::jthread([s = state_] { InboundWorker(s).Run(); });
  }

  static std::uint64_t NextId() {
    static std::atomic<std::uint64_t> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
  }

  Status Submit(OutboundItem item) {
    auto done = item.done.get_future();
    state_->MarkActive();
    if (!state_->Submit(std::move(item))) {
      return std::unexpected(RejectedError());
    }
    try {
      return done.get();
    } catch (const std::future_error &) {
      // The worker dropped the item while failing.
      return std::unexpected(
          error::make_error_code(error::Code::abnormal_termination));
    }
  }

  ErrorCode RejectedError() const {
    if (auto ec = state_->terminal_error()) {
      return ec;
    }
    return error::make_error_code(error::Code::closed);
  }

  // Makes unread bytes available in leftover_. Caller holds read_mutex_.
  bool FillLeftover() {
    while (leftover_pos_ >= leftover_.size()) {
      if (read_ec_) {
        return false;
      }
      InboundItem item;
      state_->BeginRead();
      const auto status = state_->responses().Receive(item);
      state_->EndRead();
      if (status != util::RecvStatus::item) {
        read_ec_ = net::error::eof;
        return false;
      }
      state_->MarkActive();
      leftover_ = std::move(item.payload);
      leftover_pos_ = 0;
      if (item.ec) {
        read_ec_ = item.ec;
      }
    }
    return true;
  }

  std::shared_ptr<SessionState> state_;
  net::io_context ioc_;
  std::string session_id_;
  std::string pin_;

  std::mutex read_mutex_;
  std::string leftover_;
  std::size_t leftover_pos_ = 0;
  ErrorCode read_ec_;

  std::atomic<bool> closed_{false};
  std::jthread outbound_;
  std::jthread inbound_;
};

// Entry point: opens a tunnelled stream to `addr`.
inline Result<std::unique_ptr<Conn>> Dial(const std::string &addr,
                                          Config cfg) {
  return Conn::Dial(addr, std::move(cfg));
}

} // namespace httptunnel
