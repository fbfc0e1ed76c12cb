#pragma once

#include "httptunnel/client/config.hpp"
#include "httptunnel/core/error.hpp"
#include "httptunnel/util/channel.hpp"
#include "httptunnel/util/time.hpp"
#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>

namespace httptunnel {

inline constexpr std::size_t kOutboundQueueCapacity = 16;
inline constexpr std::size_t kInboundQueueCapacity = 16;

// One application write waiting for the outbound worker. `done` is fulfilled
// exactly once: after the exchange, after buffering, or by cleanup.
struct OutboundItem {
  enum class Kind { open, data, flush };
  Kind kind = Kind::data;
  std::string payload;
  std::promise<Status> done;
};

// Result of one polling exchange. A non-empty `ec` marks the terminal item
// (asio::error::eof for a clean end of stream).
struct InboundItem {
  std::string payload;
  ErrorCode ec;
};

// What the first exchange learned, handed from the outbound to the inbound
// worker (and to Dial).
struct InitialResponse {
  std::string session_id;
  std::string pin;
  std::string payload;
  bool eof = false;
};

// SessionState — everything the application and the two workers share.
// - requests/responses channels are the only data path
// - the write gate is a flag under a shared mutex: submitters hold it shared
//   while enqueuing, the outbound worker's cleanup takes it exclusively once
// - a session-wide stop source stands for "closed" (Close or idle expiry)
class SessionState {
public:
  SessionState(std::uint64_t id, std::string dest_addr, Config cfg)
      : id_(id), dest_addr_(std::move(dest_addr)), cfg_(std::move(cfg)),
        requests_(kOutboundQueueCapacity), responses_(kInboundQueueCapacity),
        initial_future_(initial_promise_.get_future().share()) {
    MarkActive();
  }

  std::uint64_t id() const { return id_; }
  const std::string &dest_addr() const { return dest_addr_; }
  const Config &config() const { return cfg_; }

  util::Channel<OutboundItem> &requests() { return requests_; }
  util::Channel<InboundItem> &responses() { return responses_; }

  // Returns false if writes are no longer accepted; the item is dropped.
  bool Submit(OutboundItem item) {
    std::shared_lock lock(gate_);
    if (done_requesting_) {
      return false;
    }
    return requests_.Send(std::move(item));
  }

  void StopAccepting() {
    std::unique_lock lock(gate_);
    done_requesting_ = true;
  }

  bool accepting() const {
    std::shared_lock lock(gate_);
    return !done_requesting_;
  }

  // One-shot handoff. Later deliveries are ignored.
  bool DeliverInitial(Result<InitialResponse> initial) {
    std::lock_guard lock(initial_mutex_);
    if (initial_delivered_) {
      return false;
    }
    initial_delivered_ = true;
    initial_promise_.set_value(std::move(initial));
    return true;
  }

  std::shared_future<Result<InitialResponse>> initial() const {
    return initial_future_;
  }

  void RequestStop() { stop_.request_stop(); }
  std::stop_token stop_token() const { return stop_.get_token(); }
  bool stopped() const { return stop_.stop_requested(); }

  // First recorded failure wins.
  void SetTerminalError(const ErrorCode &ec) {
    std::lock_guard lock(terminal_mutex_);
    if (!terminal_) {
      terminal_ = ec;
    }
  }

  ErrorCode terminal_error() const {
    std::lock_guard lock(terminal_mutex_);
    return terminal_;
  }

  void MarkActive() {
    last_activity_ms_.store(timeutil::SteadyMillis(),
                            std::memory_order_relaxed);
  }

  void BeginRead() { pending_reads_.fetch_add(1, std::memory_order_relaxed); }
  void EndRead() { pending_reads_.fetch_sub(1, std::memory_order_relaxed); }

  // Idle: no traffic for idle_timeout and nobody blocked in Read.
  bool IsIdle() const {
    if (pending_reads_.load(std::memory_order_relaxed) > 0) {
      return false;
    }
    const auto idle_ms = timeutil::SteadyMillis() -
                         last_activity_ms_.load(std::memory_order_relaxed);
    return idle_ms >= cfg_.idle_timeout.count();
  }

private:
  const std::uint64_t id_;
  const std::string dest_addr_;
  const Config cfg_;

  util::Channel<OutboundItem> requests_;
  util::Channel<InboundItem> responses_;

  mutable std::shared_mutex gate_;
  bool done_requesting_ = false;

  std::mutex initial_mutex_;
  bool initial_delivered_ = false;
  std::promise<Result<InitialResponse>> initial_promise_;
  std::shared_future<Result<InitialResponse>> initial_future_;

  std::stop_source stop_;

  mutable std::mutex terminal_mutex_;
  ErrorCode terminal_;

  std::atomic<std::int64_t> last_activity_ms_{0};
  std::atomic<int> pending_reads_{0};
};

} // namespace httptunnel
