#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

// util::Channel — bounded blocking MPMC queue used as the message channel
// between the application threads and the session workers.
// Usage pattern:
//   Producer: Send(item) blocks while full; returns false once closed
//   Consumer: Receive(out, stop, deadline) → item | timeout | stopped | closed
// After Close() consumers still receive whatever was queued before, then
// `closed`. CloseWith() appends one final item regardless of capacity so a
// terminal signal can never block its producer.
namespace httptunnel::util {

enum class RecvStatus { item, timeout, stopped, closed };

template <typename T> class Channel {
public:
  using value_type = T;
  using clock = std::chrono::steady_clock;

  explicit Channel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  // Blocks while the channel is full. Returns false (dropping the item) if the
  // channel is closed or `st` is stopped before space frees up.
  bool Send(T item, std::stop_token st = {}) {
    std::unique_lock lock(m_);
    const bool ready = not_full_.wait(lock, st, [this] {
      return closed_ || items_.size() < capacity_;
    });
    if (!ready || closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> TryReceive() {
    std::unique_lock lock(m_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  RecvStatus Receive(T &out, std::stop_token st, clock::time_point deadline) {
    std::unique_lock lock(m_);
    const bool ready = not_empty_.wait_until(
        lock, st, deadline, [this] { return closed_ || !items_.empty(); });
    return Pop(lock, out, ready, st);
  }

  RecvStatus Receive(T &out, std::stop_token st = {}) {
    std::unique_lock lock(m_);
    const bool ready = not_empty_.wait(
        lock, st, [this] { return closed_ || !items_.empty(); });
    return Pop(lock, out, ready, st);
  }

  void Close() {
    {
      std::lock_guard lock(m_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Appends `last` ignoring capacity, then closes. No-op when already closed.
  bool CloseWith(T last) {
    {
      std::lock_guard lock(m_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(last));
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    return true;
  }

  bool closed() const {
    std::lock_guard lock(m_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard lock(m_);
    return items_.size();
  }

private:
  RecvStatus Pop(std::unique_lock<std::mutex> &lock, T &out, bool ready,
                 const std::stop_token &st) {
    if (!items_.empty()) {
      out = std::move(items_.front());
      items_.pop_front();
      lock.unlock();
      not_full_.notify_one();
      return RecvStatus::item;
    }
    if (closed_) {
      return RecvStatus::closed;
    }
    if (!ready && st.stop_requested()) {
      return RecvStatus::stopped;
    }
    return RecvStatus::timeout;
  }

  mutable std::mutex m_;
  std::condition_variable_any not_empty_;
  std::condition_variable_any not_full_;
  std::deque<T> items_;
  std::size_t capacity_;
  bool closed_ = false;
};

} // namespace httptunnel::util
