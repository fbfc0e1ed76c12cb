#pragma once

#include "httptunnel/core/error.hpp"
#include "httptunnel/io/file_writer.hpp"
#include "httptunnel/logging/traffic_event.hpp"
#include "httptunnel/util/branch.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace httptunnel::logging {

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// TrafficLogger
// Threading model:
// - Single producer: the relay's io thread, through the byte-count hooks
// - Single consumer: the background thread, which drains the SPSC ring and
//   appends "ts_ms<TAB>direction<TAB>dest<TAB>bytes" lines via writev
// - A full ring drops the event and counts it instead of blocking the relay
class TrafficLogger : public LoggerBase<TrafficLogger> {
public:
  TrafficLogger() = default;

  ~TrafficLogger() {
    Join();
    Close();
  }

  Status Open(const std::string &path) {
    int fd =
        ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) {
      return std::unexpected(
          ErrorCode(errno, boost::system::system_category()));
    }
    Close();
    fd_ = fd;
    return {};
  }

  bool Push(const TrafficEvent &ev) {
    if (HTTPTUNNEL_UNLIKELY(!queue_.push(ev))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    return true;
  }

  std::uint64_t dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

  void RunLoop() {
    while (this->running_.load(std::memory_order_relaxed)) {
      if (Drain() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    }
    Drain();
  }

private:
  static constexpr int kBatch = 128;
  static constexpr std::size_t kLineMax = 160;

  void Close() {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  static std::size_t ItoaFast(std::int64_t v, char *out) {
    char tmp[24];
    int i = 0;
    if (v == 0) {
      out[0] = '0';
      return 1;
    }
    bool neg = v < 0;
    std::uint64_t x = neg ? 0 - static_cast<std::uint64_t>(v)
                          : static_cast<std::uint64_t>(v);
    while (x) {
      tmp[i++] = char('0' + (x % 10));
      x /= 10;
    }
    std::size_t o = 0;
    if (neg)
      out[o++] = '-';
    while (i)
      out[o++] = tmp[--i];
    return o;
  }

  static std::size_t FormatLine(const TrafficEvent &ev, char *out) {
    std::size_t o = ItoaFast(ev.ts_ms, out);
    out[o++] = '\t';
    const char *dir = ev.direction == Direction::sent ? "sent" : "received";
    const std::size_t dlen = std::strlen(dir);
    std::memcpy(out + o, dir, dlen);
    o += dlen;
    out[o++] = '\t';
    const std::size_t n = ::strnlen(ev.dest, sizeof(ev.dest));
    std::memcpy(out + o, ev.dest, n);
    o += n;
    out[o++] = '\t';
    o += ItoaFast(ev.bytes, out + o);
    out[o++] = '\n';
    return o;
  }

  // Returns the number of events consumed.
  std::size_t Drain() {
    TrafficEvent ev;
    struct iovec iov[kBatch];
    char linebuf[kBatch][kLineMax];
    int cnt = 0;
    std::size_t total = 0;
    // batch consume to reduce syscalls and atomics
    while (queue_.pop(ev)) {
      ++total;
      if (HTTPTUNNEL_UNLIKELY(fd_ == -1)) {
        continue;
      }
      const std::size_t len = FormatLine(ev, linebuf[cnt]);
      iov[cnt] = {static_cast<void *>(linebuf[cnt]), len};
      ++cnt;
      if (cnt == kBatch) {
        Flush(iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
    }
    return total;
  }

  void Flush(struct iovec *iov, int cnt) {
    if (auto st = io::WritevAll(fd_, iov, cnt); !st) {
      std::cerr << "[traffic_logger] write error: " << st.error().message()
                << "\n";
    }
  }

  TrafficQueue queue_;
  int fd_ = -1;
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace httptunnel::logging
