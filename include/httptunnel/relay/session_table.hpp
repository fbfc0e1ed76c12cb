#pragma once

#include "httptunnel/core/error.hpp"
#include "httptunnel/core/protocol.hpp"
#include "httptunnel/relay/relay_config.hpp"
#include <algorithm>
#include <array>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace httptunnel::relay {

namespace net = boost::asio;
using tcp = net::ip::tcp;

struct PollResult {
  std::string payload;
  bool eof = false;
  ErrorCode ec;
};

// SessionEntry — one tunnelled session on the relay: the destination socket
// it exclusively owns plus the bookkeeping the dispatcher and the sweep share.
// Threading model:
// - Socket, timers and the read pump live on the relay's single io thread
// - Fields read by the sweep or by table lookups are guarded by the
//   entry-local mutex, never held across a suspension point
// - The read pump drains the destination into `buffered_`; a poll waits on
//   `data_signal_`, which the pump cancels to wake it
class SessionEntry : public std::enable_shared_from_this<SessionEntry> {
public:
  using clock = std::chrono::steady_clock;

  SessionEntry(std::string id, std::string dest_addr, tcp::socket socket,
               const RelayConfig &cfg)
      : id_(std::move(id)), dest_addr_(std::move(dest_addr)),
        socket_(std::move(socket)), data_signal_(socket_.get_executor()),
        drain_signal_(socket_.get_executor()), cfg_(cfg),
        last_activity_(clock::now()) {}

  const std::string &id() const { return id_; }
  const std::string &dest_addr() const { return dest_addr_; }

  void StartPump() {
    net::spawn(socket_.get_executor(),
               [self = shared_from_this()](net::yield_context yield) {
                 self->Pump(yield);
               });
  }

  // Marks an exchange in flight and refreshes activity. False once closed.
  bool Acquire() {
    std::lock_guard lock(m_);
    if (closed_) {
      return false;
    }
    ++in_flight_;
    last_activity_ = clock::now();
    return true;
  }

  void Release() {
    std::lock_guard lock(m_);
    --in_flight_;
    last_activity_ = clock::now();
  }

  // False once closed. A destination read error keeps the entry alive until a
  // poll reports it.
  bool alive() const {
    std::lock_guard lock(m_);
    return !closed_;
  }

  bool IsExpired(clock::time_point now, clock::duration idle) const {
    std::lock_guard lock(m_);
    return in_flight_ == 0 && now - last_activity_ >= idle;
  }

  // Accepts `seq` only if it is the next one expected for `op`.
  bool CheckSequence(protocol::Op op, std::uint64_t seq) {
    std::lock_guard lock(m_);
    auto &expected = op == protocol::Op::write ? next_write_seq_
                                               : next_read_seq_;
    if (seq != expected) {
      return false;
    }
    ++expected;
    return true;
  }

  Result<std::size_t> WriteToDestination(std::string_view data,
                                         net::yield_context yield) {
    if (data.empty()) {
      return 0;
    }
    ErrorCode ec;
    const std::size_t n =
        net::async_write(socket_, net::buffer(data.data(), data.size()),
                         yield[ec]);
    if (ec) {
      return std::unexpected(ec);
    }
    std::lock_guard lock(m_);
    bytes_sent_ += n;
    return n;
  }

  // Returns buffered destination bytes as soon as there are any, otherwise
  // waits up to `timeout` and returns an empty payload.
  PollResult Poll(clock::duration timeout, net::yield_context yield) {
    const auto deadline = clock::now() + timeout;
    for (;;) {
      PollResult result;
      bool drained = false;
      {
        std::lock_guard lock(m_);
        if (!buffered_.empty()) {
          const std::size_t n = std::min(buffered_.size(), cfg_.max_poll_bytes);
          result.payload.assign(buffered_, 0, n);
          buffered_.erase(0, n);
          bytes_received_ += n;
          drained = true;
        } else if (eof_) {
          result.eof = true;
        } else if (read_ec_) {
          result.ec = read_ec_;
        } else if (closed_) {
          result.ec = error::make_error_code(error::Code::session_lost);
        }
      }
      if (drained) {
        drain_signal_.cancel();
        return result;
      }
      if (result.eof || result.ec || clock::now() >= deadline) {
        return result;
      }
      ErrorCode ec;
      data_signal_.expires_at(deadline);
      data_signal_.async_wait(yield[ec]);
    }
  }

  void Close() {
    {
      std::lock_guard lock(m_);
      if (closed_) {
        return;
      }
      closed_ = true;
    }
    ErrorCode ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    data_signal_.cancel();
    drain_signal_.cancel();
  }

  std::uint64_t bytes_sent() const {
    std::lock_guard lock(m_);
    return bytes_sent_;
  }

  std::uint64_t bytes_received() const {
    std::lock_guard lock(m_);
    return bytes_received_;
  }

private:
  void Pump(net::yield_context yield) {
    std::array<char, 16 * 1024> buf;
    for (;;) {
      bool full = false;
      {
        std::lock_guard lock(m_);
        if (closed_) {
          return;
        }
        full = buffered_.size() >= cfg_.max_buffered_bytes;
      }
      ErrorCode ec;
      if (full) {
        drain_signal_.expires_at(clock::time_point::max());
        drain_signal_.async_wait(yield[ec]);
        continue;
      }
      const std::size_t n = socket_.async_read_some(net::buffer(buf), yield[ec]);
      {
        std::lock_guard lock(m_);
        if (ec == net::error::eof) {
          eof_ = true;
        } else if (ec) {
          if (!closed_) {
            read_ec_ = ec;
          }
        } else {
          buffered_.append(buf.data(), n);
        }
      }
      data_signal_.cancel();
      if (ec) {
        return;
      }
    }
  }

  const std::string id_;
  const std::string dest_addr_;
  tcp::socket socket_;
  net::steady_timer data_signal_;
  net::steady_timer drain_signal_;
  const RelayConfig &cfg_;

  mutable std::mutex m_;
  clock::time_point last_activity_;
  int in_flight_ = 0;
  bool closed_ = false;
  bool eof_ = false;
  ErrorCode read_ec_;
  std::string buffered_;
  std::uint64_t next_write_seq_ = 0;
  std::uint64_t next_read_seq_ = 0;
  std::uint64_t bytes_sent_ = 0;
  std::uint64_t bytes_received_ = 0;
};

// Keeps an entry marked in flight for the lifetime of one exchange.
class EntryGuard {
public:
  explicit EntryGuard(std::shared_ptr<SessionEntry> entry)
      : entry_(std::move(entry)), held_(entry_ && entry_->Acquire()) {}
  ~EntryGuard() {
    if (held_) {
      entry_->Release();
    }
  }
  EntryGuard(const EntryGuard &) = delete;
  EntryGuard &operator=(const EntryGuard &) = delete;

  bool held() const { return held_; }

private:
  std::shared_ptr<SessionEntry> entry_;
  bool held_;
};

// SessionTable — token → entry map. The map has its own mutex; per-entry
// state is guarded by the entry. Entries leave the table before they are
// closed, so a concurrent lookup sees either a live entry or none.
class SessionTable {
public:
  using clock = SessionEntry::clock;

  std::shared_ptr<SessionEntry> Find(const std::string &id) const {
    std::lock_guard lock(m_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
  }

  void Insert(std::shared_ptr<SessionEntry> entry) {
    std::lock_guard lock(m_);
    entries_[entry->id()] = std::move(entry);
  }

  // Removes and closes the entry, if present.
  void Remove(const std::string &id) {
    std::shared_ptr<SessionEntry> entry;
    {
      std::lock_guard lock(m_);
      auto it = entries_.find(id);
      if (it == entries_.end()) {
        return;
      }
      entry = std::move(it->second);
      entries_.erase(it);
    }
    entry->Close();
  }

  // Closes and removes entries idle for at least `idle` with no exchange in
  // flight. Returns how many were removed.
  std::size_t Sweep(clock::time_point now, clock::duration idle) {
    std::vector<std::shared_ptr<SessionEntry>> expired;
    {
      std::lock_guard lock(m_);
      for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second->IsExpired(now, idle)) {
          expired.push_back(std::move(it->second));
          it = entries_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto &entry : expired) {
      entry->Close();
    }
    return expired.size();
  }

  void CloseAll() {
    std::unordered_map<std::string, std::shared_ptr<SessionEntry>> all;
    {
      std::lock_guard lock(m_);
      all.swap(entries_);
    }
    for (auto &[id, entry] : all) {
      entry->Close();
    }
  }

  std::size_t Size() const {
    std::lock_guard lock(m_);
    return entries_.size();
  }

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, std::shared_ptr<SessionEntry>> entries_;
};

} // namespace httptunnel::relay
