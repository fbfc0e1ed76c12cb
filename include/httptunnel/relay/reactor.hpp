#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace httptunnel::relay {

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns a single io_context shared by the relay's coroutines
// - Runs io_context::run() on N std::jthread workers; the relay uses exactly 1
//   so session state touched by coroutines needs no strand
// - Stop() releases the work guard, stops the context and joins the workers
class Reactor {
public:
  Reactor() = default;

  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  bool Running() const { return !threads_.empty(); }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
    threads_.clear();
  }

  ~Reactor() { Stop(); }

private:
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};

} // namespace httptunnel::relay
