#pragma once

#include "httptunnel/client/conn.hpp"
#include "httptunnel/io/file_writer.hpp"
#include "httptunnel/logging/traffic_logger.hpp"
#include "httptunnel/relay/relay_server.hpp"
#include "httptunnel/relay/traffic_hooks.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <optional>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>

// Runner composition/threading overview:
// - Relay: RelayServer owns a Reactor (1 io thread) hosting the accept loop,
//   connection coroutines, the sweep and per-session read pumps
// - TrafficLogger: dedicated jthread; drains the hooks' SPSC ring with writev
// - Client: Conn runs two worker jthreads; the main thread copies the tunnel
//   to stdout while a pump thread copies stdin into the tunnel
// - Main thread: waits for SIGINT/SIGTERM or the deadline, then stops
//   components and joins them
namespace httptunnel::app {

struct RelayOptions {
  std::string listen_addr = "127.0.0.1:8080";
  int seconds = 0; // 0 = run until signalled
  std::string traffic_file;
  std::optional<int> poll_ms;
  std::optional<int> idle_ms;
};

struct ClientOptions {
  std::string relay_addr;
  std::string dest_addr;
  bool buffered = false;
  std::optional<int> idle_ms;
};

// Blocks until SIGINT/SIGTERM, or until `seconds` elapsed when positive.
inline void WaitForShutdown(int seconds) {
  net::io_context ioc;
  net::signal_set signals(ioc, SIGINT, SIGTERM);
  net::steady_timer deadline(ioc);
  signals.async_wait([&](const ErrorCode &, int) { deadline.cancel(); });
  if (seconds > 0) {
    deadline.expires_after(std::chrono::seconds(seconds));
    deadline.async_wait([&](const ErrorCode &) { signals.cancel(); });
  }
  ioc.run();
}

inline int RunRelay(const RelayOptions &opt) {
  auto hp = address::SplitHostPort(opt.listen_addr);
  if (!hp) {
    std::cerr << "Invalid listen address (expected host:port): "
              << opt.listen_addr << "\n";
    return 1;
  }
  relay::RelayConfig cfg;
  cfg.listen_host = hp->host;
  cfg.listen_port = hp->port;
  if (opt.poll_ms) {
    cfg.poll_timeout = std::chrono::milliseconds(*opt.poll_ms);
  }
  if (opt.idle_ms) {
    cfg.session_idle_timeout = std::chrono::milliseconds(*opt.idle_ms);
  }

  logging::TrafficLogger logger;
  if (!opt.traffic_file.empty()) {
    if (auto st = logger.Open(opt.traffic_file); !st) {
      std::cerr << "Cannot open traffic log '" << opt.traffic_file
                << "': " << st.error().message() << "\n";
      return 1;
    }
    cfg.hooks = relay::TrafficHooks(logger);
    logger.Start();
  }

  relay::RelayServer server(std::move(cfg));
  if (auto st = server.Start(); !st) {
    std::cerr << "Cannot listen on " << opt.listen_addr << ": "
              << st.error().message() << "\n";
    return 1;
  }
  std::cout << "Relay " << server.InstanceId() << " listening on "
            << server.ListenAddress() << "\n";
  WaitForShutdown(opt.seconds);
  server.Stop();
  logger.Join();
  if (logger.dropped() > 0) {
    std::cerr << "[traffic_logger] dropped " << logger.dropped()
              << " event(s)\n";
  }
  return 0;
}

// Copies stdin into the tunnel and the tunnel to stdout until the remote
// side ends the stream.
inline int RunClient(const ClientOptions &opt) {
  Config cfg;
  cfg.dial_proxy = DialTcp(opt.relay_addr);
  cfg.buffer_requests = opt.buffered;
  if (opt.idle_ms) {
    cfg.idle_timeout = std::chrono::milliseconds(*opt.idle_ms);
  }
  auto conn = Dial(opt.dest_addr, std::move(cfg));
  if (!conn) {
    std::cerr << "Cannot reach " << opt.dest_addr << " via " << opt.relay_addr
              << ": " << conn.error().message() << "\n";
    return 1;
  }
  Conn &c = **conn;
  std::cerr << "Tunnel " << c.SessionId() << " to " << c.RemoteAddr()
            << " via relay " << c.Pin() << "\n";

  std::jthread pump([&c](std::stop_token st) {
    char buf[16 * 1024];
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    while (!st.stop_requested()) {
      const int ready = ::poll(&pfd, 1, 100);
      if (ready == 0 || (ready < 0 && errno == EINTR)) {
        continue;
      }
      if (ready < 0) {
        break;
      }
      ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n <= 0) {
        break;
      }
      if (!c.Write(std::string_view(buf, static_cast<std::size_t>(n)))) {
        break;
      }
      if (auto flushed = c.Flush(); !flushed) {
        break;
      }
    }
  });

  int rc = 0;
  char buf[16 * 1024];
  for (;;) {
    auto n = c.Read(buf, sizeof(buf));
    if (!n) {
      if (n.error() != net::error::eof) {
        std::cerr << "Tunnel error: " << n.error().message() << "\n";
        rc = 1;
      }
      break;
    }
    struct iovec iov{buf, *n};
    if (auto st = io::WritevAll(STDOUT_FILENO, &iov, 1); !st) {
      rc = 1;
      break;
    }
  }
  if (auto st = c.Close(); !st) {
    std::cerr << "Close error: " << st.error().message() << "\n";
  }
  pump.request_stop();
  pump.join();
  return rc;
}

} // namespace httptunnel::app
