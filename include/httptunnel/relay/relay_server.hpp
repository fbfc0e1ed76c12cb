#pragma once

#include "httptunnel/core/error.hpp"
#include "httptunnel/core/protocol.hpp"
#include "httptunnel/net/address.hpp"
#include "httptunnel/relay/dispatcher.hpp"
#include "httptunnel/relay/reactor.hpp"
#include "httptunnel/relay/relay_config.hpp"
#include "httptunnel/relay/session_table.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <future>
#include <iostream>
#include <optional>
#include <string>

namespace httptunnel::relay {

namespace beast = boost::beast;
namespace http = beast::http;

// RelayServer — HTTP front of the relay.
// Threading model:
// - Accept loop, one coroutine per client connection, the sweep and every
//   session's read pump all run on the Reactor's single io thread
// - Start()/Stop() and the accessors may be called from any thread
class RelayServer {
public:
  explicit RelayServer(RelayConfig cfg)
      : cfg_(std::move(cfg)),
        pin_(cfg_.instance_id.empty()
                 ? boost::uuids::to_string(boost::uuids::random_generator()())
                 : cfg_.instance_id),
        dispatcher_(reactor_.GetIoContext(), table_, cfg_, pin_),
        acceptor_(reactor_.GetIoContext()),
        sweep_timer_(reactor_.GetIoContext()) {}

  RelayServer(const RelayServer &) = delete;
  RelayServer &operator=(const RelayServer &) = delete;

  ~RelayServer() { Stop(); }

  // Binds the listening socket and starts serving. The bound address is
  // available from ListenAddress() once this returns.
  Status Start() {
    auto &ioc = reactor_.GetIoContext();
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto results = resolver.resolve(cfg_.listen_host, cfg_.listen_port,
                                    tcp::resolver::passive, ec);
    if (ec) {
      return std::unexpected(ec);
    }
    const tcp::endpoint endpoint = results.begin()->endpoint();
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      return std::unexpected(ec);
    }
    const auto local = acceptor_.local_endpoint(ec);
    if (ec) {
      return std::unexpected(ec);
    }
    listen_address_ = address::JoinHostPort(local.address().to_string(),
                                            std::to_string(local.port()));

    net::spawn(ioc, [this](net::yield_context yield) { AcceptLoop(yield); });
    net::spawn(ioc, [this](net::yield_context yield) { SweepLoop(yield); });
    reactor_.Start(1);
    std::cerr << "[relay " << pin_ << "] listening on " << listen_address_
              << "\n";
    return {};
  }

  // Closes the listener and every session, then joins the io thread.
  void Stop() {
    if (stopped_.exchange(true) || !reactor_.Running()) {
      return;
    }
    std::promise<void> done;
    auto closed = done.get_future();
    net::post(reactor_.GetIoContext(), [this, &done] {
      beast::error_code ec;
      acceptor_.close(ec);
      sweep_timer_.cancel();
      table_.CloseAll();
      done.set_value();
    });
    closed.wait();
    reactor_.Stop();
  }

  const std::string &ListenAddress() const { return listen_address_; }
  const std::string &InstanceId() const { return pin_; }
  std::size_t SessionCount() const { return table_.Size(); }
  int ActiveConnections() const {
    return active_connections_.load(std::memory_order_acquire);
  }

private:
  class ConnectionCounter {
  public:
    explicit ConnectionCounter(std::atomic<int> &n) : n_(n) {
      n_.fetch_add(1, std::memory_order_acq_rel);
    }
    ~ConnectionCounter() { n_.fetch_sub(1, std::memory_order_acq_rel); }
    ConnectionCounter(const ConnectionCounter &) = delete;
    ConnectionCounter &operator=(const ConnectionCounter &) = delete;

  private:
    std::atomic<int> &n_;
  };

  void AcceptLoop(net::yield_context yield) {
    for (;;) {
      beast::error_code ec;
      tcp::socket sock(reactor_.GetIoContext());
      acceptor_.async_accept(sock, yield[ec]);
      if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
        return;
      }
      if (ec) {
        std::cerr << "[relay " << pin_ << "] accept error: " << ec.message()
                  << "\n";
        continue;
      }
      net::spawn(reactor_.GetIoContext(),
                 [this, s = std::move(sock)](net::yield_context y) mutable {
                   ServeConnection(std::move(s), y);
                 });
    }
  }

  // Keep-alive loop: one exchange at a time per client connection.
  void ServeConnection(tcp::socket sock, net::yield_context yield) {
    ConnectionCounter counter(active_connections_);
    beast::error_code ec;
    const auto peer = sock.remote_endpoint(ec);
    const std::string client_addr =
        ec ? std::string("-")
           : address::JoinHostPort(peer.address().to_string(),
                                   std::to_string(peer.port()));
    beast::tcp_stream stream(std::move(sock));
    beast::flat_buffer buffer;
    for (;;) {
      http::request_parser<http::string_body> parser;
      parser.body_limit(cfg_.max_body_bytes);
      stream.expires_after(cfg_.keepalive_timeout);
      http::async_read(stream, buffer, parser, yield[ec]);
      if (ec == http::error::end_of_stream || ec == beast::error::timeout ||
          ec == net::error::operation_aborted) {
        break;
      }
      if (ec) {
        std::cerr << "[relay " << pin_ << "] client=" << client_addr
                  << " read request error: " << ec.message() << "\n";
        break;
      }
      stream.expires_never();
      const protocol::Request req = parser.release();
      auto res = dispatcher_.Handle(req, client_addr, yield);
      stream.expires_after(cfg_.keepalive_timeout);
      http::async_write(stream, res, yield[ec]);
      if (ec) {
        std::cerr << "[relay " << pin_ << "] client=" << client_addr
                  << " write response error: " << ec.message() << "\n";
        break;
      }
      if (!res.keep_alive() || stopped_.load(std::memory_order_acquire)) {
        break;
      }
    }
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    stream.socket().close(ec);
  }

  void SweepLoop(net::yield_context yield) {
    for (;;) {
      beast::error_code ec;
      sweep_timer_.expires_after(cfg_.sweep_interval);
      sweep_timer_.async_wait(yield[ec]);
      if (ec == net::error::operation_aborted ||
          stopped_.load(std::memory_order_acquire)) {
        return;
      }
      const auto n = table_.Sweep(SessionTable::clock::now(),
                                  cfg_.session_idle_timeout);
      if (n > 0) {
        std::cerr << "[relay " << pin_ << "] swept " << n
                  << " idle session(s)\n";
      }
    }
  }

  // Coroutines suspended at Stop() are unwound when the reactor's io_context
  // is destroyed, so everything they touch is declared before it.
  RelayConfig cfg_;
  std::string pin_;
  SessionTable table_;
  std::string listen_address_;
  std::atomic<int> active_connections_{0};
  std::atomic<bool> stopped_{false};
  Reactor reactor_;
  Dispatcher dispatcher_;
  tcp::acceptor acceptor_;
  net::steady_timer sweep_timer_;
};

} // namespace httptunnel::relay
