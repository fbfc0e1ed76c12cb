#pragma once

#include "httptunnel/core/error.hpp"
#include "httptunnel/core/protocol.hpp"
#include "httptunnel/net/address.hpp"
#include "httptunnel/net/http_ops.hpp"
#include "httptunnel/relay/relay_config.hpp"
#include "httptunnel/relay/session_table.hpp"
#include "httptunnel/util/branch.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace httptunnel::relay {

// Dispatcher — turns one exchange into a response against the session table.
// Threading model:
// - Handle() runs inside a connection coroutine on the relay's io thread and
//   suspends on destination writes, dials and long-polls
// - Holds an in-flight guard on the entry for the whole exchange so the sweep
//   never closes a session under an operation
class Dispatcher {
public:
  Dispatcher(net::io_context &ioc, SessionTable &table, const RelayConfig &cfg,
             std::string pin)
      : ioc_(ioc), table_(table), cfg_(cfg), pin_(std::move(pin)) {}

  const std::string &pin() const { return pin_; }

  protocol::Response Handle(const protocol::Request &req,
                            const std::string &client_addr,
                            net::yield_context yield) {
    auto res = Dispatch(req, client_addr, yield);
    res.set(protocol::kHeaderRelayHost, pin_);
    return res;
  }

private:
  protocol::Response Dispatch(const protocol::Request &req,
                              const std::string &client_addr,
                              net::yield_context yield) {
    const auto op = protocol::ParseOp(protocol::ToStd(req[protocol::kHeaderOp]));
    const auto seq =
        protocol::ParseSeq(protocol::ToStd(req[protocol::kHeaderSeq]));
    if (HTTPTUNNEL_UNLIKELY(!op || !seq)) {
      return protocol::MakeErrorResponse(req, error::Code::bad_request);
    }
    const std::string id(
        protocol::ToStd(req[protocol::kHeaderSessionId]));
    if (id.empty()) {
      return Open(req, *op, *seq, client_addr, yield);
    }

    const auto pin = protocol::ToStd(req[protocol::kHeaderRelayHost]);
    if (!pin.empty() && pin != pin_) {
      return protocol::MakeErrorResponse(req, error::Code::misdirected);
    }
    auto entry = table_.Find(id);
    if (!entry || !entry->alive()) {
      return protocol::MakeErrorResponse(req, error::Code::session_lost);
    }
    EntryGuard guard(entry);
    if (!guard.held()) {
      return protocol::MakeErrorResponse(req, error::Code::session_lost);
    }
    if (!entry->CheckSequence(*op, *seq)) {
      return protocol::MakeErrorResponse(req, error::Code::out_of_sequence);
    }
    if (*op == protocol::Op::write) {
      return Write(req, *entry, client_addr, yield);
    }
    return Poll(req, *entry, client_addr, yield);
  }

  // First exchange of a session: dial the destination, register the entry and
  // hand back its token. A failed dial leaves no trace in the table.
  protocol::Response Open(const protocol::Request &req, protocol::Op op,
                          std::uint64_t seq, const std::string &client_addr,
                          net::yield_context yield) {
    const std::string dest(protocol::ToStd(req[protocol::kHeaderDestAddr]));
    const auto hp = address::SplitHostPort(dest);
    if (op != protocol::Op::write || seq != 0 || !hp) {
      return protocol::MakeErrorResponse(req, error::Code::bad_request);
    }

    tcp::resolver resolver(ioc_);
    auto results = httpops::AsyncResolve(resolver, hp->host, hp->port, yield);
    if (!results) {
      OnError(client_addr, dest, "resolve destination", results.error());
      return protocol::MakeErrorResponse(req,
                                         error::Code::destination_unreachable);
    }
    auto sock = httpops::AsyncConnect(ioc_, *results, cfg_.dial_timeout, yield);
    if (!sock) {
      OnError(client_addr, dest, "dial destination", sock.error());
      return protocol::MakeErrorResponse(req,
                                         error::Code::destination_unreachable);
    }
    httpops::SetTcpNoDelay(*sock);

    auto entry = std::make_shared<SessionEntry>(
        boost::uuids::to_string(uuid_gen_()), dest, std::move(*sock), cfg_);
    EntryGuard guard(entry);
    (void)entry->CheckSequence(protocol::Op::write, 0);
    table_.Insert(entry);
    entry->StartPump();

    auto res = Write(req, *entry, client_addr, yield);
    if (res.result() == protocol::http::status::ok) {
      res.set(protocol::kHeaderSessionId, entry->id());
    }
    return res;
  }

  protocol::Response Write(const protocol::Request &req, SessionEntry &entry,
                           const std::string &client_addr,
                           net::yield_context yield) {
    auto n = entry.WriteToDestination(req.body(), yield);
    if (!n) {
      OnError(client_addr, entry.dest_addr(), "write destination", n.error());
      table_.Remove(entry.id());
      return protocol::MakeErrorResponse(req, error::Code::destination_failed);
    }
    if (*n > 0 && cfg_.hooks.on_bytes_sent) {
      cfg_.hooks.on_bytes_sent(client_addr, entry.dest_addr(), req,
                               static_cast<std::int64_t>(*n));
    }
    return protocol::MakeResponse(req, protocol::http::status::ok);
  }

  // Long-poll: answers with data as soon as there is some, with an empty body
  // at the deadline, or with the end-of-stream mark once the destination has
  // closed and everything it sent was delivered.
  protocol::Response Poll(const protocol::Request &req, SessionEntry &entry,
                          const std::string &client_addr,
                          net::yield_context yield) {
    auto polled = entry.Poll(cfg_.poll_timeout, yield);
    if (polled.ec) {
      if (polled.ec == error::make_error_code(error::Code::session_lost)) {
        return protocol::MakeErrorResponse(req, error::Code::session_lost);
      }
      OnError(client_addr, entry.dest_addr(), "read destination", polled.ec);
      table_.Remove(entry.id());
      return protocol::MakeErrorResponse(req, error::Code::destination_failed);
    }
    if (!polled.payload.empty() && cfg_.hooks.on_bytes_received) {
      cfg_.hooks.on_bytes_received(
          client_addr, entry.dest_addr(), req,
          static_cast<std::int64_t>(polled.payload.size()));
    }
    auto res = protocol::MakeResponse(req, protocol::http::status::ok,
                                      std::move(polled.payload));
    if (polled.eof) {
      res.set(protocol::kHeaderEof, "true");
    }
    return res;
  }

  void OnError(const std::string &client_addr, const std::string &dest,
               const char *stage, const ErrorCode &ec) {
    std::cerr << "[relay " << pin_ << "] client=" << client_addr
              << " dest=" << dest << " " << stage << " error: " << ec.message()
              << "\n";
  }

  net::io_context &ioc_;
  SessionTable &table_;
  const RelayConfig &cfg_;
  std::string pin_;
  boost::uuids::random_generator uuid_gen_;
};

} // namespace httptunnel::relay
