#pragma once

#include "httptunnel/client/relay_link.hpp"
#include "httptunnel/client/session_state.hpp"
#include "httptunnel/core/protocol.hpp"
#include "httptunnel/util/branch.hpp"
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace httptunnel {

// OutboundWorker
// Threading model:
// - Runs on its own std::jthread, one per session, and is the only code that
//   talks to the relay in the write direction
// - Exchanges are strictly sequential: the next item is not taken off the
//   channel until the previous exchange has completed (no pipelining, since
//   intermediaries may reorder concurrent requests)
// - Waits on (requests channel | session stop | idle or flush timer)
// - Cleanup always runs, also after a caught fault, so no submitter can block
//   forever on its acknowledgment
class OutboundWorker {
public:
  explicit OutboundWorker(std::shared_ptr<SessionState> state)
      : state_(std::move(state)) {}

  void Run() {
    const auto st = state_->stop_token();
    RelayLink link(state_->config(), state_->dest_addr());
    bool faulted = false;
    try {
      Loop(st, link);
    } catch (const std::exception &e) {
      std::cerr << "[tunnel " << state_->id()
                << "] outbound worker fault: " << e.what() << "\n";
      faulted = true;
    }
    Cleanup(faulted);
    link.Close();
    state_->RequestStop();
  }

private:
  using clock = std::chrono::steady_clock;

  void Loop(const std::stop_token &st, RelayLink &link) {
    const Config &cfg = state_->config();
    for (;;) {
      if (st.stop_requested()) {
        return;
      }
      const auto deadline = pending_.empty() ? clock::now() + cfg.idle_timeout
                                             : flush_deadline_;
      OutboundItem item;
      switch (state_->requests().Receive(item, st, deadline)) {
      case util::RecvStatus::item:
        if (!Handle(link, item)) {
          return;
        }
        break;
      case util::RecvStatus::timeout:
        if (!pending_.empty()) {
          if (!Flush(link)) {
            return;
          }
          break;
        }
        if (state_->IsIdle()) {
          std::cerr << "[tunnel " << state_->id() << "] idle for "
                    << cfg.idle_timeout.count() << "ms, closing\n";
          return;
        }
        break;
      case util::RecvStatus::stopped:
      case util::RecvStatus::closed:
        return;
      }
    }
  }

  bool Handle(RelayLink &link, OutboundItem &item) {
    switch (item.kind) {
    case OutboundItem::Kind::open:
      return Open(link, item);
    case OutboundItem::Kind::flush: {
      if (!Flush(link)) {
        item.done.set_value(std::unexpected(failure_));
        return false;
      }
      item.done.set_value(Status{});
      return true;
    }
    case OutboundItem::Kind::data:
      break;
    }
    if (state_->config().buffer_requests) {
      if (pending_.empty()) {
        flush_deadline_ = clock::now() + state_->config().flush_interval;
      }
      pending_.append(item.payload);
      item.done.set_value(Status{});
      if (pending_.size() >= state_->config().max_request_bytes) {
        return Flush(link);
      }
      return true;
    }
    auto st = IssueWrite(link, std::move(item.payload));
    item.done.set_value(st);
    return st.has_value();
  }

  // First exchange: carries the destination and learns the session token and
  // the pin. Its outcome always goes through the initial-response handoff.
  bool Open(RelayLink &link, OutboundItem &item) {
    auto res = Exchange(link, std::move(item.payload), true);
    if (!res) {
      item.done.set_value(std::unexpected(res.error()));
      state_->DeliverInitial(std::unexpected(res.error()));
      return false;
    }
    InitialResponse initial;
    initial.session_id = protocol::ToStd((*res)[protocol::kHeaderSessionId]);
    initial.pin = protocol::ToStd((*res)[protocol::kHeaderRelayHost]);
    initial.eof = protocol::IsEof(*res);
    initial.payload = std::move(res->body());
    if (HTTPTUNNEL_UNLIKELY(initial.session_id.empty())) {
      Fail("open", error::make_error_code(error::Code::bad_relay_response));
      item.done.set_value(std::unexpected(failure_));
      state_->DeliverInitial(std::unexpected(failure_));
      return false;
    }
    session_id_ = initial.session_id;
    pin_ = initial.pin;
    state_->MarkActive();
    item.done.set_value(Status{});
    state_->DeliverInitial(std::move(initial));
    return true;
  }

  bool Flush(RelayLink &link) {
    if (pending_.empty()) {
      return true;
    }
    std::string body;
    body.swap(pending_);
    return IssueWrite(link, std::move(body)).has_value();
  }

  Status IssueWrite(RelayLink &link, std::string body) {
    auto res = Exchange(link, std::move(body), false);
    if (!res) {
      return std::unexpected(res.error());
    }
    state_->MarkActive();
    return {};
  }

  Result<protocol::Response> Exchange(RelayLink &link, std::string body,
                                      bool first) {
    if (auto st = link.EnsureConnected(); !st) {
      Fail("redial relay", st.error());
      return std::unexpected(failure_);
    }
    protocol::ExchangeHeaders h;
    h.op = protocol::Op::write;
    h.seq = seq_++;
    h.session_id = session_id_;
    h.pin = pin_;
    if (first) {
      h.dest_addr = state_->dest_addr();
    }
    auto req = protocol::MakeRequest(h, HostHeader(), state_->config().user_agent,
                                     std::move(body));
    auto res = link.Exchange(req);
    if (!res) {
      Fail("write request", res.error());
      return std::unexpected(failure_);
    }
    if (auto ec = protocol::ErrorFromResponse(*res)) {
      Fail("write request", ec);
      return std::unexpected(failure_);
    }
    return res;
  }

  std::string HostHeader() const {
    const auto &host = state_->config().relay_host;
    return host.empty() ? state_->dest_addr() : host;
  }

  void Fail(const char *stage, const ErrorCode &ec) {
    failure_ = ec;
    state_->SetTerminalError(ec);
    std::cerr << "[tunnel " << state_->id() << "] dest=" << state_->dest_addr()
              << " relay=" << (pin_.empty() ? "-" : pin_) << " " << stage
              << " error: " << ec.message() << "\n";
  }

  // Drain → close channel (wakes blocked submitters) → gate → drain again, so
  // every accepted item is acknowledged and no new one is accepted.
  void Cleanup(bool faulted) {
    if (faulted) {
      state_->SetTerminalError(
          error::make_error_code(error::Code::abnormal_termination));
    }
    // Items left behind by a failed session report its error; after Close or
    // idle expiry they report `closed`.
    ErrorCode drain_ec = state_->terminal_error();
    if (!drain_ec) {
      drain_ec = error::make_error_code(error::Code::closed);
    }
    state_->DeliverInitial(std::unexpected(failure_ ? failure_ : drain_ec));
    auto &requests = state_->requests();
    DrainPending(requests, drain_ec);
    requests.Close();
    state_->StopAccepting();
    DrainPending(requests, drain_ec);
  }

  static void DrainPending(util::Channel<OutboundItem> &requests,
                           const ErrorCode &ec) {
    while (auto item = requests.TryReceive()) {
      item->done.set_value(std::unexpected(ec));
    }
  }

  std::shared_ptr<SessionState> state_;
  std::string session_id_;
  std::string pin_;
  std::uint64_t seq_ = 0;
  std::string pending_;
  clock::time_point flush_deadline_;
  ErrorCode failure_;
};

} // namespace httptunnel
