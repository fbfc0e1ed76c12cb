#pragma once

#include "httptunnel/client/relay_link.hpp"
#include "httptunnel/client/session_state.hpp"
#include "httptunnel/core/protocol.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>

namespace httptunnel {

// InboundWorker
// Threading model:
// - Runs on its own std::jthread, one per session; mirror image of
//   OutboundWorker for the read direction
// - Blocks on the initial-response handoff, then long-polls the relay with at
//   most one poll exchange in flight
// - A session stop cancels the in-flight poll through the link; whatever that
//   poll returns is discarded
// - Delivers exactly one terminal item to the reader, then closes the channel
class InboundWorker {
public:
  explicit InboundWorker(std::shared_ptr<SessionState> state)
      : state_(std::move(state)) {}

  void Run() {
    const auto st = state_->stop_token();
    RelayLink link(state_->config(), state_->dest_addr());
    ErrorCode terminal;
    try {
      std::stop_callback cancel_poll(st, [&link] { link.Cancel(); });
      terminal = Loop(st, link);
    } catch (const std::exception &e) {
      std::cerr << "[tunnel " << state_->id()
                << "] inbound worker fault: " << e.what() << "\n";
      terminal = error::make_error_code(error::Code::abnormal_termination);
      state_->SetTerminalError(terminal);
      state_->RequestStop();
    }
    state_->responses().CloseWith(InboundItem{{}, terminal});
    link.Close();
  }

private:
  ErrorCode Loop(const std::stop_token &st, RelayLink &link) {
    auto initial = state_->initial().get();
    if (!initial) {
      return initial.error();
    }
    session_id_ = initial->session_id;
    pin_ = initial->pin;
    if (!initial->payload.empty() &&
        !Deliver(st, std::move(initial->payload))) {
      return Stopped();
    }
    if (initial->eof) {
      return net::error::eof;
    }
    for (;;) {
      if (st.stop_requested()) {
        return Stopped();
      }
      if (auto ok = link.EnsureConnected(); !ok) {
        if (st.stop_requested()) {
          return Stopped();
        }
        return Fail("redial relay", ok.error());
      }
      protocol::ExchangeHeaders h;
      h.op = protocol::Op::read;
      h.seq = seq_++;
      h.session_id = session_id_;
      h.pin = pin_;
      auto req = protocol::MakeRequest(h, HostHeader(),
                                       state_->config().user_agent, {});
      auto res = link.Exchange(req);
      if (st.stop_requested()) {
        return Stopped();
      }
      if (!res) {
        return Fail("read request", res.error());
      }
      if (auto ec = protocol::ErrorFromResponse(*res)) {
        return Fail("read request", ec);
      }
      if (!res->body().empty()) {
        state_->MarkActive();
        if (!Deliver(st, std::move(res->body()))) {
          return Stopped();
        }
      }
      if (protocol::IsEof(*res)) {
        return net::error::eof;
      }
    }
  }

  bool Deliver(const std::stop_token &st, std::string payload) {
    return state_->responses().Send(InboundItem{std::move(payload), {}}, st);
  }

  // Stopped by Close, idle expiry or a failed outbound worker; the reader sees
  // the session's failure if there was one.
  ErrorCode Stopped() const {
    if (auto ec = state_->terminal_error()) {
      return ec;
    }
    return net::error::eof;
  }

  ErrorCode Fail(const char *stage, const ErrorCode &ec) {
    state_->SetTerminalError(ec);
    state_->RequestStop();
    std::cerr << "[tunnel " << state_->id() << "] dest=" << state_->dest_addr()
              << " relay=" << (pin_.empty() ? "-" : pin_) << " " << stage
              << " error: " << ec.message() << "\n";
    return ec;
  }

  std::string HostHeader() const {
    const auto &host = state_->config().relay_host;
    return host.empty() ? state_->dest_addr() : host;
  }

  std::shared_ptr<SessionState> state_;
  std::string session_id_;
  std::string pin_;
  std::uint64_t seq_ = 0;
};

} // namespace httptunnel
