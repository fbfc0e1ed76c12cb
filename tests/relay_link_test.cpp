#include "common/test_servers.hpp"
#include "httptunnel/client/relay_link.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

namespace httptunnel::test {
namespace {

using namespace std::chrono_literals;

// Answers every exchange with an empty 200. Without keep-alive each response
// carries "Connection: close" and the connection is dropped after it.
class PlainRelay : public LoopbackServer {
public:
  explicit PlainRelay(bool keep_alive = true) : keep_alive_(keep_alive) {}
  ~PlainRelay() override { Stop(); }

  int Requests() const { return requests_.load(); }

protected:
  void Serve(tcp::socket sock, net::yield_context yield) override {
    beast::flat_buffer buffer;
    for (;;) {
      beast::error_code ec;
      protocol::Request req;
      http::async_read(sock, buffer, req, yield[ec]);
      if (ec) {
        return;
      }
      requests_.fetch_add(1);
      auto res = protocol::MakeResponse(req, http::status::ok);
      res.keep_alive(keep_alive_);
      http::async_write(sock, res, yield[ec]);
      if (ec || !keep_alive_) {
        sock.shutdown(tcp::socket::shutdown_both, ec);
        return;
      }
    }
  }

private:
  bool keep_alive_;
  std::atomic<int> requests_{0};
};

protocol::Request Poll(std::uint64_t seq) {
  protocol::ExchangeHeaders h;
  h.op = protocol::Op::read;
  h.seq = seq;
  h.session_id = "s";
  return protocol::MakeRequest(h, "relay.test", "httptunnel-test", {});
}

// Dials, then runs `n` exchanges spaced by `gap`; every one must succeed.
void RunExchanges(RelayLink &link, int n,
                  std::chrono::milliseconds gap = 0ms) {
  for (int i = 0; i < n; ++i) {
    if (i > 0 && gap.count() > 0) {
      std::this_thread::sleep_for(gap);
    }
    ASSERT_TRUE(link.EnsureConnected().has_value());
    auto req = Poll(i);
    auto res = link.Exchange(req);
    ASSERT_TRUE(res.has_value()) << res.error().message();
    EXPECT_EQ(res->result(), http::status::ok);
  }
}

TEST(RelayLinkTest, KeepAliveConnectionCarriesEveryExchange) {
  PlainRelay relay;
  relay.Start();
  auto cfg = TestClientConfig(relay.Address());
  RelayLink link(cfg, "dest.invalid:1");

  RunExchanges(link, 3);
  EXPECT_EQ(link.dials(), 1u);
  EXPECT_EQ(relay.Accepted(), 1);
  EXPECT_EQ(relay.Requests(), 3);
}

TEST(RelayLinkTest, RedialsAfterConnectionClose) {
  PlainRelay relay(false);
  relay.Start();
  auto cfg = TestClientConfig(relay.Address());
  RelayLink link(cfg, "dest.invalid:1");

  RunExchanges(link, 3);
  EXPECT_EQ(link.dials(), 3u);
  EXPECT_TRUE(WaitUntil([&] { return relay.Accepted() == 3; }));
}

TEST(RelayLinkTest, RedialsWhenIdleLongerThanRelayConnIdleTimeout) {
  PlainRelay relay;
  relay.Start();
  auto cfg = TestClientConfig(relay.Address());
  cfg.relay_conn_idle_timeout = 50ms;
  RelayLink link(cfg, "dest.invalid:1");

  RunExchanges(link, 2, 150ms);
  EXPECT_EQ(link.dials(), 2u);
  EXPECT_TRUE(WaitUntil([&] { return relay.Accepted() == 2; }));
}

TEST(RelayLinkTest, CancelBeforeDialFailsWithoutConnecting) {
  PlainRelay relay;
  relay.Start();
  auto cfg = TestClientConfig(relay.Address());
  RelayLink link(cfg, "dest.invalid:1");

  link.Cancel();
  auto st = link.EnsureConnected();
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error(), net::error::operation_aborted);
  EXPECT_EQ(link.dials(), 0u);
  EXPECT_EQ(relay.Accepted(), 0);
}

TEST(RelayLinkTest, CancelAfterDialAbortsTheNextExchange) {
  PlainRelay relay;
  relay.Start();
  auto cfg = TestClientConfig(relay.Address());
  RelayLink link(cfg, "dest.invalid:1");

  ASSERT_TRUE(link.EnsureConnected().has_value());
  link.Cancel();
  auto req = Poll(0);
  const auto start = std::chrono::steady_clock::now();
  auto res = link.Exchange(req);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), net::error::operation_aborted);
  EXPECT_EQ(relay.Requests(), 0);
}

} // namespace
} // namespace httptunnel::test
