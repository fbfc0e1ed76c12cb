#include "httptunnel/relay/session_table.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <string>

namespace httptunnel::relay {
namespace {

using namespace std::chrono_literals;

class SessionTableTest : public ::testing::Test {
protected:
  std::shared_ptr<SessionEntry> MakeEntry(const std::string &id) {
    return std::make_shared<SessionEntry>(id, "dest:1", tcp::socket(ioc_),
                                          cfg_);
  }

  net::io_context ioc_;
  RelayConfig cfg_;
  SessionTable table_;
};

TEST_F(SessionTableTest, FindReturnsInsertedEntry) {
  table_.Insert(MakeEntry("a"));
  ASSERT_NE(table_.Find("a"), nullptr);
  EXPECT_EQ(table_.Find("a")->dest_addr(), "dest:1");
  EXPECT_EQ(table_.Find("b"), nullptr);
  EXPECT_EQ(table_.Size(), 1u);
}

TEST_F(SessionTableTest, SequenceIsTrackedPerDirection) {
  auto e = MakeEntry("a");
  EXPECT_TRUE(e->CheckSequence(protocol::Op::write, 0));
  EXPECT_TRUE(e->CheckSequence(protocol::Op::read, 0));
  EXPECT_FALSE(e->CheckSequence(protocol::Op::write, 0));
  EXPECT_FALSE(e->CheckSequence(protocol::Op::write, 2));
  EXPECT_TRUE(e->CheckSequence(protocol::Op::write, 1));
  EXPECT_TRUE(e->CheckSequence(protocol::Op::read, 1));
}

TEST_F(SessionTableTest, SweepSkipsEntriesWithExchangeInFlight) {
  auto busy = MakeEntry("busy");
  auto idle = MakeEntry("idle");
  table_.Insert(busy);
  table_.Insert(idle);
  EntryGuard guard(busy);
  ASSERT_TRUE(guard.held());

  const auto later = SessionTable::clock::now() + 1h;
  EXPECT_EQ(table_.Sweep(later, 1s), 1u);
  EXPECT_NE(table_.Find("busy"), nullptr);
  EXPECT_EQ(table_.Find("idle"), nullptr);
  EXPECT_FALSE(idle->alive());
  EXPECT_TRUE(busy->alive());
}

TEST_F(SessionTableTest, SweepKeepsRecentlyActiveEntries) {
  table_.Insert(MakeEntry("a"));
  EXPECT_EQ(table_.Sweep(SessionTable::clock::now(), 1h), 0u);
  EXPECT_EQ(table_.Size(), 1u);
}

TEST_F(SessionTableTest, ClosedEntryRefusesNewExchanges) {
  auto e = MakeEntry("a");
  table_.Insert(e);
  table_.Remove("a");
  EXPECT_EQ(table_.Find("a"), nullptr);
  EXPECT_FALSE(e->alive());
  EntryGuard guard(e);
  EXPECT_FALSE(guard.held());
  table_.Remove("a");
}

TEST_F(SessionTableTest, CloseAllEmptiesTheTable) {
  auto a = MakeEntry("a");
  table_.Insert(a);
  table_.Insert(MakeEntry("b"));
  table_.CloseAll();
  EXPECT_EQ(table_.Size(), 0u);
  EXPECT_FALSE(a->alive());
}

TEST_F(SessionTableTest, EntryCountsBytesMovedEachWay) {
  tcp::acceptor acceptor(ioc_,
                         tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  tcp::socket relay_side(ioc_);
  tcp::socket dest_side(ioc_);
  relay_side.connect(acceptor.local_endpoint());
  acceptor.accept(dest_side);
  net::write(dest_side, net::buffer(std::string("hello")));

  auto e = std::make_shared<SessionEntry>("a", "dest:1", std::move(relay_side),
                                          cfg_);
  e->StartPump();
  PollResult polled;
  Result<std::size_t> written = 0;
  net::spawn(ioc_, [&](net::yield_context yield) {
    written = e->WriteToDestination("ping", yield);
    polled = e->Poll(2s, yield);
    e->Close();
  });
  ioc_.run();

  ASSERT_TRUE(written.has_value()) << written.error().message();
  EXPECT_EQ(*written, 4u);
  EXPECT_FALSE(polled.ec);
  EXPECT_EQ(polled.payload, "hello");
  EXPECT_EQ(e->bytes_sent(), 4u);
  EXPECT_EQ(e->bytes_received(), 5u);

  char buf[4];
  net::read(dest_side, net::buffer(buf));
  EXPECT_EQ(std::string(buf, sizeof(buf)), "ping");
}

} // namespace
} // namespace httptunnel::relay
