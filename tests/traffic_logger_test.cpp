#include "httptunnel/logging/traffic_logger.hpp"
#include "httptunnel/relay/traffic_hooks.hpp"
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace httptunnel::logging {
namespace {

class TrafficLoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = ::testing::TempDir() + "traffic_" + std::to_string(::getpid()) +
            "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() +
            ".log";
    std::remove(path_.c_str());
  }
  void TearDown() override { std::remove(path_.c_str()); }

  std::vector<std::string> Lines() const {
    std::ifstream in(path_);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
      lines.push_back(line);
    }
    return lines;
  }

  std::string path_;
};

TEST_F(TrafficLoggerTest, WritesOneTabSeparatedLinePerEvent) {
  TrafficLogger logger;
  ASSERT_TRUE(logger.Open(path_).has_value());
  logger.Start();

  TrafficEvent sent;
  sent.ts_ms = 1700000000000;
  sent.bytes = 42;
  sent.direction = Direction::sent;
  sent.SetDest("example.com:80");
  ASSERT_TRUE(logger.Push(sent));

  TrafficEvent received = sent;
  received.bytes = 7;
  received.direction = Direction::received;
  ASSERT_TRUE(logger.Push(received));
  logger.Join();

  const auto lines = Lines();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "1700000000000\tsent\texample.com:80\t42");
  EXPECT_EQ(lines[1], "1700000000000\treceived\texample.com:80\t7");
  EXPECT_EQ(logger.dropped(), 0u);
}

TEST_F(TrafficLoggerTest, LongDestinationIsTruncated) {
  TrafficEvent ev;
  ev.SetDest(std::string(200, 'x'));
  EXPECT_EQ(std::string(ev.dest), std::string(sizeof(ev.dest) - 1, 'x'));
}

TEST_F(TrafficLoggerTest, OpenFailsForMissingDirectory) {
  TrafficLogger logger;
  auto st = logger.Open("/nonexistent-dir/traffic.log");
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error().value(), ENOENT);
}

TEST_F(TrafficLoggerTest, RelayHooksFeedTheLogger) {
  TrafficLogger logger;
  ASSERT_TRUE(logger.Open(path_).has_value());
  logger.Start();
  auto hooks = relay::TrafficHooks(logger);
  protocol::Request req;
  hooks.on_bytes_sent("127.0.0.1:5000", "dest:443", req, 100);
  hooks.on_bytes_received("127.0.0.1:5000", "dest:443", req, 250);
  logger.Join();

  const auto lines = Lines();
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("\tsent\tdest:443\t100"), std::string::npos);
  EXPECT_NE(lines[1].find("\treceived\tdest:443\t250"), std::string::npos);
}

} // namespace
} // namespace httptunnel::logging
