#include "httptunnel/core/error.hpp"
#include <boost/asio/error.hpp>
#include <gtest/gtest.h>
#include <set>
#include <string>

namespace httptunnel {
namespace {

TEST(ErrorTest, CodesBelongToTunnelCategory) {
  const ErrorCode ec = error::make_error_code(error::Code::session_lost);
  EXPECT_STREQ(ec.category().name(), "httptunnel");
  EXPECT_EQ(ec.value(), static_cast<int>(error::Code::session_lost));
  EXPECT_TRUE(ec);
}

TEST(ErrorTest, EnumComparesDirectlyWithErrorCode) {
  const ErrorCode ec = error::make_error_code(error::Code::closed);
  EXPECT_EQ(ec, error::Code::closed);
  EXPECT_NE(ec, error::Code::abnormal_termination);
  EXPECT_NE(ec, ErrorCode(boost::asio::error::eof));
}

TEST(ErrorTest, EveryCodeHasItsOwnMessage) {
  std::set<std::string> messages;
  for (int v = static_cast<int>(error::Code::closed);
       v <= static_cast<int>(error::Code::invalid_config); ++v) {
    messages.insert(error::GetCategory().message(v));
  }
  EXPECT_EQ(messages.size(), 10u);
  EXPECT_EQ(error::GetCategory().message(999), "Unknown httptunnel error.");
}

TEST(ErrorTest, MakeStatusKeepsTheError) {
  EXPECT_TRUE(MakeStatus({}).has_value());
  auto st = MakeStatus(boost::asio::error::connection_refused);
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error(), boost::asio::error::connection_refused);
}

} // namespace
} // namespace httptunnel
