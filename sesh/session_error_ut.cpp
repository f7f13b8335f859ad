#include "sesh/session_error.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that the iostream operator for sesh::error_code works as expected.
 */
TEST(session_error, streaming) {
  using e = sesh::error_code;
  std::ostringstream os;
  os << e::unreachable << " " << e::remote_error << " " << e::invalid_request << " " << e::session_not_found << " "
     << e::pool_exhausted << " " << e::invalid_release << " " << e::cancelled;
  ASSERT_EQ(
      os.str(), "unreachable remote_error invalid_request session_not_found pool_exhausted invalid_release cancelled");
}

/**
 * @test Verify the classification of retryable and terminal failures.
 */
TEST(session_error, retryable) {
  using e = sesh::error_code;
  EXPECT_TRUE(sesh::is_retryable(e::unreachable));
  EXPECT_TRUE(sesh::is_retryable(e::remote_error));
  EXPECT_FALSE(sesh::is_retryable(e::invalid_request));
  EXPECT_FALSE(sesh::is_retryable(e::session_not_found));
  EXPECT_FALSE(sesh::is_retryable(e::pool_exhausted));
  EXPECT_FALSE(sesh::is_retryable(e::invalid_release));
  EXPECT_FALSE(sesh::is_retryable(e::cancelled));
}

/**
 * @test Verify that sesh::session_error carries its code and message.
 */
TEST(session_error, basic) {
  try {
    throw sesh::session_error(sesh::error_code::session_not_found, "no such session abc");
  } catch (std::runtime_error const& ex) {
    EXPECT_EQ(std::string(ex.what()), "no such session abc");
    auto const* se = dynamic_cast<sesh::session_error const*>(&ex);
    ASSERT_NE(se, nullptr);
    EXPECT_EQ(se->code(), sesh::error_code::session_not_found);
    EXPECT_FALSE(se->retryable());
  }
}
