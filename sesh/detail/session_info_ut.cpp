#include "sesh/detail/session_info.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify the conversions between time points and the wire timestamps.
 */
TEST(session_info, epoch_conversions) {
  EXPECT_EQ(sesh::detail::to_epoch_ms(std::chrono::system_clock::time_point()), 0);
  auto tp = sesh::detail::from_epoch_ms(1500000000123);
  EXPECT_EQ(sesh::detail::to_epoch_ms(tp), 1500000000123);
  EXPECT_EQ(std::chrono::system_clock::to_time_t(tp), 1500000000);
}

/**
 * @test Verify that SessionInfo messages are converted to sesh::session.
 */
TEST(session_info, to_session) {
  seshpb::SessionInfo info;
  info.set_session_id("s-1");
  info.set_agent_id("agent");
  info.set_create_time_ms(42000);
  *info.mutable_state() = sesh::make_user_state("Alice");

  auto s = sesh::detail::to_session(info);
  EXPECT_EQ(s.id, "s-1");
  EXPECT_EQ(s.agent_id, "agent");
  EXPECT_EQ(sesh::state_string(s.state, "user_name"), "Alice");
  EXPECT_EQ(sesh::detail::to_epoch_ms(s.created_at), 42000);
  EXPECT_EQ(s.slot, sesh::session::no_slot);
  EXPECT_FALSE(s.stale);
}
