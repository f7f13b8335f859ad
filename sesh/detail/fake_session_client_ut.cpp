#include "sesh/detail/fake_session_client.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify the basic operations of the fake client.
 */
TEST(fake_session_client, basic) {
  sesh::detail::fake_session_client client;
  auto created = client.create_session("agent-a", sesh::make_user_state("Alice"));
  auto a = created.id;
  auto b = client.create_session("agent-b", sesh::make_user_state("Bob")).id;
  EXPECT_EQ(a, "fake-1");
  EXPECT_EQ(b, "fake-2");
  EXPECT_EQ(created.agent_id, "agent-a");
  EXPECT_EQ(client.session_count(), 2UL);

  auto reply = client.send_message(a, "hello");
  EXPECT_EQ(reply.text, "reply to: hello");
  ASSERT_TRUE(reply.has_state);
  EXPECT_EQ(sesh::state_string(reply.state, "user_name"), "Alice");
  EXPECT_EQ(reply.state.fields().at("message_count").number_value(), 1.0);

  auto s = client.get_session(a);
  EXPECT_EQ(s.agent_id, "agent-a");
  EXPECT_EQ(s.created_at, created.created_at);
  EXPECT_EQ(s.state.fields().at("message_count").number_value(), 1.0);

  EXPECT_EQ(client.list_sessions("").size(), 2UL);
  auto listed = client.list_sessions("agent-b");
  ASSERT_EQ(listed.size(), 1UL);
  EXPECT_EQ(listed[0].id, b);

  client.delete_session(a);
  EXPECT_NO_THROW(client.delete_session(a));
  EXPECT_FALSE(client.has_session(a));
  EXPECT_EQ(client.delete_calls(), 2);
  EXPECT_EQ(client.in_flight(), 0);
  EXPECT_EQ(client.high_water_mark(), 1);
  EXPECT_EQ(client.total_calls(), 8);

  try {
    client.send_message(a, "anybody there?");
    FAIL() << "send_message() on a deleted session should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
  }
}

/**
 * @test Verify the failure scripts.
 */
TEST(fake_session_client, failures) {
  sesh::detail::fake_session_client client;
  client.fail_next(2, sesh::error_code::remote_error);
  for (int i = 0; i != 2; ++i) {
    try {
      client.create_session("agent", sesh::make_state({}));
      FAIL() << "injected failure expected";
    } catch (sesh::session_error const& ex) {
      EXPECT_EQ(ex.code(), sesh::error_code::remote_error);
    }
  }
  auto id = client.create_session("agent", sesh::make_state({})).id;
  EXPECT_EQ(client.create_calls(), 3);
  EXPECT_EQ(client.in_flight(), 0);

  client.fail_session(id, sesh::error_code::session_not_found);
  EXPECT_THROW(client.send_message(id, "hi"), sesh::session_error);

  client.fail_agent("bad-agent", sesh::error_code::invalid_request);
  EXPECT_THROW(client.create_session("bad-agent", sesh::make_state({})), sesh::session_error);
  EXPECT_NO_THROW(client.create_session("agent", sesh::make_state({})));
  EXPECT_EQ(client.in_flight(), 0);
}
