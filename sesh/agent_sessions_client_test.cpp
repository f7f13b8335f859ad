#include "sesh/agent_sessions_client.hpp"
#include <sesh/detail/in_memory_backend.hpp>
#include <sesh/session_manager.hpp>

#include <grpc++/grpc++.h>
#include <gtest/gtest.h>

/// Define helper types and functions used in these tests
namespace {
using namespace std::chrono_literals;

/// Run an in_memory_backend on a local port for the duration of a test.
class backend_fixture : public ::testing::Test {
protected:
  backend_fixture()
      : backend({"agent-a", "agent-b"})
      , port(0) {
  }

  void SetUp() override {
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
    builder.RegisterService(&backend);
    server = builder.BuildAndStart();
    ASSERT_TRUE((bool)server);
    ASSERT_NE(port, 0);
  }

  void TearDown() override {
    server->Shutdown();
  }

  std::string address() const {
    return "127.0.0.1:" + std::to_string(port);
  }

  std::shared_ptr<sesh::session_client> make_client(std::chrono::milliseconds timeout = 5000ms) {
    auto channel = grpc::CreateChannel(address(), grpc::InsecureChannelCredentials());
    return std::make_shared<sesh::agent_sessions_client>(queue, channel, timeout);
  }

  sesh::detail::in_memory_backend backend;
  int port;
  std::unique_ptr<grpc::Server> server;
  std::shared_ptr<sesh::active_completion_queue> queue = std::make_shared<sesh::active_completion_queue>();
};
} // anonymous namespace

/**
 * @test Verify the session lifecycle against a running backend.
 */
TEST_F(backend_fixture, lifecycle) {
  auto client = make_client();

  auto created = client->create_session("agent-a", sesh::make_user_state("Alice"));
  auto id = created.id;
  ASSERT_FALSE(id.empty());
  EXPECT_EQ(created.agent_id, "agent-a");
  EXPECT_EQ(backend.session_count(), 1UL);

  auto reply = client->send_message(id, "hello");
  EXPECT_EQ(reply.text, "Hello Alice, you said: hello");
  ASSERT_TRUE(reply.has_state);
  EXPECT_EQ(sesh::state_string(reply.state, "user_name"), "Alice");
  EXPECT_EQ(reply.state.fields().at("message_count").number_value(), 1.0);

  auto s = client->get_session(id);
  EXPECT_EQ(s.id, id);
  EXPECT_EQ(s.agent_id, "agent-a");
  EXPECT_EQ(s.state.fields().at("message_count").number_value(), 1.0);
  EXPECT_LE(s.created_at, std::chrono::system_clock::now());
  EXPECT_EQ(s.created_at, created.created_at);

  client->delete_session(id);
  EXPECT_EQ(backend.session_count(), 0UL);
  EXPECT_NO_THROW(client->delete_session(id));

  try {
    client->send_message(id, "still there?");
    FAIL() << "send_message() to a deleted session should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
  }
}

/**
 * @test Verify that list_sessions() filters by agent.
 */
TEST_F(backend_fixture, list_sessions) {
  auto client = make_client();
  client->create_session("agent-a", sesh::make_user_state("a1"));
  client->create_session("agent-a", sesh::make_user_state("a2"));
  auto b = client->create_session("agent-b", sesh::make_user_state("b1")).id;

  EXPECT_EQ(client->list_sessions("").size(), 3UL);
  EXPECT_EQ(client->list_sessions("agent-a").size(), 2UL);
  auto only_b = client->list_sessions("agent-b");
  ASSERT_EQ(only_b.size(), 1UL);
  EXPECT_EQ(only_b[0].id, b);
  EXPECT_TRUE(client->list_sessions("agent-c").empty());
}

/**
 * @test Verify that rejected requests are reported as invalid_request.
 */
TEST_F(backend_fixture, invalid_requests) {
  auto client = make_client();
  try {
    client->create_session("unknown-agent", sesh::make_state({}));
    FAIL() << "create_session() for an unknown agent should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::invalid_request);
  }
  try {
    client->get_session("no-such-session");
    FAIL() << "get_session() for an unknown session should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
  }
}

/**
 * @test Verify that calls slower than the deadline are reported as unreachable.
 */
TEST_F(backend_fixture, deadline) {
  auto client = make_client(100ms);
  backend.latency(500ms);
  try {
    client->create_session("agent-a", sesh::make_state({}));
    FAIL() << "create_session() should exceed the deadline";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::unreachable);
    EXPECT_TRUE(ex.retryable());
  }
  backend.latency(0ms);
}

/**
 * @test Verify that a backend that cannot be contacted is reported as unreachable.
 */
TEST(agent_sessions_client_test, no_backend) {
  auto client = sesh::make_agent_sessions_client("127.0.0.1:1", 500ms);
  try {
    client->create_session("agent-a", sesh::make_state({}));
    FAIL() << "create_session() without a backend should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::unreachable);
  }
}

/**
 * @test Verify that the session_manager retries injected failures end-to-end.
 */
TEST_F(backend_fixture, manager_retries) {
  sesh::orchestrator_config config;
  config.backend_address = address();
  config.retry_base_delay = 1ms;
  config.retry_max_delay = 5ms;
  config.limiter_capacity = 4;
  sesh::session_manager manager(make_client(), config);

  backend.fail_next(2, grpc::StatusCode::UNAVAILABLE);
  auto calls = backend.call_count();
  auto s = manager.create_session("agent-b", sesh::make_user_state("Bob"));
  EXPECT_EQ(backend.call_count() - calls, 3);
  auto reply = manager.send_message(s, "hi");
  EXPECT_EQ(reply.text, "Hello Bob, you said: hi");

  std::vector<sesh::session_state> states;
  for (int i = 0; i != 12; ++i) {
    states.push_back(sesh::make_user_state("user-" + std::to_string(i)));
  }
  auto created = manager.run_batch(sesh::make_create_batch("agent-a", states));
  EXPECT_EQ(created.success_count(), 12UL);
  auto broadcast = manager.run_batch(sesh::make_broadcast_batch(created.session_ids(), "ping"));
  EXPECT_EQ(broadcast.success_count(), 12UL);
  for (std::size_t i = 0; i != broadcast.outcomes.size(); ++i) {
    EXPECT_EQ(broadcast.outcomes[i].response_text, "Hello user-" + std::to_string(i) + ", you said: ping");
  }
  auto deleted = manager.run_batch(sesh::make_delete_batch(created.session_ids()));
  EXPECT_EQ(deleted.success_count(), 12UL);
  manager.delete_session(s.id);
  EXPECT_EQ(backend.session_count(), 0UL);
}
