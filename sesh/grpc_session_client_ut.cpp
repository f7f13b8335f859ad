#include "sesh/grpc_session_client.hpp"
#include <sesh/detail/mocked_grpc_interceptor.hpp>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = sesh::completion_queue<sesh::detail::mocked_grpc_interceptor>;
using client_type = sesh::grpc_session_client<completion_queue_type>;

/// Create a client without a real stub, the interceptor stops all the calls.
std::unique_ptr<client_type> make_client(completion_queue_type& queue) {
  using namespace std::chrono_literals;
  return std::make_unique<client_type>(queue, std::unique_ptr<seshpb::AgentSessions::Stub>(), 5000ms);
}

/// Expect a call to @a name and complete it with @a status, after letting @a fill prepare the response.
template <typename Request, typename Response, typename Functor>
void expect_rpc(completion_queue_type& queue, std::string const& name, grpc::Status status, Functor fill) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([name](auto op) {
    return op->name == name;
  }))).WillOnce(Invoke([status, fill](auto bop) {
    using op_type = sesh::detail::async_rpc_op<Request, Response>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    fill(op->request, op->response);
    op->status = status;
    bop->callback(*bop, true);
  }));
}
} // anonymous namespace

/**
 * @test Verify that sesh::grpc_session_client rejects invalid arguments.
 */
TEST(grpc_session_client, constructor) {
  using namespace std::chrono_literals;
  completion_queue_type queue;
  EXPECT_THROW(client_type(queue, std::unique_ptr<seshpb::AgentSessions::Stub>(), 0ms), std::invalid_argument);
  client_type client(queue, std::unique_ptr<seshpb::AgentSessions::Stub>(), 2s);
  EXPECT_EQ(client.call_timeout().count(), 2000);
}

/**
 * @test Verify that sesh::grpc_session_client::create_session() works in the simple case.
 */
TEST(grpc_session_client, create_session) {
  completion_queue_type queue;
  auto client = make_client(queue);

  expect_rpc<seshpb::CreateSessionRequest, seshpb::CreateSessionResponse>(
      queue, "sessions/create_session", grpc::Status::OK, [](auto const& req, auto& resp) {
        EXPECT_EQ(req.agent_id(), "test-agent");
        EXPECT_EQ(req.state().fields().at("user_name").string_value(), "Alice");
        resp.set_session_id("s-1");
        resp.set_create_time_ms(2500);
      });
  auto s = client->create_session("test-agent", sesh::make_user_state("Alice"));
  EXPECT_EQ(s.id, "s-1");
  EXPECT_EQ(s.agent_id, "test-agent");
  EXPECT_EQ(sesh::state_string(s.state, "user_name"), "Alice");
  EXPECT_EQ(sesh::detail::to_epoch_ms(s.created_at), 2500);
  EXPECT_EQ(s.slot, sesh::session::no_slot);
}

/**
 * @test Verify that sesh::grpc_session_client::create_session() reports errors correctly.
 */
TEST(grpc_session_client, create_session_errors) {
  completion_queue_type queue;
  auto client = make_client(queue);
  using namespace ::testing;

  // ... an empty agent id never reaches the backend ...
  try {
    client->create_session("", sesh::session_state());
    FAIL() << "create_session() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::invalid_request);
  }

  // ... an unknown agent is an invalid request ...
  expect_rpc<seshpb::CreateSessionRequest, seshpb::CreateSessionResponse>(
      queue, "sessions/create_session", grpc::Status(grpc::StatusCode::NOT_FOUND, "no such agent"),
      [](auto const&, auto&) {});
  try {
    client->create_session("unknown-agent", sesh::session_state());
    FAIL() << "create_session() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::invalid_request);
    EXPECT_THAT(ex.what(), HasSubstr("no such agent"));
  }

  // ... a response without a session id is a remote error ...
  expect_rpc<seshpb::CreateSessionRequest, seshpb::CreateSessionResponse>(
      queue, "sessions/create_session", grpc::Status::OK, [](auto const&, auto&) {});
  try {
    client->create_session("test-agent", sesh::session_state());
    FAIL() << "create_session() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::remote_error);
  }

  // ... a deadline is reported as unreachable ...
  expect_rpc<seshpb::CreateSessionRequest, seshpb::CreateSessionResponse>(
      queue, "sessions/create_session", grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "too slow"),
      [](auto const&, auto&) {});
  try {
    client->create_session("test-agent", sesh::session_state());
    FAIL() << "create_session() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::unreachable);
    EXPECT_TRUE(ex.retryable());
  }
}

/**
 * @test Verify that sesh::grpc_session_client::send_message() returns the text and the state.
 */
TEST(grpc_session_client, send_message) {
  completion_queue_type queue;
  auto client = make_client(queue);

  expect_rpc<seshpb::SendMessageRequest, seshpb::SendMessageResponse>(
      queue, "sessions/send_message", grpc::Status::OK, [](auto const& req, auto& resp) {
        EXPECT_EQ(req.session_id(), "s-1");
        EXPECT_EQ(req.text(), "hello");
        resp.set_response_text("hi there");
        *resp.mutable_state() = sesh::make_state({{"message_count", sesh::number_value(1)}});
      });
  auto reply = client->send_message("s-1", "hello");
  EXPECT_EQ(reply.text, "hi there");
  ASSERT_TRUE(reply.has_state);
  EXPECT_EQ(reply.state.fields().at("message_count").number_value(), 1.0);

  // ... a response without state ...
  expect_rpc<seshpb::SendMessageRequest, seshpb::SendMessageResponse>(
      queue, "sessions/send_message", grpc::Status::OK,
      [](auto const& req, auto& resp) { resp.set_response_text("again"); });
  reply = client->send_message("s-1", "hello again");
  EXPECT_EQ(reply.text, "again");
  EXPECT_FALSE(reply.has_state);
}

/**
 * @test Verify that sesh::grpc_session_client::send_message() reports errors correctly.
 */
TEST(grpc_session_client, send_message_errors) {
  completion_queue_type queue;
  auto client = make_client(queue);

  EXPECT_THROW(client->send_message("", "hello"), sesh::session_error);
  EXPECT_THROW(client->send_message("s-1", ""), sesh::session_error);

  expect_rpc<seshpb::SendMessageRequest, seshpb::SendMessageResponse>(
      queue, "sessions/send_message", grpc::Status(grpc::StatusCode::NOT_FOUND, "no session"),
      [](auto const&, auto&) {});
  try {
    client->send_message("s-gone", "hello");
    FAIL() << "send_message() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
    EXPECT_FALSE(ex.retryable());
  }

  expect_rpc<seshpb::SendMessageRequest, seshpb::SendMessageResponse>(
      queue, "sessions/send_message", grpc::Status(grpc::StatusCode::INTERNAL, "oops"), [](auto const&, auto&) {});
  try {
    client->send_message("s-1", "hello");
    FAIL() << "send_message() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::remote_error);
  }
}

/**
 * @test Verify that sesh::grpc_session_client::delete_session() ignores missing sessions.
 */
TEST(grpc_session_client, delete_session_idempotent) {
  completion_queue_type queue;
  auto client = make_client(queue);

  expect_rpc<seshpb::DeleteSessionRequest, seshpb::DeleteSessionResponse>(
      queue, "sessions/delete_session", grpc::Status(grpc::StatusCode::NOT_FOUND, "no session"),
      [](auto const& req, auto&) { EXPECT_EQ(req.session_id(), "s-gone"); });
  EXPECT_NO_THROW(client->delete_session("s-gone"));

  expect_rpc<seshpb::DeleteSessionRequest, seshpb::DeleteSessionResponse>(
      queue, "sessions/delete_session", grpc::Status(grpc::StatusCode::UNAVAILABLE, "down"),
      [](auto const&, auto&) {});
  try {
    client->delete_session("s-1");
    FAIL() << "delete_session() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::unreachable);
  }
}

/**
 * @test Verify that cancelled operations are reported as unreachable.
 */
TEST(grpc_session_client, cancelled) {
  completion_queue_type queue;
  auto client = make_client(queue);
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));
  try {
    client->delete_session("s-1");
    FAIL() << "delete_session() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::unreachable);
  }
}

/**
 * @test Verify that sesh::grpc_session_client::get_session() and list_sessions() convert the responses.
 */
TEST(grpc_session_client, get_and_list) {
  completion_queue_type queue;
  auto client = make_client(queue);

  expect_rpc<seshpb::GetSessionRequest, seshpb::SessionInfo>(
      queue, "sessions/get_session", grpc::Status::OK, [](auto const& req, auto& resp) {
        resp.set_session_id(req.session_id());
        resp.set_agent_id("test-agent");
        resp.set_create_time_ms(1500);
        *resp.mutable_state() = sesh::make_user_state("Bob");
      });
  auto s = client->get_session("s-7");
  EXPECT_EQ(s.id, "s-7");
  EXPECT_EQ(s.agent_id, "test-agent");
  EXPECT_EQ(sesh::state_string(s.state, "user_name"), "Bob");
  EXPECT_EQ(sesh::detail::to_epoch_ms(s.created_at), 1500);
  EXPECT_EQ(s.slot, sesh::session::no_slot);
  EXPECT_FALSE(s.stale);

  expect_rpc<seshpb::ListSessionsRequest, seshpb::ListSessionsResponse>(
      queue, "sessions/list_sessions", grpc::Status::OK, [](auto const& req, auto& resp) {
        EXPECT_EQ(req.agent_id(), "test-agent");
        for (auto id : {"a", "b", "c"}) {
          auto& info = *resp.add_sessions();
          info.set_session_id(id);
          info.set_agent_id("test-agent");
        }
      });
  auto all = client->list_sessions("test-agent");
  ASSERT_EQ(all.size(), 3UL);
  EXPECT_EQ(all[0].id, "a");
  EXPECT_EQ(all[2].id, "c");
}
