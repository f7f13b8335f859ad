#include "sesh/detail/mocked_grpc_interceptor.hpp"
#include <sesh/completion_queue.hpp>

#include <seshpb/agent_sessions.grpc.pb.h>

#include <cstdlib>

namespace {
std::chrono::system_clock::time_point test_deadline() {
  using namespace std::chrono_literals;
  return std::chrono::system_clock::now() + 5s;
}
} // anonymous namespace

/**
 * @test Make sure we can mock async_rpc() calls a completion_queue.
 */
TEST(mocked_grpc_interceptor, async_rpc) {
  using namespace std::chrono_literals;

  // Create a null stub, we do not need (or want) a real connection for mocked operations ...
  std::shared_ptr<seshpb::AgentSessions::Stub> stub;

  using namespace sesh;
  completion_queue<detail::mocked_grpc_interceptor> queue;

  // Prepare the Mock to save the asynchronous operation state, normally you would simply invoke the callback in the
  // mock action, but this test wants to verify what happens if there is a delay ...
  using ::testing::_;
  using ::testing::Invoke;
  std::shared_ptr<sesh::detail::base_async_op> last_op;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([&last_op](auto const& op) mutable {
    last_op = op;
  }));

  // ... make the request, that will post operations to the mock completion queue ...
  seshpb::CreateSessionRequest req;
  req.set_agent_id("test-agent");
  auto fut = queue.async_rpc(
      stub.get(), &seshpb::AgentSessions::Stub::AsyncCreateSession, std::move(req), test_deadline(),
      "test/CreateSession/future", sesh::use_future());

  // ... verify the results are not there, the interceptor should have stopped the call from going out ...
  auto wait_response = fut.wait_for(10ms);
  ASSERT_EQ(wait_response, std::future_status::timeout);

  // ... fill the response parameters, which again could be done in the mock action, but we are delaying the
  // operations to verify the std::promise is not immediately satisfied ...
  ASSERT_TRUE((bool)last_op);
  {
    auto op = dynamic_cast<
        sesh::detail::async_rpc_op<seshpb::CreateSessionRequest, seshpb::CreateSessionResponse>*>(last_op.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.agent_id(), "test-agent");
    op->response.set_session_id("s-123");
    op->response.set_create_time_ms(1000);
  }
  // ... now we can execute the callback ...
  last_op->callback(*last_op, true);

  // ... that must make the result ready or we will get a deadlock ...
  wait_response = fut.wait_for(10ms);
  ASSERT_EQ(wait_response, std::future_status::ready);

  // ... get the response ...
  auto response = fut.get();
  ASSERT_EQ(response.session_id(), "s-123");
  ASSERT_EQ(response.create_time_ms(), 1000);
}

/**
 * @test Verify canceled RPCs result in an unreachable error for the std::promise.
 */
TEST(mocked_grpc_interceptor, async_rpc_cancelled) {
  using namespace std::chrono_literals;

  std::shared_ptr<seshpb::AgentSessions::Stub> stub;

  using namespace sesh;
  completion_queue<detail::mocked_grpc_interceptor> queue;

  using ::testing::_;
  using ::testing::Invoke;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([](auto bop) mutable {
    bop->callback(*bop, false);
  }));

  seshpb::DeleteSessionRequest req;
  req.set_session_id("s-1");
  auto fut = queue.async_rpc(
      stub.get(), &seshpb::AgentSessions::Stub::AsyncDeleteSession, std::move(req), test_deadline(),
      "test/DeleteSession/future/cancelled", sesh::use_future());

  // ... check that the operation was immediately cancelled ...
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);

  // ... and the promise was satisfied with an exception ...
  try {
    fut.get();
    FAIL() << "the future should hold an exception";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::unreachable);
  }
}

/**
 * @test Verify that failed RPCs carry the classification of their status.
 */
TEST(mocked_grpc_interceptor, async_rpc_error_status) {
  using namespace std::chrono_literals;

  std::shared_ptr<seshpb::AgentSessions::Stub> stub;

  using namespace sesh;
  completion_queue<detail::mocked_grpc_interceptor> queue;

  using ::testing::_;
  using ::testing::Invoke;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([](auto bop) mutable {
    using op_type = sesh::detail::async_rpc_op<seshpb::GetSessionRequest, seshpb::SessionInfo>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown session");
    bop->callback(*bop, true);
  }));

  seshpb::GetSessionRequest req;
  req.set_session_id("does-not-exist");
  auto fut = queue.async_rpc(
      stub.get(), &seshpb::AgentSessions::Stub::AsyncGetSession, std::move(req), test_deadline(),
      "test/GetSession/future/not-found", sesh::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  try {
    fut.get();
    FAIL() << "the future should hold an exception";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("unknown session"));
  }
}

/**
 * @test Verify that the functor version receives the operation and the deadline is set.
 */
TEST(mocked_grpc_interceptor, async_rpc_functor) {
  using namespace std::chrono_literals;

  std::shared_ptr<seshpb::AgentSessions::Stub> stub;

  using namespace sesh;
  completion_queue<detail::mocked_grpc_interceptor> queue;

  auto const deadline = std::chrono::system_clock::now() + 250ms;
  using ::testing::_;
  using ::testing::Invoke;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([deadline](auto bop) mutable {
    using op_type = sesh::detail::async_rpc_op<seshpb::SendMessageRequest, seshpb::SendMessageResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(op->context.deadline() - deadline).count();
    EXPECT_LE(std::abs(delta), 1);
    op->response.set_response_text("hello back");
    bop->callback(*bop, true);
  }));

  int counter = 0;
  std::string text;
  seshpb::SendMessageRequest req;
  req.set_session_id("s-1");
  req.set_text("hello");
  queue.async_rpc(
      stub.get(), &seshpb::AgentSessions::Stub::AsyncSendMessage, std::move(req), deadline, "test/SendMessage/functor",
      [&counter, &text](auto const& op, bool ok) {
        counter += int(ok);
        text = op.response.response_text();
      });

  ASSERT_EQ(counter, 1);
  ASSERT_EQ(text, "hello back");
}
