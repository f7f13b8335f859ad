#include "sesh/detail/grpc_errors.hpp"
#include <seshpb/agent_sessions.pb.h>

#include <gtest/gtest.h>

/**
 * @test Verify that check_grpc_status works as expected.
 */
TEST(grpc_errors, check_grpc_status_ok) {
  using namespace sesh::detail;

  grpc::Status status = grpc::Status::OK;
  ASSERT_NO_THROW(check_grpc_status(status, "test"));

  seshpb::SendMessageRequest req;
  ASSERT_NO_THROW(check_grpc_status(status, "test", " in iteration=", 42, ", request=", print_to_stream(req)));
}

/**
 * @test Verify that check_grpc_status throws what is expected.
 */
TEST(grpc_errors, check_grpc_status_error_annotations) {
  using namespace sesh::detail;

  try {
    grpc::Status status(grpc::UNKNOWN, "bad thing");
    seshpb::DeleteSessionRequest req;
    req.set_session_id("abc");
    check_grpc_status(status, "test", " request=", print_to_stream(req));
    FAIL() << "check_grpc_status() should have thrown";
  } catch (sesh::session_error const& ex) {
    std::string const expected = R"""(test grpc error: bad thing [2] request=session_id: "abc"
)""";
    EXPECT_EQ(ex.what(), expected);
    EXPECT_EQ(ex.code(), sesh::error_code::remote_error);
  }
}

/**
 * @test Verify that check_grpc_status throws what is expected.
 */
TEST(grpc_errors, check_grpc_status_error_bare) {
  using namespace sesh::detail;
  try {
    grpc::Status status(grpc::NOT_FOUND, "no session");
    check_grpc_status(status, "test");
    FAIL() << "check_grpc_status() should have thrown";
  } catch (sesh::session_error const& ex) {
    std::string const expected = R"""(test grpc error: no session [5])""";
    EXPECT_EQ(ex.what(), expected);
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
  }
}

/**
 * @test Verify the classification of every gRPC status code.
 */
TEST(grpc_errors, classify_grpc_status) {
  using namespace sesh::detail;
  using e = sesh::error_code;
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::UNAVAILABLE), e::unreachable);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::DEADLINE_EXCEEDED), e::unreachable);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::CANCELLED), e::unreachable);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::INVALID_ARGUMENT), e::invalid_request);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::OUT_OF_RANGE), e::invalid_request);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::NOT_FOUND), e::session_not_found);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::UNKNOWN), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::ALREADY_EXISTS), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::PERMISSION_DENIED), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::RESOURCE_EXHAUSTED), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::FAILED_PRECONDITION), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::ABORTED), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::UNIMPLEMENTED), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::INTERNAL), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::DATA_LOSS), e::remote_error);
  EXPECT_EQ(classify_grpc_status(grpc::StatusCode::UNAUTHENTICATED), e::remote_error);
}

/**
 * @test Verify that print_to_stream works as expected.
 */
TEST(grpc_errors, print_to_stream_basic) {
  using namespace sesh::detail;

  seshpb::SendMessageRequest req;
  req.set_session_id("s-1");

  std::string expected = R"""(session_id: "s-1"
)""";
  std::ostringstream os;
  os << print_to_stream(req);
  auto actual = os.str();
  ASSERT_EQ(actual, expected);
}
