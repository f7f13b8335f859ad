#include "sesh/work_item.hpp"

#include <gmock/gmock.h>

#include <sstream>

namespace {
sesh::work_outcome make_outcome(std::size_t index, sesh::work_kind kind, bool success) {
  sesh::work_outcome o;
  o.index = index;
  o.kind = kind;
  o.success = success;
  o.attempts = 1;
  return o;
}
} // anonymous namespace

/**
 * @test Verify that work_kind values can be streamed.
 */
TEST(work_item, work_kind_streaming) {
  std::ostringstream os;
  os << sesh::work_kind::create_session << " " << sesh::work_kind::send_message << " "
     << sesh::work_kind::delete_session;
  EXPECT_EQ(os.str(), "create_session send_message delete_session");
}

/**
 * @test Verify the work_item factories.
 */
TEST(work_item, factories) {
  auto create = sesh::make_create_item("agent", sesh::make_user_state("Alice"), "alice");
  EXPECT_EQ(create.kind, sesh::work_kind::create_session);
  EXPECT_EQ(create.target, "agent");
  EXPECT_EQ(sesh::state_string(create.initial_state, "user_name"), "Alice");
  EXPECT_EQ(create.key, "alice");

  auto message = sesh::make_message_item("s-1", "hello");
  EXPECT_EQ(message.kind, sesh::work_kind::send_message);
  EXPECT_EQ(message.target, "s-1");
  EXPECT_EQ(message.text, "hello");
  EXPECT_EQ(message.key, "");

  auto remove = sesh::make_delete_item("s-2", "k");
  EXPECT_EQ(remove.kind, sesh::work_kind::delete_session);
  EXPECT_EQ(remove.target, "s-2");
  EXPECT_EQ(remove.key, "k");
}

/**
 * @test Verify the batch builders.
 */
TEST(work_item, batch_builders) {
  auto creates = sesh::make_create_batch(
      "agent", {sesh::make_user_state("Alice"), sesh::make_state({}), sesh::make_user_state("Carol")});
  ASSERT_EQ(creates.size(), 3UL);
  EXPECT_EQ(creates[0].key, "Alice");
  EXPECT_EQ(creates[1].key, "create-1");
  EXPECT_EQ(creates[2].key, "Carol");
  for (auto const& item : creates) {
    EXPECT_EQ(item.kind, sesh::work_kind::create_session);
    EXPECT_EQ(item.target, "agent");
  }

  auto broadcast = sesh::make_broadcast_batch({"a", "b"}, "hi");
  ASSERT_EQ(broadcast.size(), 2UL);
  EXPECT_EQ(broadcast[1].target, "b");
  EXPECT_EQ(broadcast[1].key, "b");
  EXPECT_EQ(broadcast[1].text, "hi");

  auto deletes = sesh::make_delete_batch({"x"});
  ASSERT_EQ(deletes.size(), 1UL);
  EXPECT_EQ(deletes[0].kind, sesh::work_kind::delete_session);
  EXPECT_EQ(deletes[0].target, "x");

  EXPECT_TRUE(sesh::make_delete_batch({}).empty());
}

/**
 * @test Verify the batch_result accessors.
 */
TEST(work_item, batch_result) {
  sesh::batch_result result;
  EXPECT_EQ(result.success_count(), 0UL);
  EXPECT_EQ(result.failure_count(), 0UL);
  EXPECT_EQ(result.throughput(), 0.0);

  result.outcomes.push_back(make_outcome(0, sesh::work_kind::create_session, true));
  result.outcomes.back().session_id = "s-0";
  result.outcomes.push_back(make_outcome(1, sesh::work_kind::create_session, false));
  result.outcomes.back().error = sesh::error_code::invalid_request;
  result.outcomes.back().message = "bad agent";
  result.outcomes.push_back(make_outcome(2, sesh::work_kind::create_session, true));
  result.outcomes.back().session_id = "s-2";
  result.outcomes.push_back(make_outcome(3, sesh::work_kind::delete_session, true));
  result.outcomes.back().session_id = "s-9";
  result.elapsed = std::chrono::milliseconds(500);

  EXPECT_EQ(result.success_count(), 3UL);
  EXPECT_EQ(result.failure_count(), 1UL);
  auto failures = result.failures();
  ASSERT_EQ(failures.size(), 1UL);
  EXPECT_EQ(failures[0].index, 1UL);
  EXPECT_EQ(failures[0].error, sesh::error_code::invalid_request);

  using namespace ::testing;
  EXPECT_THAT(result.session_ids(), ElementsAre("s-0", "s-2"));
  EXPECT_DOUBLE_EQ(result.throughput(), 8.0);
}

/**
 * @test Verify that the batch report shows the counts and every failure reason.
 */
TEST(work_item, report) {
  sesh::batch_result result;
  result.outcomes.push_back(make_outcome(0, sesh::work_kind::send_message, true));
  result.outcomes.push_back(make_outcome(1, sesh::work_kind::send_message, false));
  result.outcomes.back().key = "s-1";
  result.outcomes.back().error = sesh::error_code::session_not_found;
  result.outcomes.back().message = "no such session";
  result.elapsed = std::chrono::milliseconds(250);

  std::ostringstream os;
  os << result;
  using namespace ::testing;
  EXPECT_THAT(os.str(), StartsWith("batch: 2 item(s), 1 succeeded, 1 failed, elapsed=250ms, throughput=8.00/s"));
  EXPECT_THAT(
      os.str(), HasSubstr("#1 send_message [s-1] FAILED (session_not_found) after 1 attempt(s): no such session"));
  EXPECT_THAT(os.str(), Not(HasSubstr("#0")));
}
