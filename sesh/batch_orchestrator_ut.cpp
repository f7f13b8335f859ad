#include "sesh/batch_orchestrator.hpp"
#include <sesh/detail/fake_session_client.hpp>
#include <sesh/detail/rpc_policies.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <set>

namespace {
using namespace std::chrono_literals;

/// A retry executor that does not sleep between attempts.
sesh::retry_executor make_retry(int attempts = 3) {
  return sesh::retry_executor(
      std::unique_ptr<sesh::detail::rpc_retry_policy>(new sesh::detail::limited_attempts(attempts)),
      std::unique_ptr<sesh::detail::rpc_backoff_policy>(new sesh::detail::exponential_backoff(1ms, 10ms)),
      [](std::chrono::milliseconds) {});
}

std::vector<std::string> create_sessions(sesh::detail::fake_session_client& client, int count) {
  std::vector<std::string> ids;
  for (int i = 0; i != count; ++i) {
    ids.push_back(client.create_session("agent", sesh::make_user_state("user-" + std::to_string(i))).id);
  }
  return ids;
}

/// Wrap a fake client, raising a cancellation signal in the n-th send_message() call.
class cancelling_client : public sesh::detail::fake_session_client {
public:
  cancelling_client(sesh::cancellation& cancel, int n)
      : cancel_(cancel)
      , remaining_(n) {
  }

  sesh::message_reply send_message(std::string const& session_id, std::string const& text) override {
    if (--remaining_ == 0) {
      cancel_.cancel();
    }
    return fake_session_client::send_message(session_id, text);
  }

private:
  sesh::cancellation& cancel_;
  std::atomic<int> remaining_;
};

/// A client that fails every message with an exception that is not a session_error.
class throwing_client : public sesh::detail::fake_session_client {
public:
  sesh::message_reply send_message(std::string const&, std::string const&) override {
    throw std::runtime_error("unexpected");
  }
};
} // anonymous namespace

/**
 * @test Verify that a batch of creates returns one outcome per item, in item order.
 */
TEST(batch_orchestrator, create_batch) {
  sesh::detail::fake_session_client client;
  sesh::concurrency_limiter limiter(2);
  auto retry = make_retry();
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  std::vector<sesh::session_state> states;
  for (int i = 0; i != 6; ++i) {
    states.push_back(sesh::make_user_state("user-" + std::to_string(i)));
  }
  auto result = orchestrator.run_batch(sesh::make_create_batch("agent", states));
  ASSERT_EQ(result.outcomes.size(), 6UL);
  EXPECT_EQ(result.success_count(), 6UL);
  EXPECT_EQ(result.failure_count(), 0UL);

  std::set<std::string> ids;
  for (std::size_t i = 0; i != result.outcomes.size(); ++i) {
    auto const& o = result.outcomes[i];
    EXPECT_EQ(o.index, i);
    EXPECT_EQ(o.key, "user-" + std::to_string(i));
    EXPECT_EQ(o.kind, sesh::work_kind::create_session);
    EXPECT_EQ(o.attempts, 1);
    EXPECT_FALSE(o.session_id.empty());
    ids.insert(o.session_id);
  }
  EXPECT_EQ(ids.size(), 6UL);
  EXPECT_EQ(result.session_ids().size(), 6UL);
  EXPECT_EQ(client.session_count(), 6UL);
  EXPECT_LE(client.high_water_mark(), 2);
  EXPECT_EQ(limiter.in_flight(), 0);
}

/**
 * @test Verify that an empty batch completes immediately.
 */
TEST(batch_orchestrator, empty_batch) {
  sesh::detail::fake_session_client client;
  sesh::concurrency_limiter limiter(2);
  auto retry = make_retry();
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  auto result = orchestrator.run_batch({});
  EXPECT_TRUE(result.outcomes.empty());
  EXPECT_EQ(client.total_calls(), 0);
}

/**
 * @test Verify that the number of calls in flight never exceeds the limiter capacity.
 */
TEST(batch_orchestrator, bounded_concurrency) {
  for (int capacity : {1, 3, 8}) {
    sesh::detail::fake_session_client instrumented;
    auto local_ids = create_sessions(instrumented, 40);
    instrumented.latency(2ms);
    sesh::concurrency_limiter limiter(capacity);
    auto retry = make_retry();
    sesh::batch_orchestrator orchestrator(instrumented, limiter, retry);

    auto result = orchestrator.run_batch(sesh::make_broadcast_batch(local_ids, "ping"));
    EXPECT_EQ(result.success_count(), 40UL);
    EXPECT_LE(instrumented.high_water_mark(), capacity);
    EXPECT_LE(limiter.high_water_mark(), capacity);
    EXPECT_EQ(instrumented.in_flight(), 0);
  }
}

/**
 * @test Verify that one failed item does not affect the others.
 */
TEST(batch_orchestrator, partial_failure) {
  sesh::detail::fake_session_client client;
  auto ids = create_sessions(client, 5);
  client.fail_session(ids[2], sesh::error_code::session_not_found);

  sesh::concurrency_limiter limiter(3);
  auto retry = make_retry();
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  auto result = orchestrator.run_batch(sesh::make_broadcast_batch(ids, "hello"));
  ASSERT_EQ(result.outcomes.size(), 5UL);
  EXPECT_EQ(result.success_count(), 4UL);
  EXPECT_EQ(result.failure_count(), 1UL);
  for (std::size_t i = 0; i != result.outcomes.size(); ++i) {
    auto const& o = result.outcomes[i];
    EXPECT_EQ(o.key, ids[i]);
    EXPECT_EQ(o.session_id, ids[i]);
    if (i == 2) {
      EXPECT_FALSE(o.success);
      EXPECT_EQ(o.error, sesh::error_code::session_not_found);
      EXPECT_EQ(o.attempts, 1);
      continue;
    }
    EXPECT_TRUE(o.success) << o;
    EXPECT_EQ(o.response_text, "reply to: hello");
    EXPECT_TRUE(o.has_state);
  }
}

/**
 * @test Verify that K items with F terminal failures produce exactly F failures, in the right positions.
 */
TEST(batch_orchestrator, terminal_failures) {
  sesh::detail::fake_session_client client;
  client.fail_agent("bad-agent", sesh::error_code::invalid_request);
  sesh::concurrency_limiter limiter(4);
  auto retry = make_retry();
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  std::vector<sesh::work_item> items;
  for (int i = 0; i != 20; ++i) {
    auto agent = i % 3 == 0 ? "bad-agent" : "agent";
    items.push_back(sesh::make_create_item(agent, sesh::make_state({}), std::to_string(i)));
  }
  auto result = orchestrator.run_batch(items);
  ASSERT_EQ(result.outcomes.size(), 20UL);
  EXPECT_EQ(result.failure_count(), 7UL);
  EXPECT_EQ(result.success_count(), 13UL);
  for (auto const& o : result.failures()) {
    EXPECT_EQ(o.index % 3, 0UL);
    EXPECT_EQ(o.key, std::to_string(o.index));
    EXPECT_EQ(o.error, sesh::error_code::invalid_request);
    EXPECT_EQ(o.attempts, 1);
  }
  EXPECT_EQ(client.create_calls(), 20);
}

/**
 * @test Verify that transient failures are retried inside the batch.
 */
TEST(batch_orchestrator, transient_failures) {
  sesh::detail::fake_session_client client;
  auto ids = create_sessions(client, 4);
  client.fail_next(2, sesh::error_code::unreachable);

  sesh::concurrency_limiter limiter(1);
  auto retry = make_retry(3);
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  auto result = orchestrator.run_batch(sesh::make_delete_batch(ids));
  EXPECT_EQ(result.success_count(), 4UL);
  // ... with a single worker the first item absorbs both failures ...
  EXPECT_EQ(result.outcomes[0].attempts, 3);
  for (std::size_t i = 1; i != result.outcomes.size(); ++i) {
    EXPECT_EQ(result.outcomes[i].attempts, 1);
  }
  EXPECT_EQ(client.session_count(), 0UL);
}

/**
 * @test Verify that a batch raised before it starts makes no calls.
 */
TEST(batch_orchestrator, cancelled_before_start) {
  sesh::detail::fake_session_client client;
  auto ids = create_sessions(client, 5);
  auto calls = client.total_calls();
  sesh::concurrency_limiter limiter(2);
  auto retry = make_retry();
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  sesh::cancellation cancel;
  cancel.cancel();
  auto result = orchestrator.run_batch(sesh::make_broadcast_batch(ids, "hello"), cancel);
  ASSERT_EQ(result.outcomes.size(), 5UL);
  EXPECT_EQ(result.failure_count(), 5UL);
  for (auto const& o : result.outcomes) {
    EXPECT_EQ(o.error, sesh::error_code::cancelled);
    EXPECT_EQ(o.attempts, 0);
  }
  EXPECT_EQ(client.total_calls(), calls);
}

/**
 * @test Verify that items started before the cancellation complete, and the rest are cancelled.
 */
TEST(batch_orchestrator, cancelled_during_batch) {
  sesh::cancellation cancel;
  cancelling_client client(cancel, 3);
  auto ids = create_sessions(client, 10);
  sesh::concurrency_limiter limiter(1);
  auto retry = make_retry();
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  auto result = orchestrator.run_batch(sesh::make_broadcast_batch(ids, "hello"), cancel);
  ASSERT_EQ(result.outcomes.size(), 10UL);
  EXPECT_EQ(result.success_count(), 3UL);
  for (std::size_t i = 0; i != result.outcomes.size(); ++i) {
    if (i < 3) {
      EXPECT_TRUE(result.outcomes[i].success) << result.outcomes[i];
    } else {
      EXPECT_EQ(result.outcomes[i].error, sesh::error_code::cancelled) << result.outcomes[i];
    }
  }
  EXPECT_EQ(client.message_calls(), 3);
}

/**
 * @test Verify that unexpected exceptions are reported as remote errors.
 */
TEST(batch_orchestrator, unexpected_exception) {
  throwing_client client;
  sesh::concurrency_limiter limiter(2);
  auto retry = make_retry();
  sesh::batch_orchestrator orchestrator(client, limiter, retry);

  auto result = orchestrator.run_batch(sesh::make_broadcast_batch({"a", "b"}, "hello"));
  EXPECT_EQ(result.failure_count(), 2UL);
  for (auto const& o : result.outcomes) {
    EXPECT_EQ(o.error, sesh::error_code::remote_error);
    EXPECT_EQ(o.message, "unexpected");
  }
  EXPECT_EQ(limiter.in_flight(), 0);
}
