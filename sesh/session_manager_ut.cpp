#include "sesh/session_manager.hpp"
#include <sesh/detail/fake_session_client.hpp>

#include <gmock/gmock.h>

#include <thread>

namespace {
using namespace std::chrono_literals;

sesh::orchestrator_config test_config() {
  sesh::orchestrator_config config;
  config.limiter_capacity = 2;
  config.pool_capacity = 3;
  config.retry_max_attempts = 3;
  return config;
}

/// Record the retry delays instead of sleeping.
struct recorder {
  std::vector<std::chrono::milliseconds> delays;
  sesh::retry_executor::sleeper_type sleeper() {
    return [this](std::chrono::milliseconds d) { delays.push_back(d); };
  }
};
} // anonymous namespace

/**
 * @test Verify that the constructor validates its arguments.
 */
TEST(session_manager, constructor) {
  EXPECT_THROW(sesh::session_manager(nullptr, test_config()), std::invalid_argument);
  auto config = test_config();
  config.limiter_capacity = 0;
  auto client = std::make_shared<sesh::detail::fake_session_client>();
  EXPECT_THROW(sesh::session_manager(client, config), std::invalid_argument);

  sesh::session_manager manager(client, test_config());
  EXPECT_EQ(manager.limiter().capacity(), 2);
  EXPECT_EQ(manager.config().pool_capacity, 3);
  EXPECT_EQ(&manager.client(), client.get());
}

/**
 * @test Verify the single-item operations.
 */
TEST(session_manager, basic) {
  auto client = std::make_shared<sesh::detail::fake_session_client>();
  recorder r;
  sesh::session_manager manager(client, test_config(), r.sleeper());

  auto s = manager.create_session("agent", sesh::make_user_state("Alice", "alice@example.com"));
  EXPECT_FALSE(s.id.empty());
  EXPECT_EQ(s.agent_id, "agent");
  EXPECT_EQ(s.slot, sesh::session::no_slot);
  EXPECT_EQ(sesh::state_string(s.state, "user_email"), "alice@example.com");
  EXPECT_EQ(s.created_at, client->get_session(s.id).created_at);

  auto reply = manager.send_message(s, "hello");
  EXPECT_EQ(reply.text, "reply to: hello");
  EXPECT_EQ(s.state.fields().at("message_count").number_value(), 1.0);
  EXPECT_FALSE(s.stale);

  auto fetched = manager.get_session(s.id);
  EXPECT_EQ(fetched.id, s.id);
  EXPECT_EQ(sesh::state_string(fetched.state, "user_name"), "Alice");

  manager.create_session("other", sesh::make_state({}));
  EXPECT_EQ(manager.list_sessions("").size(), 2UL);
  EXPECT_EQ(manager.list_sessions("agent").size(), 1UL);

  manager.delete_session(s.id);
  EXPECT_NO_THROW(manager.delete_session(s.id));
  EXPECT_FALSE(client->has_session(s.id));
  EXPECT_TRUE(r.delays.empty());
  EXPECT_EQ(manager.limiter().in_flight(), 0);
}

/**
 * @test Verify that the single-item operations retry transient failures.
 */
TEST(session_manager, retries) {
  auto client = std::make_shared<sesh::detail::fake_session_client>();
  recorder r;
  sesh::session_manager manager(client, test_config(), r.sleeper());

  client->fail_next(2, sesh::error_code::unreachable);
  auto s = manager.create_session("agent", sesh::make_state({}));
  EXPECT_EQ(client->create_calls(), 3);
  ASSERT_EQ(r.delays.size(), 2UL);
  EXPECT_EQ(r.delays[0], 50ms);
  EXPECT_EQ(r.delays[1], 100ms);

  client->fail_next(3, sesh::error_code::remote_error);
  try {
    manager.create_session("agent", sesh::make_state({}));
    FAIL() << "create_session() should fail after 3 attempts";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::remote_error);
  }
  EXPECT_EQ(client->create_calls(), 6);
  EXPECT_EQ(manager.limiter().in_flight(), 0);
}

/**
 * @test Verify that failures mark the session stale, and refresh() clears the flag.
 */
TEST(session_manager, stale_and_refresh) {
  auto client = std::make_shared<sesh::detail::fake_session_client>();
  sesh::session_manager manager(client, test_config(), [](std::chrono::milliseconds) {});

  auto s = manager.create_session("agent", sesh::make_user_state("Bob"));
  client->fail_next(3, sesh::error_code::unreachable);
  EXPECT_THROW(manager.send_message(s, "lost"), sesh::session_error);
  EXPECT_TRUE(s.stale);

  // ... the message may have reached the backend, only refresh() knows ...
  manager.refresh(s);
  EXPECT_FALSE(s.stale);
  EXPECT_EQ(sesh::state_string(s.state, "user_name"), "Bob");

  client->delete_session(s.id);
  try {
    manager.refresh(s);
    FAIL() << "refresh() of a deleted session should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
  }
  EXPECT_TRUE(s.stale);

  try {
    manager.send_message(s, "anybody there?");
    FAIL() << "send_message() to a deleted session should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::session_not_found);
  }
}

/**
 * @test Verify that concurrent single-item calls respect the limiter capacity.
 */
TEST(session_manager, bounded_concurrency) {
  auto client = std::make_shared<sesh::detail::fake_session_client>();
  sesh::session_manager manager(client, test_config(), [](std::chrono::milliseconds) {});
  auto s = manager.create_session("agent", sesh::make_state({}));
  client->latency(2ms);

  std::vector<std::thread> callers;
  for (int i = 0; i != 6; ++i) {
    callers.emplace_back([&manager, id = s.id]() {
      for (int j = 0; j != 5; ++j) {
        auto copy = manager.get_session(id);
        manager.send_message(copy, "ping");
      }
    });
  }
  for (auto& t : callers) {
    t.join();
  }
  EXPECT_LE(client->high_water_mark(), 2);
  EXPECT_LE(manager.limiter().high_water_mark(), 2);
  EXPECT_EQ(client->message_calls(), 30);
}

/**
 * @test Verify that batches and pools use the configuration of the manager.
 */
TEST(session_manager, batches_and_pools) {
  auto client = std::make_shared<sesh::detail::fake_session_client>();
  sesh::session_manager manager(client, test_config(), [](std::chrono::milliseconds) {});

  auto created = manager.run_batch(sesh::make_create_batch(
      "agent", {sesh::make_user_state("a"), sesh::make_user_state("b"), sesh::make_user_state("c")}));
  EXPECT_EQ(created.success_count(), 3UL);
  auto ids = created.session_ids();

  sesh::cancellation cancel;
  cancel.cancel();
  auto cancelled = manager.run_batch(sesh::make_broadcast_batch(ids, "hi"), cancel);
  EXPECT_EQ(cancelled.failure_count(), 3UL);
  EXPECT_EQ(client->message_calls(), 0);

  auto pool = manager.make_pool("agent", sesh::make_user_state("guest"));
  EXPECT_EQ(pool->capacity(), 3);
  pool->initialize(3);
  EXPECT_EQ(pool->available_count(), 3);
  EXPECT_EQ(client->session_count(), 6UL);
  pool->drain();

  auto small = manager.make_pool("agent", sesh::make_state({}), 1);
  EXPECT_EQ(small->capacity(), 1);

  auto deleted = manager.run_batch(sesh::make_delete_batch(ids));
  EXPECT_EQ(deleted.success_count(), 3UL);
  EXPECT_EQ(client->session_count(), 0UL);
  EXPECT_LE(manager.limiter().high_water_mark(), 2);
}
