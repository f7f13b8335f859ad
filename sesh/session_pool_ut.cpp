#include "sesh/session_pool.hpp"
#include <sesh/detail/fake_session_client.hpp>
#include <sesh/detail/rpc_policies.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <future>
#include <set>
#include <thread>

namespace {
using namespace std::chrono_literals;

sesh::retry_executor make_retry(int attempts = 3) {
  return sesh::retry_executor(
      std::unique_ptr<sesh::detail::rpc_retry_policy>(new sesh::detail::limited_attempts(attempts)),
      std::unique_ptr<sesh::detail::rpc_backoff_policy>(new sesh::detail::exponential_backoff(1ms, 10ms)),
      [](std::chrono::milliseconds) {});
}

/// The objects a pool needs, in the right order of construction.
struct fixture {
  explicit fixture(int limiter_capacity = 4)
      : client()
      , limiter(limiter_capacity)
      , retry(make_retry()) {
  }

  sesh::detail::fake_session_client client;
  sesh::concurrency_limiter limiter;
  sesh::retry_executor retry;
};
} // anonymous namespace

/**
 * @test Verify that initialize() fills the pool.
 */
TEST(session_pool, initialize) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_user_state("guest"), 4);
  EXPECT_EQ(pool.capacity(), 4);
  EXPECT_EQ(pool.available_count(), 0);

  auto result = pool.initialize(4);
  EXPECT_EQ(result.success_count(), 4UL);
  EXPECT_EQ(pool.available_count(), 4);
  EXPECT_EQ(pool.in_use_count(), 0);
  using namespace ::testing;
  EXPECT_THAT(pool.slot_states(), Each(sesh::slot_state::available));
  auto created = result.session_ids();
  std::set<std::string> ids(created.begin(), created.end());
  EXPECT_EQ(ids.size(), 4UL);
  EXPECT_EQ(f.client.session_count(), 4UL);

  // ... the pooled sessions carry the creation time reported by the backend ...
  auto s = pool.acquire();
  EXPECT_EQ(s.created_at, f.client.get_session(s.id).created_at);
  EXPECT_EQ(s.lease, 1U);
  pool.release(s);

  // ... a second call with the pool full does nothing ...
  auto again = pool.initialize(4);
  EXPECT_TRUE(again.outcomes.empty());
  EXPECT_EQ(f.client.create_calls(), 4);

  pool.drain();
}

/**
 * @test Verify that invalid arguments are rejected.
 */
TEST(session_pool, invalid_arguments) {
  fixture f;
  EXPECT_THROW(
      sesh::session_pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), -1), std::invalid_argument);
  EXPECT_THROW(
      sesh::session_pool(f.client, f.limiter, f.retry, "", sesh::make_state({}), 2), std::invalid_argument);
  EXPECT_THROW(
      sesh::session_pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 2, -1ms),
      std::invalid_argument);

  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 3);
  EXPECT_THROW(pool.initialize(-1), std::invalid_argument);
  EXPECT_THROW(pool.initialize(4), std::invalid_argument);
  EXPECT_EQ(f.client.total_calls(), 0);
}

/**
 * @test Verify that initialize() reports partial failures and a second call refills the empty slots.
 */
TEST(session_pool, partial_initialize) {
  fixture f(1);
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 5);
  f.client.fail_next(2, sesh::error_code::invalid_request);

  auto result = pool.initialize(5);
  EXPECT_EQ(result.success_count(), 3UL);
  EXPECT_EQ(result.failure_count(), 2UL);
  for (auto const& o : result.failures()) {
    EXPECT_EQ(o.error, sesh::error_code::invalid_request);
  }
  EXPECT_EQ(pool.available_count(), 3);
  using namespace ::testing;
  EXPECT_THAT(pool.slot_states(), Contains(sesh::slot_state::empty).Times(2));

  auto refill = pool.initialize(5);
  EXPECT_EQ(refill.outcomes.size(), 2UL);
  EXPECT_EQ(refill.success_count(), 2UL);
  EXPECT_EQ(pool.available_count(), 5);

  // ... initialize() to a smaller size does not remove sessions ...
  EXPECT_TRUE(pool.initialize(2).outcomes.empty());
  EXPECT_EQ(pool.available_count(), 5);
  pool.drain();
}

/**
 * @test Verify the acquire / release cycle with capacity 3.
 */
TEST(session_pool, acquire_release) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 3);
  pool.initialize(3);

  auto a = pool.acquire();
  auto b = pool.acquire();
  auto c = pool.acquire();
  EXPECT_EQ(pool.in_use_count(), 3);
  EXPECT_EQ(pool.available_count(), 0);
  std::set<std::string> ids{a.id, b.id, c.id};
  EXPECT_EQ(ids.size(), 3UL);
  EXPECT_NE(a.slot, sesh::session::no_slot);

  pool.release(b);
  EXPECT_EQ(pool.available_count(), 1);
  EXPECT_EQ(pool.in_use_count(), 2);

  auto d = pool.acquire();
  EXPECT_EQ(d.id, b.id);
  EXPECT_EQ(d.slot, b.slot);
  EXPECT_EQ(f.client.create_calls(), 3);

  pool.release(a);
  pool.release(c);
  pool.release(d);
  EXPECT_EQ(pool.available_count(), 3);
  pool.drain();
}

/**
 * @test Verify that release() stores the caller's view of the session in the slot.
 */
TEST(session_pool, release_keeps_state) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_user_state("guest"), 1);
  pool.initialize(1);

  auto s = pool.acquire();
  EXPECT_EQ(sesh::state_string(s.state, "user_name"), "guest");
  (*s.state.mutable_fields())["message_count"] = sesh::number_value(2);
  s.stale = true;
  pool.release(s);

  auto t = pool.acquire();
  EXPECT_EQ(t.id, s.id);
  EXPECT_TRUE(t.stale);
  EXPECT_EQ(t.state.fields().at("message_count").number_value(), 2.0);
  pool.release(t);
  pool.drain();
}

/**
 * @test Verify that acquire() blocks when all the sessions are in use.
 */
TEST(session_pool, acquire_blocks) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 2);
  pool.initialize(2);
  auto a = pool.acquire();
  auto b = pool.acquire();

  std::atomic<bool> acquired(false);
  auto waiter = std::async(std::launch::async, [&pool, &acquired]() {
    auto s = pool.acquire();
    acquired.store(true);
    return s;
  });
  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(acquired.load());

  pool.release(a);
  auto c = waiter.get();
  EXPECT_TRUE(acquired.load());
  EXPECT_EQ(c.id, a.id);

  pool.release(b);
  pool.release(c);
  pool.drain();
}

/**
 * @test Verify that acquire() on an uninitialized pool blocks until initialize().
 */
TEST(session_pool, acquire_uninitialized) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 1);

  std::atomic<bool> acquired(false);
  auto waiter = std::async(std::launch::async, [&pool, &acquired]() {
    auto s = pool.acquire();
    acquired.store(true);
    return s;
  });
  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(acquired.load());

  pool.initialize(1);
  auto s = waiter.get();
  EXPECT_FALSE(s.id.empty());
  pool.release(s);
  pool.drain();
}

/**
 * @test Verify that acquire() fails with pool_exhausted after the maximum wait.
 */
TEST(session_pool, pool_exhausted) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 1, 20ms);

  // ... an uninitialized pool times out too ...
  try {
    pool.acquire();
    FAIL() << "acquire() on an empty pool should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::pool_exhausted);
  }

  pool.initialize(1);
  auto s = pool.acquire();
  auto start = std::chrono::steady_clock::now();
  try {
    pool.acquire();
    FAIL() << "acquire() on an exhausted pool should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::pool_exhausted);
    EXPECT_FALSE(ex.retryable());
  }
  EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
  EXPECT_EQ(pool.in_use_count(), 1);
  pool.release(s);
  pool.drain();
}

/**
 * @test Verify that invalid releases are detected.
 */
TEST(session_pool, invalid_release) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 2);
  sesh::session_pool other(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 2);
  pool.initialize(2);
  other.initialize(2);

  auto expect_invalid_release = [&pool](sesh::session const& s) {
    try {
      pool.release(s);
      FAIL() << "release() should fail for " << s;
    } catch (sesh::session_error const& ex) {
      EXPECT_EQ(ex.code(), sesh::error_code::invalid_release);
    }
  };

  auto s = pool.acquire();
  pool.release(s);
  // ... double release ...
  expect_invalid_release(s);

  // ... a session from another pool, it has a valid slot number ...
  auto foreign = other.acquire();
  expect_invalid_release(foreign);
  other.release(foreign);

  // ... a session that does not belong to any pool ...
  auto loose = f.client.create_session("agent", sesh::make_state({}));
  expect_invalid_release(loose);
  loose.slot = 7;
  expect_invalid_release(loose);

  EXPECT_EQ(pool.available_count(), 2);
  EXPECT_EQ(pool.in_use_count(), 0);
  pool.drain();
  other.drain();
}

/**
 * @test Verify that an old copy cannot release a session after another caller acquired it again.
 */
TEST(session_pool, release_after_reacquire) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 1);
  pool.initialize(1);

  auto first = pool.acquire();
  pool.release(first);
  auto second = pool.acquire();
  ASSERT_EQ(second.id, first.id);
  ASSERT_EQ(second.slot, first.slot);
  EXPECT_NE(second.lease, first.lease);

  try {
    pool.release(first);
    FAIL() << "release() of a copy from an earlier acquire() should fail";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::invalid_release);
  }
  EXPECT_EQ(pool.in_use_count(), 1);
  EXPECT_EQ(pool.available_count(), 0);

  // ... the session is still held, a third caller must wait for it ...
  auto third = std::async(std::launch::async, [&pool]() { return pool.acquire(); });
  EXPECT_EQ(third.wait_for(50ms), std::future_status::timeout);
  pool.release(second);
  auto s = third.get();
  EXPECT_EQ(s.id, first.id);
  pool.release(s);
  pool.drain();
}

/**
 * @test Verify that drain() deletes the available sessions, and the in-use sessions when released.
 */
TEST(session_pool, drain) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 3);
  pool.initialize(3);
  auto held = pool.acquire();

  auto result = pool.drain();
  EXPECT_EQ(result.outcomes.size(), 2UL);
  EXPECT_EQ(result.success_count(), 2UL);
  EXPECT_TRUE(pool.draining());
  EXPECT_EQ(pool.available_count(), 0);
  EXPECT_EQ(pool.in_use_count(), 1);
  EXPECT_EQ(f.client.session_count(), 1UL);
  EXPECT_TRUE(f.client.has_session(held.id));

  pool.release(held);
  EXPECT_FALSE(f.client.has_session(held.id));
  EXPECT_EQ(f.client.session_count(), 0UL);
  using namespace ::testing;
  EXPECT_THAT(pool.slot_states(), Each(sesh::slot_state::empty));

  // ... initialize() makes the pool usable again ...
  pool.initialize(3);
  EXPECT_FALSE(pool.draining());
  EXPECT_EQ(pool.available_count(), 3);
  pool.drain();
}

/**
 * @test Verify that a failed delete of a released session is reported to the caller.
 */
TEST(session_pool, release_while_draining_fails) {
  fixture f;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), 1);
  pool.initialize(1);
  auto held = pool.acquire();
  pool.drain();

  f.client.fail_next(5, sesh::error_code::unreachable);
  EXPECT_THROW(pool.release(held), sesh::session_error);
  // ... the slot is empty anyway, the pool no longer tracks the session ...
  EXPECT_EQ(pool.in_use_count(), 0);
  EXPECT_EQ(f.limiter.in_flight(), 0);
}

/**
 * @test Verify that concurrent acquire / release keeps the slot accounting consistent.
 */
TEST(session_pool, concurrent_users) {
  fixture f;
  int const capacity = 3;
  sesh::session_pool pool(f.client, f.limiter, f.retry, "agent", sesh::make_state({}), capacity);
  pool.initialize(capacity);

  std::atomic<int> holders(0);
  std::atomic<int> max_holders(0);
  std::vector<std::thread> users;
  for (int i = 0; i != 8; ++i) {
    users.emplace_back([&]() {
      for (int j = 0; j != 25; ++j) {
        auto s = pool.acquire();
        auto h = ++holders;
        int m = max_holders.load();
        while (h > m and not max_holders.compare_exchange_weak(m, h)) {
        }
        std::this_thread::sleep_for(100us);
        --holders;
        pool.release(s);
      }
    });
  }
  for (auto& t : users) {
    t.join();
  }
  EXPECT_LE(max_holders.load(), capacity);
  EXPECT_EQ(pool.in_use_count(), 0);
  EXPECT_EQ(pool.available_count(), capacity);
  EXPECT_EQ(f.client.create_calls(), capacity);
  pool.drain();
}
