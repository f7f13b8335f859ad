#include "sesh/detail/rpc_policies.hpp"

#include <gtest/gtest.h>

#include <limits>

/**
 * @test Verify that exponential_backoff doubles the delay by default, and respects the ceiling.
 */
TEST(rpc_policies, exponential_backoff) {
  using namespace std::chrono_literals;
  EXPECT_THROW(sesh::detail::exponential_backoff(1s, 500ms), std::invalid_argument);
  EXPECT_THROW(sesh::detail::exponential_backoff(10ms, 500ms, 0.5), std::invalid_argument);

  EXPECT_NO_THROW(sesh::detail::exponential_backoff(1s, 1500ms));
  EXPECT_NO_THROW(sesh::detail::exponential_backoff(1s, 1s, 1.0));

  sesh::detail::exponential_backoff backoff(10ms, 50ms);
  EXPECT_EQ(backoff.on_failure().count(), 10);
  EXPECT_EQ(backoff.on_failure().count(), 20);
  EXPECT_EQ(backoff.on_failure().count(), 40);
  EXPECT_EQ(backoff.on_failure().count(), 50);
  EXPECT_EQ(backoff.on_failure().count(), 50);
}

/**
 * @test Verify that exponential_backoff uses the configured multiplier.
 */
TEST(rpc_policies, exponential_backoff_multiplier) {
  using namespace std::chrono_literals;
  sesh::detail::exponential_backoff backoff(50ms, 2s, 3.0);
  EXPECT_EQ(backoff.on_failure().count(), 50);
  EXPECT_EQ(backoff.on_failure().count(), 150);
  EXPECT_EQ(backoff.on_failure().count(), 450);
  EXPECT_EQ(backoff.on_failure().count(), 1350);
  EXPECT_EQ(backoff.on_failure().count(), 2000);
}

/**
 * @test Verify that exponential_backoff clamps to the ceiling even when the next delay would not fit in the
 * milliseconds representation.
 */
TEST(rpc_policies, exponential_backoff_huge_multiplier) {
  using namespace std::chrono_literals;
  sesh::detail::exponential_backoff backoff(50ms, 2s, 1e18);
  EXPECT_EQ(backoff.on_failure().count(), 50);
  EXPECT_EQ(backoff.on_failure().count(), 2000);
  EXPECT_EQ(backoff.on_failure().count(), 2000);

  sesh::detail::exponential_backoff infinite(10ms, 1s, std::numeric_limits<double>::infinity());
  EXPECT_EQ(infinite.on_failure().count(), 10);
  EXPECT_EQ(infinite.on_failure().count(), 1000);
  EXPECT_EQ(infinite.on_failure().count(), 1000);
}

/**
 * @test Verify that clones of exponential_backoff start from the minimum delay.
 */
TEST(rpc_policies, exponential_backoff_clone) {
  using namespace std::chrono_literals;
  sesh::detail::exponential_backoff prototype(10ms, 1s);
  EXPECT_EQ(prototype.on_failure().count(), 10);
  EXPECT_EQ(prototype.on_failure().count(), 20);

  auto copy = prototype.clone();
  EXPECT_EQ(copy->on_failure().count(), 10);
  EXPECT_EQ(prototype.on_failure().count(), 40);
}

/**
 * @test Verify that limited_attempts counts the first attempt.
 */
TEST(rpc_policies, limited_attempts) {
  EXPECT_THROW(sesh::detail::limited_attempts(0), std::invalid_argument);
  EXPECT_THROW(sesh::detail::limited_attempts(-1), std::invalid_argument);

  EXPECT_NO_THROW(sesh::detail::limited_attempts(10));

  sesh::detail::limited_attempts policy(3);
  EXPECT_EQ(policy.maximum_attempts(), 3);
  EXPECT_TRUE(policy.on_failure());
  EXPECT_TRUE(policy.on_failure());
  EXPECT_FALSE(policy.on_failure());
  EXPECT_FALSE(policy.on_failure());

  auto copy = policy.clone();
  EXPECT_TRUE(copy->on_failure());

  sesh::detail::limited_attempts once(1);
  EXPECT_FALSE(once.on_failure());
}
