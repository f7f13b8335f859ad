#include "sesh/retry_executor.hpp"
#include <sesh/detail/rpc_policies.hpp>
#include <sesh/orchestrator_config.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace {
using namespace std::chrono_literals;

/// Create an executor that records the delays instead of sleeping.
sesh::retry_executor make_executor(int attempts, std::vector<std::chrono::milliseconds>& delays) {
  return sesh::retry_executor(
      std::unique_ptr<sesh::detail::rpc_retry_policy>(new sesh::detail::limited_attempts(attempts)),
      std::unique_ptr<sesh::detail::rpc_backoff_policy>(new sesh::detail::exponential_backoff(50ms, 2s, 2.0)),
      [&delays](std::chrono::milliseconds d) { delays.push_back(d); });
}
} // anonymous namespace

/**
 * @test Verify that a successful call is made once.
 */
TEST(retry_executor, success) {
  std::vector<std::chrono::milliseconds> delays;
  auto executor = make_executor(3, delays);
  int calls = 0;
  auto r = executor.run("test", [&calls]() {
    ++calls;
    return std::string("ok");
  });
  EXPECT_EQ(r, "ok");
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(delays.empty());
}

/**
 * @test Verify that transient failures are retried with exponential backoff.
 */
TEST(retry_executor, retries_transient_failures) {
  std::vector<std::chrono::milliseconds> delays;
  auto executor = make_executor(5, delays);
  int calls = 0;
  int attempts = 0;
  auto r = executor.run(
      "test",
      [&calls]() {
        if (++calls < 4) {
          throw sesh::session_error(sesh::error_code::unreachable, "backend down");
        }
        return 42;
      },
      attempts);
  EXPECT_EQ(r, 42);
  EXPECT_EQ(calls, 4);
  EXPECT_EQ(attempts, 4);
  ASSERT_EQ(delays.size(), 3UL);
  EXPECT_EQ(delays[0].count(), 50);
  EXPECT_EQ(delays[1].count(), 100);
  EXPECT_EQ(delays[2].count(), 200);
}

/**
 * @test Verify that the last failure is reported once the attempts are exhausted.
 */
TEST(retry_executor, exhausted) {
  std::vector<std::chrono::milliseconds> delays;
  auto executor = make_executor(3, delays);
  int calls = 0;
  int attempts = 0;
  try {
    executor.run(
        "test",
        [&calls]() {
          ++calls;
          throw sesh::session_error(sesh::error_code::remote_error, "boom " + std::to_string(calls));
        },
        attempts);
    FAIL() << "run() should have thrown";
  } catch (sesh::session_error const& ex) {
    EXPECT_EQ(ex.code(), sesh::error_code::remote_error);
    EXPECT_EQ(std::string(ex.what()), "boom 3");
  }
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(attempts, 3);
  EXPECT_EQ(delays.size(), 2UL);
}

/**
 * @test Verify that terminal failures are not retried.
 */
TEST(retry_executor, terminal_failures) {
  std::vector<std::chrono::milliseconds> delays;
  auto executor = make_executor(5, delays);
  for (auto code : {sesh::error_code::invalid_request, sesh::error_code::session_not_found,
                    sesh::error_code::pool_exhausted, sesh::error_code::invalid_release, sesh::error_code::cancelled}) {
    int calls = 0;
    try {
      executor.run("test", [&calls, code]() {
        ++calls;
        throw sesh::session_error(code, "terminal");
      });
      FAIL() << "run() should have thrown for " << code;
    } catch (sesh::session_error const& ex) {
      EXPECT_EQ(ex.code(), code);
    }
    EXPECT_EQ(calls, 1) << code;
  }
  EXPECT_TRUE(delays.empty());
}

/**
 * @test Verify that other exceptions are not retried.
 */
TEST(retry_executor, other_exceptions) {
  std::vector<std::chrono::milliseconds> delays;
  auto executor = make_executor(5, delays);
  int calls = 0;
  EXPECT_THROW(executor.run("test", [&calls]() { ++calls; throw std::runtime_error("not ours"); }), std::runtime_error);
  EXPECT_EQ(calls, 1);
}

/**
 * @test Verify that the retry state is fresh for each call.
 */
TEST(retry_executor, independent_calls) {
  std::vector<std::chrono::milliseconds> delays;
  auto executor = make_executor(2, delays);
  for (int i = 0; i != 3; ++i) {
    int calls = 0;
    executor.run("test", [&calls]() {
      if (++calls == 1) {
        throw sesh::session_error(sesh::error_code::unreachable, "once");
      }
    });
    EXPECT_EQ(calls, 2);
  }
  ASSERT_EQ(delays.size(), 3UL);
  for (auto d : delays) {
    EXPECT_EQ(d.count(), 50);
  }
}

/**
 * @test Verify that the executor uses the retry parameters in the configuration.
 */
TEST(retry_executor, from_config) {
  sesh::orchestrator_config config;
  config.retry_max_attempts = 4;
  config.retry_base_delay = 10ms;
  config.retry_multiplier = 3.0;
  config.retry_max_delay = 50ms;
  std::vector<std::chrono::milliseconds> delays;
  sesh::retry_executor executor(config, [&delays](std::chrono::milliseconds d) { delays.push_back(d); });

  int calls = 0;
  EXPECT_THROW(
      executor.run("test", [&calls]() { ++calls; throw sesh::session_error(sesh::error_code::unreachable, "down"); }),
      sesh::session_error);
  EXPECT_EQ(calls, 4);
  ASSERT_EQ(delays.size(), 3UL);
  EXPECT_EQ(delays[0].count(), 10);
  EXPECT_EQ(delays[1].count(), 30);
  EXPECT_EQ(delays[2].count(), 50);

  EXPECT_THROW(
      sesh::retry_executor(
          std::unique_ptr<sesh::detail::rpc_retry_policy>(),
          std::unique_ptr<sesh::detail::rpc_backoff_policy>(new sesh::detail::exponential_backoff(10ms, 20ms))),
      std::invalid_argument);
}
