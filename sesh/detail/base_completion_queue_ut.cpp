#include "sesh/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>
#include <future>
#include <thread>

namespace {
using namespace std::chrono_literals;

/// Wait up to half a second for @a fut to become ready.
template <typename future_type>
bool ready_soon(future_type& fut) {
  for (int i = 0; i != 10; ++i) {
    if (fut.wait_for(50ms) == std::future_status::ready) {
      return true;
    }
  }
  return false;
}
} // anonymous namespace

/**
 * @test Verify that we can run and shutdown a completion queue.
 */
TEST(base_completion_queue, run_shutdown) {
  sesh::detail::base_completion_queue queue;
  std::promise<void> started;
  auto loop = std::async(std::launch::async, [&queue, &started]() {
    started.set_value();
    queue.run();
  });

  auto started_fut = started.get_future();
  ASSERT_TRUE(ready_soon(started_fut));
  EXPECT_EQ(queue.pending_count(), 0UL);

  queue.shutdown();
  std::this_thread::sleep_for(sesh::detail::base_completion_queue::loop_timeout);
  ASSERT_TRUE(ready_soon(loop));
  loop.get();
}

/**
 * @test Verify that a queue shutdown before its loop starts does not block run().
 */
TEST(base_completion_queue, shutdown_before_run) {
  sesh::detail::base_completion_queue queue;
  queue.shutdown();
  auto loop = std::async(std::launch::async, [&queue]() { queue.run(); });
  ASSERT_TRUE(ready_soon(loop));
  loop.get();
  EXPECT_EQ(queue.pending_count(), 0UL);
}
