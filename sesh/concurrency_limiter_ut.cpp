#include "sesh/concurrency_limiter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

/**
 * @test Verify the basic accounting in sesh::concurrency_limiter.
 */
TEST(concurrency_limiter, basic) {
  EXPECT_THROW(sesh::concurrency_limiter(0), std::invalid_argument);
  EXPECT_THROW(sesh::concurrency_limiter(-3), std::invalid_argument);

  sesh::concurrency_limiter limiter(2);
  EXPECT_EQ(limiter.capacity(), 2);
  EXPECT_EQ(limiter.in_flight(), 0);

  limiter.acquire();
  limiter.acquire();
  EXPECT_EQ(limiter.in_flight(), 2);
  EXPECT_EQ(limiter.high_water_mark(), 2);

  limiter.release();
  EXPECT_EQ(limiter.in_flight(), 1);
  limiter.release();
  EXPECT_EQ(limiter.in_flight(), 0);
  EXPECT_EQ(limiter.high_water_mark(), 2);

  // ... releasing without an acquire is a bug ...
  EXPECT_THROW(limiter.release(), std::logic_error);
  EXPECT_EQ(limiter.in_flight(), 0);
}

/**
 * @test Verify that acquire() blocks until a slot is released.
 */
TEST(concurrency_limiter, blocks_when_full) {
  using namespace std::chrono_literals;
  sesh::concurrency_limiter limiter(1);
  limiter.acquire();

  std::promise<void> acquired;
  std::thread t([&limiter, &acquired]() {
    limiter.acquire();
    acquired.set_value();
    limiter.release();
  });

  auto fut = acquired.get_future();
  EXPECT_EQ(fut.wait_for(50ms), std::future_status::timeout);
  limiter.release();
  EXPECT_EQ(fut.wait_for(2s), std::future_status::ready);
  t.join();
  EXPECT_EQ(limiter.in_flight(), 0);
}

/**
 * @test Verify that the limiter never admits more than its capacity.
 */
TEST(concurrency_limiter, never_exceeds_capacity) {
  using namespace std::chrono_literals;
  int const capacity = 3;
  sesh::concurrency_limiter limiter(capacity);

  std::atomic<int> current(0);
  std::atomic<int> observed_max(0);
  std::vector<std::thread> workers;
  for (int i = 0; i != 12; ++i) {
    workers.emplace_back([&]() {
      for (int j = 0; j != 5; ++j) {
        sesh::limiter_slot slot(limiter);
        int now = ++current;
        int prev = observed_max.load();
        while (now > prev and not observed_max.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(1ms);
        --current;
      }
    });
  }
  for (auto& t : workers) {
    t.join();
  }
  EXPECT_LE(observed_max.load(), capacity);
  EXPECT_LE(limiter.high_water_mark(), capacity);
  EXPECT_EQ(limiter.in_flight(), 0);
}

/**
 * @test Verify that sesh::limiter_slot releases on every exit path.
 */
TEST(concurrency_limiter, limiter_slot) {
  sesh::concurrency_limiter limiter(1);
  {
    sesh::limiter_slot slot(limiter);
    EXPECT_TRUE((bool)slot);
    EXPECT_EQ(limiter.in_flight(), 1);
  }
  EXPECT_EQ(limiter.in_flight(), 0);

  try {
    sesh::limiter_slot slot(limiter);
    throw std::runtime_error("boom");
  } catch (std::runtime_error const&) {
  }
  EXPECT_EQ(limiter.in_flight(), 0);
}

/**
 * @test Verify that a cancellable acquire() stops waiting once the signal is raised.
 */
TEST(concurrency_limiter, cancelled_acquire) {
  using namespace std::chrono_literals;
  sesh::concurrency_limiter limiter(1);
  sesh::cancellation cancel;

  // ... with free slots and no signal the acquire succeeds ...
  {
    sesh::limiter_slot slot(limiter, cancel);
    EXPECT_TRUE((bool)slot);

    // ... a second caller blocks until cancelled ...
    std::promise<bool> result;
    std::thread t([&limiter, &cancel, &result]() { result.set_value(limiter.acquire(cancel)); });
    auto fut = result.get_future();
    EXPECT_EQ(fut.wait_for(50ms), std::future_status::timeout);
    cancel.cancel();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(fut.get());
    t.join();
    EXPECT_EQ(limiter.in_flight(), 1);
  }
  EXPECT_EQ(limiter.in_flight(), 0);

  // ... once cancelled no slot is given, even if free ...
  sesh::limiter_slot slot(limiter, cancel);
  EXPECT_FALSE((bool)slot);
  EXPECT_EQ(limiter.in_flight(), 0);
}
