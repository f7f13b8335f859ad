#include "sesh/completion_queue.hpp"

#include <grpc++/alarm.h>
#include <gtest/gtest.h>

#include <thread>

namespace sesh {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
  static void* register_op(base_completion_queue& q, std::shared_ptr<base_async_op> op) {
    return q.register_op("test", std::move(op));
  }
};
} // namespace detail
} // namespace sesh

/**
 * @test Verify that sesh::completion_queue dispatches completed operations to their callbacks.
 */
TEST(completion_queue, basic) {
  using namespace std::chrono_literals;
  using test_only = sesh::detail::base_completion_queue_test_only;

  sesh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  std::atomic<int> cnt(0);
  auto op = std::make_shared<sesh::detail::base_async_op>();
  op->name = "test-op";
  op->callback = [&cnt](sesh::detail::base_async_op&, bool ok) {
    if (ok) {
      ++cnt;
    }
  };
  void* tag = test_only::register_op(queue, op);
  EXPECT_EQ(queue.pending_count(), 1UL);

  grpc::Alarm alarm(test_only::get_raw_queue(queue), std::chrono::system_clock::now() + 5ms, tag);

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(cnt.load(), 1);
  EXPECT_EQ(queue.pending_count(), 0UL);

  queue.shutdown();
  t.join();
}

/**
 * @test Make sure sesh::completion_queue handles unknown tags gracefully.
 */
TEST(completion_queue, error) {
  using namespace std::chrono_literals;
  using test_only = sesh::detail::base_completion_queue_test_only;

  sesh::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  grpc::CompletionQueue* cq = test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  auto op = std::make_shared<sesh::detail::base_async_op>();
  op->name = "alarm-after";
  op->callback = [&cnt](sesh::detail::base_async_op&, bool) { ++cnt; };
  grpc::Alarm al0(cq, std::chrono::system_clock::now() + 30ms, test_only::register_op(queue, op));
  // ... also set an earlier alarm with an unused nullptr tag ...
  grpc::Alarm al1(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  // ... and an alarm with a tag the queue does not know about ...
  grpc::Alarm al2(cq, std::chrono::system_clock::now() + 20ms, (void*)&cnt);

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(40ms);
  }
  ASSERT_EQ(cnt.load(), 1);

  queue.shutdown();
  t.join();
}
