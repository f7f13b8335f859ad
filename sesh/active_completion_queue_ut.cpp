#include "sesh/active_completion_queue.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that sesh::active_completion_queue works as expected.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<sesh::active_completion_queue>();
  EXPECT_NO_THROW(shq.reset());

  EXPECT_NO_THROW(sesh::active_completion_queue());

  {
    sesh::active_completion_queue orig;
    sesh::active_completion_queue copy(std::move(orig));
    EXPECT_FALSE((bool)orig);
    EXPECT_TRUE((bool)copy);
  }

  {
    sesh::active_completion_queue orig;
    EXPECT_TRUE((bool)orig);
    sesh::active_completion_queue copy;
    EXPECT_TRUE((bool)copy);

    copy = std::move(orig);
    EXPECT_FALSE((bool)orig);
    EXPECT_TRUE((bool)copy);
  }

  auto cq = std::make_shared<sesh::completion_queue<>>();
  std::thread t([cq]() { cq->run(); });
  EXPECT_TRUE(t.joinable());

  {
    sesh::active_completion_queue owner(std::move(cq), std::move(t));
    EXPECT_TRUE((bool)owner);
    EXPECT_FALSE(t.joinable());
  }
}
