#include "sesh/slot_state.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that the iostream operator for sesh::slot_state works as expected.
 */
TEST(slot_state, streaming) {
  std::ostringstream os;
  os << sesh::slot_state::empty << " " << sesh::slot_state::initializing << " " << sesh::slot_state::available << " "
     << sesh::slot_state::in_use;
  ASSERT_EQ(os.str(), "empty initializing available in_use");
}

/**
 * @test Verify that only the pool lifecycle transitions are accepted.
 */
TEST(slot_state, transitions) {
  using s = sesh::slot_state;
  s const all[] = {s::empty, s::initializing, s::available, s::in_use};
  int accepted = 0;
  for (auto from : all) {
    for (auto to : all) {
      if (sesh::valid_transition(from, to)) {
        ++accepted;
      }
    }
  }
  EXPECT_EQ(accepted, 7);

  EXPECT_TRUE(sesh::valid_transition(s::empty, s::initializing));
  EXPECT_TRUE(sesh::valid_transition(s::initializing, s::available));
  EXPECT_TRUE(sesh::valid_transition(s::initializing, s::empty));
  EXPECT_TRUE(sesh::valid_transition(s::available, s::in_use));
  EXPECT_TRUE(sesh::valid_transition(s::available, s::empty));
  EXPECT_TRUE(sesh::valid_transition(s::in_use, s::available));
  EXPECT_TRUE(sesh::valid_transition(s::in_use, s::empty));

  EXPECT_FALSE(sesh::valid_transition(s::empty, s::available));
  EXPECT_FALSE(sesh::valid_transition(s::empty, s::in_use));
  EXPECT_FALSE(sesh::valid_transition(s::initializing, s::in_use));
  EXPECT_FALSE(sesh::valid_transition(s::in_use, s::in_use));
  EXPECT_FALSE(sesh::valid_transition(s::available, s::available));
}
