#include "sesh/assert_throw.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

/**
 * @test Verify that SESH_ASSERT_THROW() works as expected.
 */
TEST(assert_throw, basic) {
  ASSERT_THROW(sesh::assert_throw_impl("foo", "bar()", "bar.cc", 20), std::logic_error);

  ASSERT_THROW(SESH_ASSERT_THROW(false), std::logic_error);
  ASSERT_NO_THROW(SESH_ASSERT_THROW(true));

  try {
    int in_flight = 0;
    SESH_ASSERT_THROW(in_flight > 0);
    FAIL() << "exception expected";
  } catch (std::logic_error const& ex) {
    EXPECT_NE(std::string(ex.what()).find("(in_flight > 0)"), std::string::npos);
  }
}
