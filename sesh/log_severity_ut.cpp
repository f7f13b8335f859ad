#include "sesh/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

TEST(log_severity, base) {
  ASSERT_LT(sesh::severity::LOWEST, sesh::severity::HIGHEST);

  using s = sesh::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error << " "
     << s::critical << " " << s::alert << " " << s::fatal;
  ASSERT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}

/**
 * @test Verify that sesh::parse_severity() accepts every name the streaming operator produces.
 */
TEST(log_severity, parse) {
  using s = sesh::severity;
  for (int i = int(s::LOWEST); i <= int(s::HIGHEST); ++i) {
    std::ostringstream os;
    os << s(i);
    EXPECT_EQ(sesh::parse_severity(os.str()), s(i));
  }
  EXPECT_THROW(sesh::parse_severity("verbose"), std::invalid_argument);
  EXPECT_THROW(sesh::parse_severity(""), std::invalid_argument);
  EXPECT_THROW(sesh::parse_severity("INFO"), std::invalid_argument);
}
