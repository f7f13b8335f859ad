#include "sesh/log_sink.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <thread>
#include <vector>

/**
 * @test Verify that the sesh::make_log_sink works as expected.
 */
TEST(log_sink, basic) {
  std::string value;
  sesh::severity sev;
  auto ls = sesh::make_log_sink([&value, &sev](sesh::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(sesh::severity::info, std::string("testing 1 2 3"));
  ASSERT_EQ(sev, sesh::severity::info);
  ASSERT_EQ(value, "testing 1 2 3");
}

/**
 * @test Verify that sesh::make_stream_sink writes whole lines, even from many threads.
 */
TEST(log_sink, stream_sink) {
  std::ostringstream os;
  auto ls = sesh::make_stream_sink(os);

  std::vector<std::thread> writers;
  for (int i = 0; i != 4; ++i) {
    writers.emplace_back([ls]() {
      for (int j = 0; j != 25; ++j) {
        ls->log(sesh::severity::info, std::string("abcdefgh"));
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }

  std::istringstream is(os.str());
  std::string line;
  int count = 0;
  while (std::getline(is, line)) {
    ASSERT_EQ(line, "abcdefgh");
    ++count;
  }
  ASSERT_EQ(count, 100);
}
