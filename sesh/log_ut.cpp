#include "sesh/log.hpp"

#include <gmock/gmock.h>

#include <thread>

namespace {
/// A sink that appends to a vector, shared by most of the tests.
std::shared_ptr<sesh::log_sink> capture(std::vector<std::pair<sesh::severity, std::string>>& logs) {
  return sesh::make_log_sink(
      [&logs](sesh::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that the SESH_LOG_I() and the supporting classes all work in the normal case.
 */
TEST(log, basic) {
  sesh::log lg;
  // First what basically amounts to a compilation test
  ASSERT_NO_THROW(SESH_LOG_I(error, lg) << "foo" << 4 << 2);
  std::vector<std::pair<sesh::severity, std::string>> logs;
  lg.add_sink(capture(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(SESH_LOG_I(error, lg) << "testing 123"
                                        << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, sesh::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  ASSERT_THAT(logs[0].second, HasSubstr("(log_ut.cpp:"));
}

/**
 * @test Verify that the SESH_LOG_I() and the supporting classes all work when a log level is disabled.
 */
TEST(log, run_time_disable) {
  sesh::log lg;
  std::vector<std::pair<sesh::severity, std::string>> logs;
  lg.add_sink(capture(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(SESH_LOG_I(info, lg) << "testing 123"
                                       << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, sesh::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));

  logs.clear();
  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(sesh::severity::warning);
  ASSERT_NO_THROW(SESH_LOG_I(info, lg) << "testing 123"
                                       << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  // ... also verify that disabled expressions are not even called ...
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
  ASSERT_EQ(cnt, 1);
}

/**
 * @test Verify that the SESH_LOG_I() and the supporting classes all work when a log level is disabled at
 * compile-time.
 */
TEST(log, compile_time_disable) {
  sesh::log lg;
  std::vector<std::pair<sesh::severity, std::string>> logs;
  lg.add_sink(capture(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... use a level that is enabled at runtime, but disabled at compile-time ...
  lg.min_severity(sesh::severity::trace);
  ASSERT_TRUE(sesh::level_compile_time_disabled(sesh::severity::trace));
  ASSERT_NO_THROW(SESH_LOG_I(trace, lg) << "testing 123"
                                        << " " << f());
  ASSERT_EQ(logs.size(), 0UL);
  ASSERT_EQ(cnt, 0);
  ASSERT_EQ(f(), 42);
}

/**
 * @test Verify that the SESH_LOG() macro and the supporting singleton work as expected.
 */
TEST(log, instance_basic) {
  sesh::log& lg = sesh::log::instance();
  std::vector<std::pair<sesh::severity, std::string>> logs;
  auto sink = capture(logs);
  lg.add_sink(sink);

  using namespace ::testing;
  ASSERT_NO_THROW(SESH_LOG(info) << "testing 123 " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_EQ(logs[0].first, sesh::severity::info);
  ASSERT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));
  ASSERT_NO_THROW(lg.remove_sink(sink));

  ASSERT_NO_THROW(SESH_LOG(info) << "not captured");
  ASSERT_EQ(logs.size(), 1UL);
}

/**
 * @test Verify that the SESH_LOG_I() and the supporting classes work with multiple sinks.
 */
TEST(log, multiple_sinks) {
  sesh::log lg;
  std::vector<std::pair<sesh::severity, std::string>> logs;
  auto first = capture(logs);
  lg.add_sink(first);
  lg.add_sink(sesh::make_log_sink([&logs](sesh::severity sev, std::string&& msg) {
    auto s = std::string("(2) ") + msg;
    logs.emplace_back(sev, std::move(s));
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(SESH_LOG_I(error, lg) << "testing 123"
                                        << " " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  ASSERT_EQ(logs[0].first, sesh::severity::error);
  ASSERT_EQ(logs[1].first, sesh::severity::error);
  ASSERT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  ASSERT_THAT(logs[1].second, StartsWith("(2) [error] testing 123 42"));

  // ... removing one sink leaves the other in place ...
  logs.clear();
  lg.remove_sink(first);
  ASSERT_NO_THROW(SESH_LOG_I(error, lg) << "again");
  ASSERT_EQ(logs.size(), 1UL);
  ASSERT_THAT(logs[0].second, StartsWith("(2) [error] again"));

  logs.clear();
  lg.clear_sinks();
  ASSERT_NO_THROW(SESH_LOG_I(error, lg) << "nobody listens");
  ASSERT_EQ(logs.size(), 0UL);
}

/**
 * @test Verify that messages from concurrent threads are all delivered.
 */
TEST(log, concurrent_writers) {
  sesh::log lg;
  std::mutex mu;
  int count = 0;
  lg.add_sink(sesh::make_log_sink([&mu, &count](sesh::severity, std::string&&) {
    std::lock_guard<std::mutex> lock(mu);
    ++count;
  }));

  std::vector<std::thread> writers;
  for (int i = 0; i != 8; ++i) {
    writers.emplace_back([&lg, i]() {
      for (int j = 0; j != 50; ++j) {
        SESH_LOG_I(info, lg) << "writer " << i << " message " << j;
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }
  ASSERT_EQ(count, 400);
}

/**
 * @test Complete code coverage for the sesh::logger<true> class.
 */
TEST(log, logger_disabled) {
  // In the normal operation of the sesh::logger<true> class neither the get() nor the write_to() member functions are
  // ever used, they are needed to make sure the code compiles.  Make sure they are no-op's:
  sesh::log lg;
  std::vector<std::pair<sesh::severity, std::string>> logs;
  lg.add_sink(capture(logs));
  sesh::logger<true> logger(sesh::severity::error, __func__, __FILE__, __LINE__, lg);

  ASSERT_EQ((bool)logger, false);
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(logger.get()), sesh::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}

/**
 * @test Verify that sesh::logger<false> reports only the file name, not the directories, of the source location.
 */
TEST(log, logger_file_name) {
  sesh::log lg;
  std::vector<std::pair<sesh::severity, std::string>> logs;
  lg.add_sink(capture(logs));

  sesh::logger<false> nested(sesh::severity::warning, "fill", "/src/sesh/session_pool.cpp", 42, lg);
  nested.get() << "nested";
  nested.write_to(lg);
  sesh::logger<false> flat(sesh::severity::warning, "run", "batch_orchestrator.cpp", 7, lg);
  flat.get() << "flat";
  flat.write_to(lg);

  using namespace ::testing;
  ASSERT_EQ(logs.size(), 2U);
  EXPECT_THAT(logs[0].second, EndsWith(" in fill(session_pool.cpp:42)"));
  EXPECT_THAT(logs[1].second, EndsWith(" in run(batch_orchestrator.cpp:7)"));
  EXPECT_EQ((bool)flat, false);
}
