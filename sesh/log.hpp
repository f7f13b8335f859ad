#ifndef sesh_log_hpp
#define sesh_log_hpp
//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
/**
 * @file
 *
 * Define macros, types, and functions for logging in sesh.
 */
#include <sesh/detail/null_stream.hpp>
#include <sesh/log_severity.hpp>
#include <sesh/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define SESH_PP_CAT(a, b) a##b

/**
 * Create a unique, or mostly-likely unique identifier.
 *
 * SESH_LOG() needs an identifier for the logger that does not collide with the names used by the caller.  Use an
 * identifier that depends on the line number.
 */
#define SESH_LOGGER_IDENTIFIER SESH_PP_CAT(sesh_log_, __LINE__)

/**
 * The main entry point for sesh logging facilities.
 *
 * Typically this used only in tests, applications should use SESH_LOG().
 */
#define SESH_LOG_I(level, sink)                                                                                        \
  for (auto SESH_LOGGER_IDENTIFIER = sesh::logger<sesh::level_compile_time_disabled(sesh::severity::level)>(           \
           sesh::severity::level, __func__, __FILE__, __LINE__, sink);                                                 \
       (bool)SESH_LOGGER_IDENTIFIER; SESH_LOGGER_IDENTIFIER.write_to(sink))                                            \
  SESH_LOGGER_IDENTIFIER.get()

/**
 * Declare a logger named @a name.
 */
#define SESH_LOGGER_DECL(level, sink, name)                                                                            \
  sesh::logger<sesh::level_compile_time_disabled(sesh::severity::level)> name(                                         \
      sesh::severity::level, __func__, __FILE__, __LINE__, sink)

#ifndef SESH_LOG
#define SESH_LOG(level) SESH_LOG_I(level, sesh::log::instance())
#endif // SESH_LOG

/**
 * The main namespace for the sesh library.
 */
namespace sesh {
/**
 * The logging framework core.
 *
 * Every component in sesh logs (retries, slot transitions, batch summaries) but none of them should know where the
 * messages end up.  Passing a logger to each component would make every constructor longer for little benefit, so
 * the core is a singleton that holds a list of sinks.  Tests create their own instance and use SESH_LOG_I().
 */
class log {
public:
  /// Normally use @c sesh::log::instance(), this is useful in testing.
  log()
      : min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// Return the singleton instance
  static log& instance();

  /// Add a new sink to the core.
  void add_sink(std::shared_ptr<log_sink> sink);

  /// Remove a sink previously added with add_sink(), no-op if the sink is not present.
  void remove_sink(std::shared_ptr<log_sink> const& sink);

  /// Remove all the current log sinks from the core.
  void clear_sinks();

  /// Write a new log message
  void write(severity sev, std::string&& msg);

  /// Set the minimum severity for the following messages, notice that each sink can implement its own filtering.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  /// Return the minimum severity for run-time filtering
  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  /// A mutex to protect access to the shared state
  mutable std::mutex mu_;
  /// The minimum run-time severity
  severity min_severity_;
  /// The list of sinks
  std::vector<std::shared_ptr<log_sink>> sinks_;

  /// The single instance used in the program ...
  static std::unique_ptr<log> singleton_;
};

/**
 * A compile-time disabled log message container.
 *
 * The generic version creates a message container that contains nothing.  All streaming operations are
 * no-op's.  See @c detail::null_stream for more information.
 *
 * @tparam disabled if true, use a compile-time-disabled logger, which does not log anything.
 */
template <bool disabled>
class logger {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink) {
  }

  explicit operator bool() const {
    return false;
  }

  /// Get the sesh::detail::null_stream to consume the iostream expression.
  detail::null_stream& get() {
    return os;
  }

  void write_to(log& sink) {
  }

private:
  detail::null_stream os;
};

/**
 * A simple log message container.
 *
 * This specialization formats the message in a std::ostringstream and then sends it to the configured sinks, if any.
 */
template <>
class logger<false> {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink);

  explicit operator bool() const {
    return not closed;
  }

  /// Get the std::ostream where the message will be formatted.
  std::ostream& get() {
    return os;
  }

  /// Save the message to the log sink
  void write_to(sesh::log& sink);

private:
  std::ostringstream os;
  severity sev;
  std::string function;
  std::string filename;
  int lineno;
  bool closed;
};

/**
 * Determine if a given severity level is disabled at compile-time.
 *
 * @param lvl the severity level to check.
 * @returns true if @a lvl is disabled at compile-time.
 */
bool constexpr level_compile_time_disabled(severity lvl) {
  return lvl < sesh::severity::SESH_MIN_SEVERITY;
}
} // namespace sesh

#endif // sesh_log_hpp
