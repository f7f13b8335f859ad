#ifndef sesh_log_severity_hpp
#define sesh_log_severity_hpp
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
 * Define the log severity values and some macros associated with them.
 */

#include <iosfwd>
#include <string>

#ifndef SESH_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * The per-attempt and per-slot tracing in sesh is very chatty, with hundreds of concurrent calls it would dominate
 * the cost of a batch.  Messages below this level compile to no-op's, production builds pay nothing for them.
 */
#define SESH_MIN_SEVERITY debug
#endif // SESH_MIN_SEVERITY

namespace sesh {
/**
 * Define the severity levels for sesh logging.
 *
 * These are modelled after the severity level in syslog(1) and many derived tools.
 */
enum class severity {
  /// Slot transitions, limiter admissions, and other per-call events.
  trace,
  /// Debug messages that should not be present in production.
  debug,
  /// Normal progress, such as a retried call or a completed batch.
  info,
  /// Unusual, but expected conditions, such as a partially initialized pool.
  notice,
  /// A call failed terminally, users may need to take action.
  warning,
  /// An error has been detected.  Do not use for normal conditions, such as a backend rejecting a request.
  error,
  /// The system is in a critical state, such as running out of local resources.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(SESH_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert a severity name, as printed by operator<<, back to a severity.
 *
 * @throws std::invalid_argument if @a name is not one of the severity names.
 */
severity parse_severity(std::string const& name);

} // namespace sesh

#endif // sesh_log_severity_hpp
