#ifndef sesh_orchestrator_config_hpp
#define sesh_orchestrator_config_hpp
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

#include <sesh/log_severity.hpp>

#include <chrono>
#include <iosfwd>
#include <string>

namespace sesh {

/**
 * The tunable parameters of a session_manager and the command-line tools.
 *
 * The default constructor sets the defaults used by the tools.  Applications can change the fields directly, or
 * parse them from command-line flags with apply_flag(), and should call validate() before using the configuration.
 */
struct orchestrator_config {
  orchestrator_config();

  /// Check the configuration, raises std::invalid_argument describing the first problem found.
  void validate() const;

  /// The gRPC address of the backend, flag --backend-address.
  std::string backend_address;
  /// The deadline for each remote call, flag --call-timeout-ms.
  std::chrono::milliseconds call_timeout;
  /// The number of attempts for each remote call, counting the first one, flag --retry-max-attempts.
  int retry_max_attempts;
  /// The delay after the first failure, flag --retry-base-delay-ms.
  std::chrono::milliseconds retry_base_delay;
  /// The growth of the delay after each failure, flag --retry-multiplier.
  double retry_multiplier;
  /// The largest delay between attempts, flag --retry-max-delay-ms.
  std::chrono::milliseconds retry_max_delay;
  /// The number of remote calls in flight, flag --limiter-capacity.
  int limiter_capacity;
  /// The number of slots in the pools, flag --pool-capacity.
  int pool_capacity;
  /// How long a pool acquire waits, zero waits without bound, flag --pool-max-wait-ms.
  std::chrono::milliseconds pool_max_wait;
  /// The agent used by the tools, flag --agent-id.
  std::string agent_id;
  /// The run-time log threshold, flag --log-level.
  severity log_level;
};

/// Streaming operator, prints the configuration in the flag syntax.
std::ostream& operator<<(std::ostream& os, orchestrator_config const& x);

/**
 * Apply a command-line argument of the form @c --name=value to @a config.
 *
 * @returns true if @a arg is a configuration flag, false otherwise (the caller may handle it).
 * @throws std::invalid_argument if @a arg names a configuration flag but the value cannot be parsed.
 */
bool apply_flag(orchestrator_config& config, std::string const& arg);

} // namespace sesh

#endif // sesh_orchestrator_config_hpp
