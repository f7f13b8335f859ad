#ifndef sesh_detail_rpc_backoff_policy_hpp
#define sesh_detail_rpc_backoff_policy_hpp
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

#include <chrono>
#include <memory>

namespace sesh {
namespace detail {
/**
 * Define the interface for a backoff strategy.
 *
 * A retried call waits before the next attempt, this interface lets the application pace the attempts.  The default
 * is an exponential backoff with a ceiling, which keeps a burst of failing calls from hammering a backend that is
 * already in trouble.
 */
class rpc_backoff_policy {
public:
  virtual ~rpc_backoff_policy() = default;

  /**
   * Report a failure to the backoff strategy.
   *
   * @returns the delay the application should use before trying again.
   */
  virtual std::chrono::milliseconds on_failure() = 0;

  /// Create a copy of this policy
  virtual std::unique_ptr<rpc_backoff_policy> clone() const = 0;
};
} // namespace detail
} // namespace sesh

#endif // sesh_detail_rpc_backoff_policy_hpp
