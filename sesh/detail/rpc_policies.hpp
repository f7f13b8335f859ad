#ifndef sesh_detail_rpc_policies_hpp
#define sesh_detail_rpc_policies_hpp
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

#include <sesh/detail/rpc_backoff_policy.hpp>
#include <sesh/detail/rpc_retry_policy.hpp>

#include <stdexcept>

namespace sesh {
namespace detail {
/**
 * Wait min_delay after the first failure, and multiply the delay after each failure, up to max_delay.
 */
class exponential_backoff : public rpc_backoff_policy {
public:
  template <typename min_duration_type, typename max_duration_type>
  exponential_backoff(min_duration_type min_delay, max_duration_type max_delay, double multiplier = 2.0)
      : min_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(min_delay))
      , max_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(max_delay))
      , multiplier_(multiplier)
      , current_delay_(min_delay_) {
    validate_arguments();
  }

  std::chrono::milliseconds on_failure() override;
  std::unique_ptr<rpc_backoff_policy> clone() const override;

private:
  void validate_arguments();

private:
  std::chrono::milliseconds min_delay_;
  std::chrono::milliseconds max_delay_;
  double multiplier_;
  std::chrono::milliseconds current_delay_;
};

/**
 * Allow a fixed number of attempts, counting the first one.
 *
 * With @c limited_attempts(3) a call is tried once, and retried at most twice.
 */
class limited_attempts : public rpc_retry_policy {
public:
  explicit limited_attempts(int maximum_attempts)
      : maximum_attempts_(maximum_attempts)
      , attempts_(0) {
    validate_arguments();
  }

  bool on_failure() override;
  std::unique_ptr<rpc_retry_policy> clone() const override;

  int maximum_attempts() const {
    return maximum_attempts_;
  }

private:
  void validate_arguments();

private:
  int maximum_attempts_;
  int attempts_;
};
} // namespace detail
} // namespace sesh

#endif // sesh_detail_rpc_policies_hpp
