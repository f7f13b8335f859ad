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
#include "sesh/retry_executor.hpp"
#include <sesh/detail/rpc_policies.hpp>
#include <sesh/orchestrator_config.hpp>

#include <stdexcept>
#include <thread>

namespace {
sesh::retry_executor::sleeper_type default_sleeper(sesh::retry_executor::sleeper_type sleeper) {
  if (sleeper) {
    return sleeper;
  }
  return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}
} // anonymous namespace

namespace sesh {

retry_executor::retry_executor(
    std::unique_ptr<detail::rpc_retry_policy> retry_policy, std::unique_ptr<detail::rpc_backoff_policy> backoff_policy,
    sleeper_type sleeper)
    : retry_prototype_(std::move(retry_policy))
    , backoff_prototype_(std::move(backoff_policy))
    , sleeper_(default_sleeper(std::move(sleeper))) {
  if (not retry_prototype_ or not backoff_prototype_) {
    throw std::invalid_argument("retry_executor() - the retry and backoff policies are required");
  }
}

retry_executor::retry_executor(orchestrator_config const& config, sleeper_type sleeper)
    : retry_executor(
          std::unique_ptr<detail::rpc_retry_policy>(new detail::limited_attempts(config.retry_max_attempts)),
          std::unique_ptr<detail::rpc_backoff_policy>(new detail::exponential_backoff(
              config.retry_base_delay, config.retry_max_delay, config.retry_multiplier)),
          std::move(sleeper)) {
}

} // namespace sesh
