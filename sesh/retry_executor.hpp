#ifndef sesh_retry_executor_hpp
#define sesh_retry_executor_hpp
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
#include <sesh/log.hpp>
#include <sesh/session_error.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace sesh {
struct orchestrator_config;

/**
 * Run a remote call, retrying the transient failures.
 *
 * Each run() clones the retry and backoff policies, so the executor itself holds no per-call state and is safe to
 * share between threads.  Failures classified as retryable (see sesh::is_retryable) are retried while the retry
 * policy allows it, sleeping for the delay the backoff policy returns.  The sleep blocks only the calling thread.
 * Terminal failures, and the last failure once the attempts are exhausted, are rethrown.
 */
class retry_executor {
public:
  /// The function used to wait between attempts, tests replace it to avoid real delays.
  using sleeper_type = std::function<void(std::chrono::milliseconds)>;

  retry_executor(
      std::unique_ptr<detail::rpc_retry_policy> retry_policy, std::unique_ptr<detail::rpc_backoff_policy> backoff_policy,
      sleeper_type sleeper = sleeper_type());

  /// Create an executor using the retry parameters in @a config.
  explicit retry_executor(orchestrator_config const& config, sleeper_type sleeper = sleeper_type());

  /**
   * Call @a f until it succeeds, fails with a terminal error, or the retry policy is exhausted.
   *
   * @param where a description of the call, used in the log messages.
   * @param f the call, it reports failures by throwing sesh::session_error.
   * @returns the value returned by @a f.
   */
  template <typename Functor>
  auto run(char const* where, Functor&& f) const -> decltype(f()) {
    int attempts = 0;
    return run(where, std::forward<Functor>(f), attempts);
  }

  /**
   * Same as run(where, f), reports the number of attempts made in @a attempts, on success and on failure.
   */
  template <typename Functor>
  auto run(char const* where, Functor&& f, int& attempts) const -> decltype(f()) {
    auto retry = retry_prototype_->clone();
    auto backoff = backoff_prototype_->clone();
    attempts = 0;
    while (true) {
      ++attempts;
      try {
        return f();
      } catch (session_error const& ex) {
        if (not ex.retryable()) {
          SESH_LOG(warning) << where << " failed with a terminal error after " << attempts
                            << " attempt(s): " << ex.what();
          throw;
        }
        if (not retry->on_failure()) {
          SESH_LOG(warning) << where << " giving up after " << attempts << " attempt(s): " << ex.what();
          throw;
        }
        auto delay = backoff->on_failure();
        SESH_LOG(info) << where << " attempt " << attempts << " failed [" << ex.code() << "], retrying in "
                       << delay.count() << "ms: " << ex.what();
        sleeper_(delay);
      }
    }
  }

private:
  std::unique_ptr<detail::rpc_retry_policy> retry_prototype_;
  std::unique_ptr<detail::rpc_backoff_policy> backoff_prototype_;
  sleeper_type sleeper_;
};

} // namespace sesh

#endif // sesh_retry_executor_hpp
