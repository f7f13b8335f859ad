#ifndef sesh_batch_orchestrator_hpp
#define sesh_batch_orchestrator_hpp
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

#include <sesh/cancellation.hpp>
#include <sesh/concurrency_limiter.hpp>
#include <sesh/retry_executor.hpp>
#include <sesh/session_client.hpp>
#include <sesh/work_item.hpp>

#include <thread>
#include <vector>

namespace sesh {

/**
 * Run collections of remote operations with bounded concurrency.
 *
 * A batch runs on a set of worker threads, at most as many as the limiter capacity.  The workers take the items in
 * order, and each item holds a limiter slot while it runs through the retry executor, so the limiter (which may be
 * shared with other batches and pools) bounds the calls in flight.  A failed item never stops the other items: the
 * failure is recorded in its outcome, and run_batch() returns once every item has an outcome.
 *
 * The orchestrator holds references only, the client, limiter and executor must outlive it.
 */
class batch_orchestrator {
public:
  batch_orchestrator(session_client& client, concurrency_limiter& limiter, retry_executor const& retry)
      : client_(client)
      , limiter_(limiter)
      , retry_(retry) {
  }

  /// Run all the items and return their outcomes in item order.
  batch_result run_batch(std::vector<work_item> const& items);

  /**
   * Run the items until @a cancel is raised.
   *
   * Once @a cancel is raised no more items are started, the items already started run to completion.  The items
   * never started fail with error_code::cancelled.
   */
  batch_result run_batch(std::vector<work_item> const& items, cancellation const& cancel);

private:
  /// Run one admitted item, the caller holds a limiter slot.
  void execute(work_item const& item, work_outcome& outcome);

  /// Join the worker threads on every exit path.
  struct defer_join {
    explicit defer_join(std::vector<std::thread>& t)
        : threads(t) {
    }
    ~defer_join();
    std::vector<std::thread>& threads;
  };

private:
  session_client& client_;
  concurrency_limiter& limiter_;
  retry_executor const& retry_;
};

} // namespace sesh

#endif // sesh_batch_orchestrator_hpp
