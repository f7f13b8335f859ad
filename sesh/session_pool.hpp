#ifndef sesh_session_pool_hpp
#define sesh_session_pool_hpp
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

#include <sesh/concurrency_limiter.hpp>
#include <sesh/retry_executor.hpp>
#include <sesh/session_client.hpp>
#include <sesh/slot_state.hpp>
#include <sesh/work_item.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace sesh {

/**
 * Keep a set of pre-created sessions ready for immediate use.
 *
 * The pool has a fixed number of slots, each holds at most one session and follows the sesh::slot_state machine.
 * initialize() fills the empty slots by creating sessions concurrently, through the limiter and the retry executor.
 * Callers take a session with acquire(), and must give it back with release().  drain() deletes the sessions when the
 * pool is no longer needed, sessions in use at that time are deleted when released.
 *
 * All the slot changes happen under a single mutex, the remote calls are made without holding it.  The pool holds
 * references to the client, limiter and retry executor, they must outlive the pool.
 *
 * @code
 * sesh::session_pool pool(client, limiter, retry, "agent", sesh::make_user_state("guest"), 5);
 * std::cout << pool.initialize(5) << std::endl;
 * auto s = pool.acquire();
 * // ... use s.id ...
 * pool.release(s);
 * pool.drain();
 * @endcode
 */
class session_pool {
public:
  /**
   * Create an empty pool.
   *
   * @param agent_id the agent for the sessions in the pool.
   * @param initial_state the state of each new session.
   * @param capacity the number of slots.
   * @param max_wait how long acquire() waits for a session, zero waits without bound.
   */
  session_pool(
      session_client& client, concurrency_limiter& limiter, retry_executor const& retry, std::string agent_id,
      session_state initial_state, int capacity, std::chrono::milliseconds max_wait = std::chrono::milliseconds(0));
  ~session_pool();

  session_pool(session_pool const&) = delete;
  session_pool& operator=(session_pool const&) = delete;

  /**
   * Bring the number of live slots up to @a size, creating the sessions concurrently.
   *
   * Live slots are those initializing, available or in use.  The slots whose creation fails stay empty, their
   * failures are reported in the result, a partial pool is not an error.  Calling initialize() after drain() makes
   * the pool usable again.
   *
   * @throws std::invalid_argument if @a size is negative or larger than the capacity.
   */
  batch_result initialize(int size);

  /**
   * Take an available session, blocking until one is available.
   *
   * @throws session_error with error_code::pool_exhausted if a maximum wait is configured and no session became
   *   available in time.
   */
  session acquire();

  /**
   * Return a session taken with acquire().
   *
   * The state cache and stale flag of @a s are stored in the slot, so the next acquire() sees them.  If the pool is
   * draining the session is deleted instead, and any failure to delete it is raised.
   *
   * Each acquire() hands out a new lease, only the copy returned by the current acquisition of a slot can release it.
   * Releasing a copy twice fails, even if another caller acquired the same session in the meantime.
   *
   * @throws session_error with error_code::invalid_release if @a s is not in use, does not belong to this pool, or
   *   was returned by an earlier acquisition.
   */
  void release(session const& s);

  /**
   * Delete all the available sessions, and mark the pool as draining.
   *
   * @returns the outcome of each delete.
   */
  batch_result drain();

  //@{
  /// @name Observers
  int capacity() const {
    return static_cast<int>(slots_.size());
  }
  int available_count() const;
  int in_use_count() const;
  std::vector<slot_state> slot_states() const;
  bool draining() const;
  //@}

private:
  struct slot {
    slot_state state;
    session value;
  };

  /// Change the state of a slot, must be called with mu_ held.
  void transition(int index, slot_state to);

  /// Count the slots in state @a s, must be called with mu_ held.
  int count(slot_state s) const;

private:
  session_client& client_;
  concurrency_limiter& limiter_;
  retry_executor const& retry_;
  std::string agent_id_;
  session_state initial_state_;
  std::chrono::milliseconds max_wait_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<slot> slots_;
  bool draining_;
  std::uint64_t last_lease_;
};

} // namespace sesh

#endif // sesh_session_pool_hpp
