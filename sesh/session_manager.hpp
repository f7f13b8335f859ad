#ifndef sesh_session_manager_hpp
#define sesh_session_manager_hpp
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

#include <sesh/batch_orchestrator.hpp>
#include <sesh/cancellation.hpp>
#include <sesh/concurrency_limiter.hpp>
#include <sesh/orchestrator_config.hpp>
#include <sesh/retry_executor.hpp>
#include <sesh/session_client.hpp>
#include <sesh/session_pool.hpp>

#include <memory>
#include <string>
#include <vector>

namespace sesh {

/**
 * The entry point to the sesh library.
 *
 * A session_manager owns the concurrency limiter and the retry executor for one backend, and uses them in every
 * call: the single-item operations, the batches, and the pools created by make_pool().  All the member functions are
 * safe to call from many threads.
 *
 * @code
 * sesh::orchestrator_config config;
 * sesh::session_manager manager(sesh::make_agent_sessions_client(config.backend_address, config.call_timeout), config);
 * auto s = manager.create_session(config.agent_id, sesh::make_user_state("Alice"));
 * std::cout << manager.send_message(s, "hello").text << std::endl;
 * manager.delete_session(s.id);
 * @endcode
 */
class session_manager {
public:
  /**
   * Create a manager for @a client.
   *
   * @param sleeper replaces the function used to wait between retries, only tests should need it.
   * @throws std::invalid_argument if @a client is null or @a config is invalid.
   */
  session_manager(
      std::shared_ptr<session_client> client, orchestrator_config config,
      retry_executor::sleeper_type sleeper = retry_executor::sleeper_type());

  session_manager(session_manager const&) = delete;
  session_manager& operator=(session_manager const&) = delete;

  /// Create a session, retrying transient failures.
  session create_session(std::string const& agent_id, session_state const& initial_state);

  /**
   * Send a message to @a s.
   *
   * On success the state cache in @a s is replaced with the state returned by the backend, if any.  On failure @a s is
   * marked stale and the error is raised.
   */
  message_reply send_message(session& s, std::string const& text);

  /// Delete a session, deleting an unknown session succeeds.
  void delete_session(std::string const& session_id);

  /// Fetch the backend view of a session.
  session get_session(std::string const& session_id);

  /// List the sessions of @a agent_id, all the sessions if it is empty.
  std::vector<session> list_sessions(std::string const& agent_id);

  /**
   * Replace the state cache of @a s with the backend view and clear its stale flag.
   *
   * On failure @a s is marked stale and the error is raised.
   */
  void refresh(session& s);

  //@{
  /// @name Batches, see sesh::batch_orchestrator.
  batch_result run_batch(std::vector<work_item> const& items);
  batch_result run_batch(std::vector<work_item> const& items, cancellation const& cancel);
  //@}

  /**
   * Create a pool that shares the limiter and retry policies of this manager.
   *
   * The pool is not initialized, and it must not outlive the manager.  The capacity and maximum wait come from the
   * configuration.
   */
  std::unique_ptr<session_pool> make_pool(std::string const& agent_id, session_state const& initial_state);

  /// Same as make_pool(agent_id, initial_state) with an explicit capacity.
  std::unique_ptr<session_pool> make_pool(
      std::string const& agent_id, session_state const& initial_state, int capacity);

  orchestrator_config const& config() const {
    return config_;
  }
  concurrency_limiter const& limiter() const {
    return limiter_;
  }
  session_client& client() {
    return *client_;
  }

private:
  /// Make a single-item call holding a limiter slot, retrying transient failures.
  template <typename Functor>
  auto call(char const* where, Functor&& f) -> decltype(f()) {
    limiter_slot slot(limiter_);
    return retry_.run(where, std::forward<Functor>(f));
  }

private:
  std::shared_ptr<session_client> client_;
  orchestrator_config config_;
  concurrency_limiter limiter_;
  retry_executor retry_;
};

} // namespace sesh

#endif // sesh_session_manager_hpp
