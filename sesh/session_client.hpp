#ifndef sesh_session_client_hpp
#define sesh_session_client_hpp
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

#include <sesh/session.hpp>

#include <string>
#include <vector>

namespace sesh {
/**
 * The operations a backend hosting agent sessions offers.
 *
 * Every operation is a blocking call bounded by the implementation's per-call timeout, and reports failures with
 * sesh::session_error.  Implementations must be safe to call from many threads at the same time, the orchestration
 * layer issues calls concurrently from its worker threads.
 *
 * The interface is also the seam for tests: the core components (retry, pool, batches) run against
 * sesh::detail::fake_session_client in the unit tests.
 */
class session_client {
public:
  virtual ~session_client() = default;

  /**
   * Create a new session for @a agent_id seeded with @a initial_state.
   *
   * @returns the new session, with the id assigned by the backend, never empty, and the creation time reported by
   *   the backend.
   * @throws session_error with @c invalid_request if the agent id is empty, or the backend rejects the request,
   *   @c unreachable or @c remote_error for transport and backend failures.
   */
  virtual session create_session(std::string const& agent_id, session_state const& initial_state) = 0;

  /**
   * Send @a text to the session @a session_id and return the agent response.
   *
   * @throws session_error with @c session_not_found if the session does not exist, @c invalid_request if the id or
   *   the text are empty, @c unreachable or @c remote_error for transport and backend failures.
   */
  virtual message_reply send_message(std::string const& session_id, std::string const& text) = 0;

  /**
   * Delete the session @a session_id.
   *
   * Deleting an unknown, or already deleted, session succeeds.
   */
  virtual void delete_session(std::string const& session_id) = 0;

  /// Return the backend view of a session, @c session_not_found if it does not exist.
  virtual session get_session(std::string const& session_id) = 0;

  /// List the sessions of @a agent_id, or all the sessions if @a agent_id is empty.
  virtual std::vector<session> list_sessions(std::string const& agent_id) = 0;
};

} // namespace sesh

#endif // sesh_session_client_hpp
