#ifndef sesh_detail_fake_session_client_hpp
#define sesh_detail_fake_session_client_hpp
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

#include <sesh/session_client.hpp>
#include <sesh/session_error.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace sesh {
namespace detail {

/**
 * An in-process sesh::session_client for the unit tests.
 *
 * Keeps the sessions in a map and assigns them the ids @c fake-1, @c fake-2, and so on.  It is safe to call from
 * many threads, and it records the number of calls in flight, so tests can verify the concurrency limits.
 *
 * Failures can be scripted:
 * - fail_next() makes the next calls (of any kind) fail with the given code, use a retryable code to simulate
 *   transient failures.
 * - fail_session() makes every call on one session fail with the given code.
 * - fail_agent() makes every create for one agent fail with the given code.
 */
class fake_session_client : public session_client {
public:
  fake_session_client();

  session create_session(std::string const& agent_id, session_state const& initial_state) override;
  message_reply send_message(std::string const& session_id, std::string const& text) override;
  void delete_session(std::string const& session_id) override;
  session get_session(std::string const& session_id) override;
  std::vector<session> list_sessions(std::string const& agent_id) override;

  //@{
  /// @name Failure and latency scripts
  void fail_next(int count, error_code code = error_code::unreachable);
  void fail_session(std::string const& session_id, error_code code);
  void fail_agent(std::string const& agent_id, error_code code);
  void latency(std::chrono::milliseconds delay);
  //@}

  //@{
  /// @name Instrumentation
  int in_flight() const;
  int high_water_mark() const;
  int create_calls() const;
  int message_calls() const;
  int delete_calls() const;
  int total_calls() const;
  std::size_t session_count() const;
  bool has_session(std::string const& session_id) const;
  //@}

private:
  /// Track a call in flight, applies the latency and the failure scripts on entry.
  class call_scope {
  public:
    call_scope(fake_session_client& client, int& counter, std::string const& target);
    ~call_scope();

    call_scope(call_scope const&) = delete;
    call_scope& operator=(call_scope const&) = delete;

  private:
    fake_session_client& client_;
  };

  struct stored_session {
    std::string agent_id;
    session_state state;
    std::chrono::system_clock::time_point created_at;
  };

private:
  mutable std::mutex mu_;
  std::map<std::string, stored_session> sessions_;
  std::map<std::string, error_code> failed_sessions_;
  std::map<std::string, error_code> failed_agents_;
  std::int64_t next_id_;
  int failures_remaining_;
  error_code failure_code_;
  std::chrono::milliseconds latency_;
  int in_flight_;
  int high_water_mark_;
  int create_calls_;
  int message_calls_;
  int delete_calls_;
  int other_calls_;
};

} // namespace detail
} // namespace sesh

#endif // sesh_detail_fake_session_client_hpp
