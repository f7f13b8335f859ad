#ifndef sesh_detail_in_memory_backend_hpp
#define sesh_detail_in_memory_backend_hpp
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

#include <seshpb/agent_sessions.grpc.pb.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace sesh {
namespace detail {

/**
 * A self-contained implementation of the seshpb.AgentSessions service.
 *
 * Keeps the sessions in memory, used by the integration tests and the sesh_backend tool.  Replies echo the message
 * and the @c user_name in the session state, and count the messages in the @c message_count state field.
 *
 * Failures can be injected: fail_next() makes the next calls return an error status, and latency() delays every
 * call, which is useful to test deadlines and the concurrency limits.
 */
class in_memory_backend : public seshpb::AgentSessions::Service {
public:
  /**
   * Create a backend that hosts @a agents.
   *
   * An empty list accepts any (non-empty) agent id.
   */
  explicit in_memory_backend(std::vector<std::string> const& agents = std::vector<std::string>());

  grpc::Status CreateSession(
      grpc::ServerContext* context, seshpb::CreateSessionRequest const* request,
      seshpb::CreateSessionResponse* response) override;
  grpc::Status SendMessage(
      grpc::ServerContext* context, seshpb::SendMessageRequest const* request,
      seshpb::SendMessageResponse* response) override;
  grpc::Status DeleteSession(
      grpc::ServerContext* context, seshpb::DeleteSessionRequest const* request,
      seshpb::DeleteSessionResponse* response) override;
  grpc::Status GetSession(
      grpc::ServerContext* context, seshpb::GetSessionRequest const* request, seshpb::SessionInfo* response) override;
  grpc::Status ListSessions(
      grpc::ServerContext* context, seshpb::ListSessionsRequest const* request,
      seshpb::ListSessionsResponse* response) override;

  /// Fail the next @a count calls with @a code.
  void fail_next(int count, grpc::StatusCode code = grpc::StatusCode::UNAVAILABLE);

  /// Delay every call by @a delay.
  void latency(std::chrono::milliseconds delay);

  /// The number of live sessions.
  std::size_t session_count() const;

  /// The number of calls received, including the failed ones.
  std::int64_t call_count() const;

private:
  /// Count the call, apply the latency and any injected failure.
  grpc::Status before_call(char const* where);

  /// Generate a new, uuid-like, session id.  Must be called with mu_ held.
  std::string make_session_id();

  struct stored_session {
    std::string agent_id;
    google::protobuf::Struct state;
    std::int64_t create_time_ms;
  };
  void fill_info(std::string const& id, stored_session const& s, seshpb::SessionInfo& info) const;

private:
  mutable std::mutex mu_;
  std::set<std::string> agents_;
  std::map<std::string, stored_session> sessions_;
  std::mt19937_64 generator_;
  int failures_remaining_;
  grpc::StatusCode failure_code_;
  std::chrono::milliseconds latency_;
  std::int64_t calls_;
};

} // namespace detail
} // namespace sesh

#endif // sesh_detail_in_memory_backend_hpp
