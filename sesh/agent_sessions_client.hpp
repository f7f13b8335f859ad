#ifndef sesh_agent_sessions_client_hpp
#define sesh_agent_sessions_client_hpp
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

#include <sesh/active_completion_queue.hpp>
#include <sesh/session_client.hpp>

#include <grpc++/grpc++.h>

#include <chrono>
#include <memory>

namespace sesh {

/**
 * The production sesh::session_client, talks to a seshpb.AgentSessions backend over gRPC.
 *
 * The completion queue, and the thread running it, can be shared by many clients.
 */
class agent_sessions_client : public session_client {
public:
  template <typename duration_type>
  agent_sessions_client(
      std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> channel,
      duration_type call_timeout)
      : agent_sessions_client(
            true, std::move(queue), std::move(channel),
            std::chrono::duration_cast<std::chrono::milliseconds>(call_timeout)) {
  }

  ~agent_sessions_client();

  //@{
  /// @name implement session_client interface using pimpl idiom.
  session create_session(std::string const& agent_id, session_state const& initial_state) override {
    return impl_->create_session(agent_id, initial_state);
  }
  message_reply send_message(std::string const& session_id, std::string const& text) override {
    return impl_->send_message(session_id, text);
  }
  void delete_session(std::string const& session_id) override {
    impl_->delete_session(session_id);
  }
  session get_session(std::string const& session_id) override {
    return impl_->get_session(session_id);
  }
  std::vector<session> list_sessions(std::string const& agent_id) override {
    return impl_->list_sessions(agent_id);
  }
  //@}

private:
  /// Refactor common code to public constructors ...
  agent_sessions_client(
      bool, std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> channel,
      std::chrono::milliseconds call_timeout);

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<session_client> impl_;
};

/**
 * Create a client for the backend at @a address, with its own completion queue.
 *
 * The channel uses insecure credentials, the backends are expected to run next to the orchestrator.
 */
std::shared_ptr<session_client> make_agent_sessions_client(
    std::string const& address, std::chrono::milliseconds call_timeout);

} // namespace sesh

#endif // sesh_agent_sessions_client_hpp
