#ifndef sesh_grpc_session_client_hpp
#define sesh_grpc_session_client_hpp
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

#include <sesh/completion_queue.hpp>
#include <sesh/detail/grpc_errors.hpp>
#include <sesh/detail/session_info.hpp>
#include <sesh/log.hpp>
#include <sesh/session_client.hpp>
#include <sesh/session_error.hpp>

#include <seshpb/agent_sessions.grpc.pb.h>

#include <chrono>
#include <memory>
#include <sstream>

namespace sesh {

/**
 * Implement sesh::session_client over the seshpb.AgentSessions gRPC service.
 *
 * Each call is an asynchronous RPC on the completion queue, the calling thread blocks on a future until it
 * completes.  Many threads can have calls in flight at the same time, they all complete in the thread running the
 * queue loop.
 *
 * @tparam completion_queue_type the type of the completion queue, tests use a queue with a mocked interceptor.
 */
template <typename completion_queue_type>
class grpc_session_client : public session_client {
public:
  template <typename duration_type>
  grpc_session_client(
      completion_queue_type& queue, std::unique_ptr<seshpb::AgentSessions::Stub> stub, duration_type call_timeout)
      : queue_(queue)
      , stub_(std::move(stub))
      , call_timeout_(std::chrono::duration_cast<std::chrono::milliseconds>(call_timeout)) {
    if (call_timeout_.count() <= 0) {
      std::ostringstream os;
      os << "grpc_session_client() - call_timeout (" << call_timeout_.count() << "ms) should be > 0";
      throw std::invalid_argument(os.str());
    }
  }

  grpc_session_client(grpc_session_client const&) = delete;
  grpc_session_client& operator=(grpc_session_client const&) = delete;

  std::chrono::milliseconds call_timeout() const {
    return call_timeout_;
  }

  session create_session(std::string const& agent_id, session_state const& initial_state) override {
    if (agent_id.empty()) {
      throw session_error(error_code::invalid_request, "create_session() - empty agent id");
    }
    seshpb::CreateSessionRequest req;
    req.set_agent_id(agent_id);
    *req.mutable_state() = initial_state;

    seshpb::CreateSessionResponse resp;
    try {
      resp = queue_
                 .async_rpc(
                     stub_.get(), &seshpb::AgentSessions::Stub::AsyncCreateSession, std::move(req), deadline(),
                     "sessions/create_session", use_future())
                 .get();
    } catch (session_error const& ex) {
      // ... the agent is part of the request, an unknown agent is a bad request, not a missing session ...
      if (ex.code() == error_code::session_not_found) {
        throw session_error(error_code::invalid_request, ex.what());
      }
      throw;
    }
    if (resp.session_id().empty()) {
      std::ostringstream os;
      os << "create_session() - backend returned an empty session id for agent=" << agent_id
         << ", response=" << detail::print_to_stream(resp);
      throw session_error(error_code::remote_error, os.str());
    }
    SESH_LOG(debug) << "created session " << resp.session_id() << " for agent " << agent_id;
    return session(resp.session_id(), agent_id, initial_state, detail::from_epoch_ms(resp.create_time_ms()));
  }

  message_reply send_message(std::string const& session_id, std::string const& text) override {
    if (session_id.empty()) {
      throw session_error(error_code::invalid_request, "send_message() - empty session id");
    }
    if (text.empty()) {
      throw session_error(error_code::invalid_request, "send_message() - empty message text, session=" + session_id);
    }
    seshpb::SendMessageRequest req;
    req.set_session_id(session_id);
    req.set_text(text);
    auto resp = queue_
                    .async_rpc(
                        stub_.get(), &seshpb::AgentSessions::Stub::AsyncSendMessage, std::move(req), deadline(),
                        "sessions/send_message", use_future())
                    .get();

    message_reply reply;
    reply.text = resp.response_text();
    reply.has_state = resp.has_state();
    if (reply.has_state) {
      reply.state = resp.state();
    }
    return reply;
  }

  void delete_session(std::string const& session_id) override {
    if (session_id.empty()) {
      throw session_error(error_code::invalid_request, "delete_session() - empty session id");
    }
    seshpb::DeleteSessionRequest req;
    req.set_session_id(session_id);
    try {
      queue_
          .async_rpc(
              stub_.get(), &seshpb::AgentSessions::Stub::AsyncDeleteSession, std::move(req), deadline(),
              "sessions/delete_session", use_future())
          .get();
    } catch (session_error const& ex) {
      if (ex.code() != error_code::session_not_found) {
        throw;
      }
      SESH_LOG(debug) << "delete_session(" << session_id << ") - session already gone: " << ex.what();
    }
  }

  session get_session(std::string const& session_id) override {
    if (session_id.empty()) {
      throw session_error(error_code::invalid_request, "get_session() - empty session id");
    }
    seshpb::GetSessionRequest req;
    req.set_session_id(session_id);
    auto info = queue_
                    .async_rpc(
                        stub_.get(), &seshpb::AgentSessions::Stub::AsyncGetSession, std::move(req), deadline(),
                        "sessions/get_session", use_future())
                    .get();
    return detail::to_session(info);
  }

  std::vector<session> list_sessions(std::string const& agent_id) override {
    seshpb::ListSessionsRequest req;
    req.set_agent_id(agent_id);
    auto resp = queue_
                    .async_rpc(
                        stub_.get(), &seshpb::AgentSessions::Stub::AsyncListSessions, std::move(req), deadline(),
                        "sessions/list_sessions", use_future())
                    .get();
    std::vector<session> sessions;
    sessions.reserve(resp.sessions_size());
    for (auto const& info : resp.sessions()) {
      sessions.push_back(detail::to_session(info));
    }
    return sessions;
  }

private:
  std::chrono::system_clock::time_point deadline() const {
    return std::chrono::system_clock::now() + call_timeout_;
  }

private:
  completion_queue_type& queue_;
  std::unique_ptr<seshpb::AgentSessions::Stub> stub_;
  std::chrono::milliseconds call_timeout_;
};

} // namespace sesh

#endif // sesh_grpc_session_client_hpp
