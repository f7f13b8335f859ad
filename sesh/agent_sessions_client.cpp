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
#include "sesh/agent_sessions_client.hpp"
#include <sesh/grpc_session_client.hpp>

namespace sesh {
agent_sessions_client::agent_sessions_client(
    bool, std::shared_ptr<active_completion_queue> queue, std::shared_ptr<grpc::Channel> channel,
    std::chrono::milliseconds call_timeout)
    : queue_(std::move(queue))
    , channel_(std::move(channel))
    , impl_(new grpc_session_client<completion_queue<>>(
          queue_->cq(), seshpb::AgentSessions::NewStub(channel_), call_timeout)) {
}

agent_sessions_client::~agent_sessions_client() {
}

std::shared_ptr<session_client> make_agent_sessions_client(
    std::string const& address, std::chrono::milliseconds call_timeout) {
  auto queue = std::make_shared<active_completion_queue>();
  auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  return std::make_shared<agent_sessions_client>(std::move(queue), std::move(channel), call_timeout);
}

} // namespace sesh
