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
#include "sesh/detail/in_memory_backend.hpp"
#include <sesh/detail/session_info.hpp>
#include <sesh/log.hpp>
#include <sesh/session.hpp>

#include <iomanip>
#include <sstream>
#include <thread>

namespace sesh {
namespace detail {

in_memory_backend::in_memory_backend(std::vector<std::string> const& agents)
    : mu_()
    , agents_(agents.begin(), agents.end())
    , sessions_()
    , generator_(std::random_device()())
    , failures_remaining_(0)
    , failure_code_(grpc::StatusCode::OK)
    , latency_(0)
    , calls_(0) {
}

grpc::Status in_memory_backend::CreateSession(
    grpc::ServerContext*, seshpb::CreateSessionRequest const* request, seshpb::CreateSessionResponse* response) {
  auto status = before_call("CreateSession");
  if (not status.ok()) {
    return status;
  }
  if (request->agent_id().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "agent_id is required");
  }
  std::lock_guard<std::mutex> lock(mu_);
  if (not agents_.empty() and agents_.count(request->agent_id()) == 0) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown agent: " + request->agent_id());
  }
  auto id = make_session_id();
  auto now = to_epoch_ms(std::chrono::system_clock::now());
  sessions_[id] = stored_session{request->agent_id(), request->state(), now};
  response->set_session_id(id);
  response->set_create_time_ms(now);
  SESH_LOG(debug) << "CreateSession - created " << id << " for " << request->agent_id();
  return grpc::Status::OK;
}

grpc::Status in_memory_backend::SendMessage(
    grpc::ServerContext*, seshpb::SendMessageRequest const* request, seshpb::SendMessageResponse* response) {
  auto status = before_call("SendMessage");
  if (not status.ok()) {
    return status;
  }
  if (request->session_id().empty() or request->text().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "session_id and text are required");
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto i = sessions_.find(request->session_id());
  if (i == sessions_.end()) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown session: " + request->session_id());
  }
  auto& state = i->second.state;
  auto& fields = *state.mutable_fields();
  double count = 0;
  auto c = fields.find("message_count");
  if (c != fields.end() and c->second.kind_case() == google::protobuf::Value::kNumberValue) {
    count = c->second.number_value();
  }
  fields["message_count"] = number_value(count + 1);

  std::ostringstream os;
  os << "Hello " << state_string(state, "user_name", "stranger") << ", you said: " << request->text();
  response->set_response_text(os.str());
  *response->mutable_state() = state;
  return grpc::Status::OK;
}

grpc::Status in_memory_backend::DeleteSession(
    grpc::ServerContext*, seshpb::DeleteSessionRequest const* request, seshpb::DeleteSessionResponse*) {
  auto status = before_call("DeleteSession");
  if (not status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(mu_);
  if (sessions_.erase(request->session_id()) == 0U) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown session: " + request->session_id());
  }
  return grpc::Status::OK;
}

grpc::Status in_memory_backend::GetSession(
    grpc::ServerContext*, seshpb::GetSessionRequest const* request, seshpb::SessionInfo* response) {
  auto status = before_call("GetSession");
  if (not status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto i = sessions_.find(request->session_id());
  if (i == sessions_.end()) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown session: " + request->session_id());
  }
  fill_info(i->first, i->second, *response);
  return grpc::Status::OK;
}

grpc::Status in_memory_backend::ListSessions(
    grpc::ServerContext*, seshpb::ListSessionsRequest const* request, seshpb::ListSessionsResponse* response) {
  auto status = before_call("ListSessions");
  if (not status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(mu_);
  for (auto const& kv : sessions_) {
    if (request->agent_id().empty() or kv.second.agent_id == request->agent_id()) {
      fill_info(kv.first, kv.second, *response->add_sessions());
    }
  }
  return grpc::Status::OK;
}

void in_memory_backend::fail_next(int count, grpc::StatusCode code) {
  std::lock_guard<std::mutex> lock(mu_);
  failures_remaining_ = count;
  failure_code_ = code;
}

void in_memory_backend::latency(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mu_);
  latency_ = delay;
}

std::size_t in_memory_backend::session_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

std::int64_t in_memory_backend::call_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return calls_;
}

grpc::Status in_memory_backend::before_call(char const* where) {
  std::chrono::milliseconds delay;
  grpc::Status status;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++calls_;
    delay = latency_;
    if (failures_remaining_ > 0) {
      --failures_remaining_;
      status = grpc::Status(failure_code_, std::string(where) + " - injected failure");
    }
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  return status;
}

std::string in_memory_backend::make_session_id() {
  std::uniform_int_distribution<std::uint64_t> dis;
  std::string id;
  do {
    std::uint64_t ab = dis(generator_);
    std::uint64_t cd = dis(generator_);
    // ... version 4 and RFC 4122 variant bits ...
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(8) << (ab >> 32) << '-' << std::setw(4) << ((ab >> 16) & 0xFFFF)
       << '-' << std::setw(4) << (ab & 0xFFFF) << '-' << std::setw(4) << (cd >> 48) << '-' << std::setw(12)
       << (cd & 0xFFFFFFFFFFFFULL);
    id = os.str();
  } while (sessions_.count(id) != 0U);
  return id;
}

void in_memory_backend::fill_info(std::string const& id, stored_session const& s, seshpb::SessionInfo& info) const {
  info.set_session_id(id);
  info.set_agent_id(s.agent_id);
  *info.mutable_state() = s.state;
  info.set_create_time_ms(s.create_time_ms);
}

} // namespace detail
} // namespace sesh
