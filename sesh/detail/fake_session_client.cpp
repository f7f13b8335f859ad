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
#include "sesh/detail/fake_session_client.hpp"

#include <thread>

namespace sesh {
namespace detail {

fake_session_client::call_scope::call_scope(fake_session_client& client, int& counter, std::string const& target)
    : client_(client) {
  std::chrono::milliseconds latency;
  {
    std::lock_guard<std::mutex> lock(client_.mu_);
    ++counter;
    ++client_.in_flight_;
    if (client_.in_flight_ > client_.high_water_mark_) {
      client_.high_water_mark_ = client_.in_flight_;
    }
    latency = client_.latency_;
  }
  if (latency.count() > 0) {
    std::this_thread::sleep_for(latency);
  }

  std::lock_guard<std::mutex> lock(client_.mu_);
  if (client_.failures_remaining_ > 0) {
    --client_.failures_remaining_;
    // ... the destructor does not run if the constructor throws ...
    --client_.in_flight_;
    throw session_error(client_.failure_code_, "injected failure on " + target);
  }
  auto s = client_.failed_sessions_.find(target);
  if (s != client_.failed_sessions_.end()) {
    --client_.in_flight_;
    throw session_error(s->second, "injected failure for session " + target);
  }
  auto a = client_.failed_agents_.find(target);
  if (a != client_.failed_agents_.end()) {
    --client_.in_flight_;
    throw session_error(a->second, "injected failure for agent " + target);
  }
}

fake_session_client::call_scope::~call_scope() {
  std::lock_guard<std::mutex> lock(client_.mu_);
  --client_.in_flight_;
}

fake_session_client::fake_session_client()
    : mu_()
    , sessions_()
    , failed_sessions_()
    , failed_agents_()
    , next_id_(0)
    , failures_remaining_(0)
    , failure_code_(error_code::unreachable)
    , latency_(0)
    , in_flight_(0)
    , high_water_mark_(0)
    , create_calls_(0)
    , message_calls_(0)
    , delete_calls_(0)
    , other_calls_(0) {
}

session fake_session_client::create_session(std::string const& agent_id, session_state const& initial_state) {
  call_scope scope(*this, create_calls_, agent_id);
  if (agent_id.empty()) {
    throw session_error(error_code::invalid_request, "create_session() - empty agent id");
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto id = "fake-" + std::to_string(++next_id_);
  auto created = std::chrono::system_clock::now();
  sessions_[id] = stored_session{agent_id, initial_state, created};
  return session(std::move(id), agent_id, initial_state, created);
}

message_reply fake_session_client::send_message(std::string const& session_id, std::string const& text) {
  call_scope scope(*this, message_calls_, session_id);
  if (session_id.empty() or text.empty()) {
    throw session_error(error_code::invalid_request, "send_message() - empty session id or text");
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto i = sessions_.find(session_id);
  if (i == sessions_.end()) {
    throw session_error(error_code::session_not_found, "send_message() - unknown session " + session_id);
  }
  auto& fields = *i->second.state.mutable_fields();
  double count = 0;
  auto c = fields.find("message_count");
  if (c != fields.end()) {
    count = c->second.number_value();
  }
  fields["message_count"] = number_value(count + 1);

  message_reply reply;
  reply.text = "reply to: " + text;
  reply.state = i->second.state;
  reply.has_state = true;
  return reply;
}

void fake_session_client::delete_session(std::string const& session_id) {
  call_scope scope(*this, delete_calls_, session_id);
  std::lock_guard<std::mutex> lock(mu_);
  sessions_.erase(session_id);
}

session fake_session_client::get_session(std::string const& session_id) {
  call_scope scope(*this, other_calls_, session_id);
  std::lock_guard<std::mutex> lock(mu_);
  auto i = sessions_.find(session_id);
  if (i == sessions_.end()) {
    throw session_error(error_code::session_not_found, "get_session() - unknown session " + session_id);
  }
  return session(session_id, i->second.agent_id, i->second.state, i->second.created_at);
}

std::vector<session> fake_session_client::list_sessions(std::string const& agent_id) {
  call_scope scope(*this, other_calls_, agent_id);
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<session> r;
  for (auto const& kv : sessions_) {
    if (agent_id.empty() or kv.second.agent_id == agent_id) {
      r.emplace_back(kv.first, kv.second.agent_id, kv.second.state, kv.second.created_at);
    }
  }
  return r;
}

void fake_session_client::fail_next(int count, error_code code) {
  std::lock_guard<std::mutex> lock(mu_);
  failures_remaining_ = count;
  failure_code_ = code;
}

void fake_session_client::fail_session(std::string const& session_id, error_code code) {
  std::lock_guard<std::mutex> lock(mu_);
  failed_sessions_[session_id] = code;
}

void fake_session_client::fail_agent(std::string const& agent_id, error_code code) {
  std::lock_guard<std::mutex> lock(mu_);
  failed_agents_[agent_id] = code;
}

void fake_session_client::latency(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mu_);
  latency_ = delay;
}

int fake_session_client::in_flight() const {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_;
}

int fake_session_client::high_water_mark() const {
  std::lock_guard<std::mutex> lock(mu_);
  return high_water_mark_;
}

int fake_session_client::create_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return create_calls_;
}

int fake_session_client::message_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return message_calls_;
}

int fake_session_client::delete_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return delete_calls_;
}

int fake_session_client::total_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return create_calls_ + message_calls_ + delete_calls_ + other_calls_;
}

std::size_t fake_session_client::session_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

bool fake_session_client::has_session(std::string const& session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.count(session_id) != 0;
}

} // namespace detail
} // namespace sesh
