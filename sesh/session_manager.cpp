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
#include "sesh/session_manager.hpp"
#include <sesh/log.hpp>

#include <stdexcept>

namespace {
/// Validate the arguments before the members that depend on them are initialized.
sesh::orchestrator_config validated(
    std::shared_ptr<sesh::session_client> const& client, sesh::orchestrator_config config) {
  if (not client) {
    throw std::invalid_argument("session_manager() - the client is required");
  }
  config.validate();
  return config;
}
} // anonymous namespace

namespace sesh {

session_manager::session_manager(
    std::shared_ptr<session_client> client, orchestrator_config config, retry_executor::sleeper_type sleeper)
    : client_(std::move(client))
    , config_(validated(client_, std::move(config)))
    , limiter_(config_.limiter_capacity)
    , retry_(config_, std::move(sleeper)) {
  SESH_LOG(debug) << "session_manager created, " << config_;
}

session session_manager::create_session(std::string const& agent_id, session_state const& initial_state) {
  return call("manager/create_session", [this, &agent_id, &initial_state]() {
    return client_->create_session(agent_id, initial_state);
  });
}

message_reply session_manager::send_message(session& s, std::string const& text) {
  message_reply reply;
  try {
    reply = call("manager/send_message", [this, &s, &text]() { return client_->send_message(s.id, text); });
  } catch (session_error const&) {
    s.stale = true;
    throw;
  }
  if (reply.has_state) {
    s.state = reply.state;
    s.stale = false;
  }
  return reply;
}

void session_manager::delete_session(std::string const& session_id) {
  call("manager/delete_session", [this, &session_id]() { client_->delete_session(session_id); });
}

session session_manager::get_session(std::string const& session_id) {
  return call("manager/get_session", [this, &session_id]() { return client_->get_session(session_id); });
}

std::vector<session> session_manager::list_sessions(std::string const& agent_id) {
  return call("manager/list_sessions", [this, &agent_id]() { return client_->list_sessions(agent_id); });
}

void session_manager::refresh(session& s) {
  session fresh;
  try {
    fresh = get_session(s.id);
  } catch (session_error const&) {
    s.stale = true;
    throw;
  }
  s.state = std::move(fresh.state);
  s.stale = false;
}

batch_result session_manager::run_batch(std::vector<work_item> const& items) {
  batch_orchestrator orchestrator(*client_, limiter_, retry_);
  return orchestrator.run_batch(items);
}

batch_result session_manager::run_batch(std::vector<work_item> const& items, cancellation const& cancel) {
  batch_orchestrator orchestrator(*client_, limiter_, retry_);
  return orchestrator.run_batch(items, cancel);
}

std::unique_ptr<session_pool> session_manager::make_pool(
    std::string const& agent_id, session_state const& initial_state) {
  return make_pool(agent_id, initial_state, config_.pool_capacity);
}

std::unique_ptr<session_pool> session_manager::make_pool(
    std::string const& agent_id, session_state const& initial_state, int capacity) {
  return std::unique_ptr<session_pool>(
      new session_pool(*client_, limiter_, retry_, agent_id, initial_state, capacity, config_.pool_max_wait));
}

} // namespace sesh
