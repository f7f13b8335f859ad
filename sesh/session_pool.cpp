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
#include "sesh/session_pool.hpp"
#include <sesh/assert_throw.hpp>
#include <sesh/batch_orchestrator.hpp>
#include <sesh/log.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace sesh {

session_pool::session_pool(
    session_client& client, concurrency_limiter& limiter, retry_executor const& retry, std::string agent_id,
    session_state initial_state, int capacity, std::chrono::milliseconds max_wait)
    : client_(client)
    , limiter_(limiter)
    , retry_(retry)
    , agent_id_(std::move(agent_id))
    , initial_state_(std::move(initial_state))
    , max_wait_(max_wait)
    , mu_()
    , cv_()
    , slots_()
    , draining_(false)
    , last_lease_(0) {
  if (capacity < 0) {
    std::ostringstream os;
    os << "session_pool() - capacity (" << capacity << ") should be >= 0";
    throw std::invalid_argument(os.str());
  }
  if (max_wait_.count() < 0) {
    std::ostringstream os;
    os << "session_pool() - max_wait (" << max_wait_.count() << "ms) should be >= 0";
    throw std::invalid_argument(os.str());
  }
  if (agent_id_.empty()) {
    throw std::invalid_argument("session_pool() - agent_id should not be empty");
  }
  slots_.resize(capacity, slot{slot_state::empty, session()});
}

session_pool::~session_pool() {
  std::lock_guard<std::mutex> lock(mu_);
  auto live = count(slot_state::available) + count(slot_state::in_use);
  if (live != 0) {
    SESH_LOG(warning) << "session_pool for agent " << agent_id_ << " destroyed with " << live
                      << " live session(s), call drain() to delete them";
  }
}

batch_result session_pool::initialize(int size) {
  if (size < 0 or size > capacity()) {
    std::ostringstream os;
    os << "session_pool::initialize() - size (" << size << ") should be in the [0," << capacity() << "] range";
    throw std::invalid_argument(os.str());
  }

  std::vector<int> filling;
  std::vector<work_item> items;
  {
    std::lock_guard<std::mutex> lock(mu_);
    draining_ = false;
    auto live = capacity() - count(slot_state::empty);
    for (int i = 0; i != capacity() and live < size; ++i) {
      if (slots_[i].state != slot_state::empty) {
        continue;
      }
      transition(i, slot_state::initializing);
      filling.push_back(i);
      items.push_back(make_create_item(agent_id_, initial_state_, "slot-" + std::to_string(i)));
      ++live;
    }
  }
  SESH_LOG(debug) << "session_pool for agent " << agent_id_ << " filling " << filling.size() << " slot(s)";

  batch_result result;
  try {
    batch_orchestrator orchestrator(client_, limiter_, retry_);
    result = orchestrator.run_batch(items);
  } catch (...) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto i : filling) {
      transition(i, slot_state::empty);
    }
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    for (std::size_t j = 0; j != filling.size(); ++j) {
      auto i = filling[j];
      auto const& outcome = result.outcomes[j];
      if (not outcome.success) {
        SESH_LOG(warning) << "session_pool slot " << i << " creation failed: " << outcome.message;
        transition(i, slot_state::empty);
        continue;
      }
      slots_[i].value = session(outcome.session_id, agent_id_, initial_state_, outcome.created_at);
      slots_[i].value.slot = i;
      transition(i, slot_state::available);
    }
  }
  cv_.notify_all();
  return result;
}

session session_pool::acquire() {
  std::unique_lock<std::mutex> lock(mu_);
  auto ready = [this]() { return count(slot_state::available) > 0; };
  if (max_wait_.count() == 0) {
    cv_.wait(lock, ready);
  } else if (not cv_.wait_for(lock, max_wait_, ready)) {
    std::ostringstream os;
    os << "session_pool::acquire() - no session available after " << max_wait_.count() << "ms, agent=" << agent_id_
       << ", in_use=" << count(slot_state::in_use) << ", capacity=" << capacity();
    throw session_error(error_code::pool_exhausted, os.str());
  }
  auto i = std::find_if(slots_.begin(), slots_.end(), [](slot const& s) { return s.state == slot_state::available; });
  auto index = static_cast<int>(i - slots_.begin());
  transition(index, slot_state::in_use);
  slots_[index].value.lease = ++last_lease_;
  return slots_[index].value;
}

void session_pool::release(session const& s) {
  std::string doomed;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (s.slot < 0 or s.slot >= capacity() or slots_[s.slot].state != slot_state::in_use or
        slots_[s.slot].value.id != s.id or slots_[s.slot].value.lease != s.lease) {
      std::ostringstream os;
      os << "session_pool::release() - session " << s.id << " (slot=" << s.slot << ", lease=" << s.lease
         << ") is not in use in this pool, agent=" << agent_id_;
      throw session_error(error_code::invalid_release, os.str());
    }
    auto& target = slots_[s.slot];
    if (draining_) {
      doomed = target.value.id;
      target.value = session();
      transition(s.slot, slot_state::empty);
    } else {
      target.value.state = s.state;
      target.value.stale = s.stale;
      transition(s.slot, slot_state::available);
    }
  }
  if (doomed.empty()) {
    cv_.notify_one();
    return;
  }
  SESH_LOG(debug) << "session_pool draining, deleting released session " << doomed;
  limiter_slot slot(limiter_);
  retry_.run("pool/delete_session", [this, &doomed]() { client_.delete_session(doomed); });
}

batch_result session_pool::drain() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mu_);
    draining_ = true;
    for (int i = 0; i != capacity(); ++i) {
      if (slots_[i].state != slot_state::available) {
        continue;
      }
      ids.push_back(slots_[i].value.id);
      slots_[i].value = session();
      transition(i, slot_state::empty);
    }
  }
  SESH_LOG(debug) << "session_pool for agent " << agent_id_ << " draining " << ids.size() << " session(s)";
  batch_orchestrator orchestrator(client_, limiter_, retry_);
  return orchestrator.run_batch(make_delete_batch(ids));
}

int session_pool::available_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return count(slot_state::available);
}

int session_pool::in_use_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return count(slot_state::in_use);
}

std::vector<slot_state> session_pool::slot_states() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<slot_state> r;
  r.reserve(slots_.size());
  for (auto const& s : slots_) {
    r.push_back(s.state);
  }
  return r;
}

bool session_pool::draining() const {
  std::lock_guard<std::mutex> lock(mu_);
  return draining_;
}

void session_pool::transition(int index, slot_state to) {
  auto& s = slots_[index];
  SESH_ASSERT_THROW(valid_transition(s.state, to));
  SESH_LOG(trace) << "session_pool slot " << index << " " << s.state << " -> " << to;
  s.state = to;
}

int session_pool::count(slot_state s) const {
  return static_cast<int>(
      std::count_if(slots_.begin(), slots_.end(), [s](slot const& x) { return x.state == s; }));
}

} // namespace sesh
