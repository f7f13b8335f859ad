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
#include "sesh/work_item.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace sesh {

std::ostream& operator<<(std::ostream& os, work_kind x) {
  char const* values[] = {"create_session", "send_message", "delete_session"};
  auto i = static_cast<std::size_t>(x);
  if (i < sizeof(values) / sizeof(values[0])) {
    return os << values[i];
  }
  return os << "[invalid work_kind " << static_cast<int>(x) << "]";
}

work_item make_create_item(std::string agent_id, session_state initial_state, std::string key) {
  work_item item;
  item.kind = work_kind::create_session;
  item.target = std::move(agent_id);
  item.initial_state = std::move(initial_state);
  item.key = std::move(key);
  return item;
}

work_item make_message_item(std::string session_id, std::string text, std::string key) {
  work_item item;
  item.kind = work_kind::send_message;
  item.target = std::move(session_id);
  item.text = std::move(text);
  item.key = std::move(key);
  return item;
}

work_item make_delete_item(std::string session_id, std::string key) {
  work_item item;
  item.kind = work_kind::delete_session;
  item.target = std::move(session_id);
  item.key = std::move(key);
  return item;
}

std::ostream& operator<<(std::ostream& os, work_outcome const& x) {
  os << "#" << x.index << " " << x.kind;
  if (not x.key.empty()) {
    os << " [" << x.key << "]";
  }
  if (not x.success) {
    return os << " FAILED (" << x.error << ") after " << x.attempts << " attempt(s): " << x.message;
  }
  os << " OK";
  if (not x.session_id.empty()) {
    os << " session=" << x.session_id;
  }
  if (x.kind == work_kind::send_message) {
    os << " response=\"" << x.response_text << "\"";
  }
  return os;
}

std::size_t batch_result::success_count() const {
  return std::count_if(outcomes.begin(), outcomes.end(), [](work_outcome const& o) { return o.success; });
}

std::size_t batch_result::failure_count() const {
  return outcomes.size() - success_count();
}

std::vector<work_outcome> batch_result::failures() const {
  std::vector<work_outcome> r;
  std::copy_if(outcomes.begin(), outcomes.end(), std::back_inserter(r), [](work_outcome const& o) {
    return not o.success;
  });
  return r;
}

std::vector<std::string> batch_result::session_ids() const {
  std::vector<std::string> r;
  for (auto const& o : outcomes) {
    if (o.success and o.kind == work_kind::create_session) {
      r.push_back(o.session_id);
    }
  }
  return r;
}

double batch_result::throughput() const {
  if (outcomes.empty() or elapsed.count() <= 0) {
    return 0.0;
  }
  return outcomes.size() * 1000000.0 / elapsed.count();
}

std::ostream& operator<<(std::ostream& os, batch_result const& x) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(x.elapsed);
  std::ostringstream rate;
  rate << std::fixed << std::setprecision(2) << x.throughput();
  os << "batch: " << x.outcomes.size() << " item(s), " << x.success_count() << " succeeded, " << x.failure_count()
     << " failed, elapsed=" << millis.count() << "ms, throughput=" << rate.str() << "/s";
  for (auto const& o : x.outcomes) {
    if (not o.success) {
      os << "\n  " << o;
    }
  }
  return os;
}

std::vector<work_item> make_create_batch(std::string const& agent_id, std::vector<session_state> const& states) {
  std::vector<work_item> items;
  items.reserve(states.size());
  for (std::size_t i = 0; i != states.size(); ++i) {
    auto key = state_string(states[i], "user_name");
    if (key.empty()) {
      key = "create-" + std::to_string(i);
    }
    items.push_back(make_create_item(agent_id, states[i], std::move(key)));
  }
  return items;
}

std::vector<work_item> make_broadcast_batch(std::vector<std::string> const& session_ids, std::string const& text) {
  std::vector<work_item> items;
  items.reserve(session_ids.size());
  for (auto const& id : session_ids) {
    items.push_back(make_message_item(id, text, id));
  }
  return items;
}

std::vector<work_item> make_delete_batch(std::vector<std::string> const& session_ids) {
  std::vector<work_item> items;
  items.reserve(session_ids.size());
  for (auto const& id : session_ids) {
    items.push_back(make_delete_item(id, id));
  }
  return items;
}

} // namespace sesh
