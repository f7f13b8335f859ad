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
#include "sesh/session.hpp"

#include <google/protobuf/util/json_util.h>

#include <ctime>
#include <iomanip>
#include <iostream>

namespace sesh {

int constexpr session::no_slot;

state_value null_value() {
  state_value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

state_value string_value(std::string value) {
  state_value v;
  v.set_string_value(std::move(value));
  return v;
}

state_value number_value(double value) {
  state_value v;
  v.set_number_value(value);
  return v;
}

state_value bool_value(bool value) {
  state_value v;
  v.set_bool_value(value);
  return v;
}

state_value list_value(std::initializer_list<state_value> values) {
  state_value v;
  auto& list = *v.mutable_list_value();
  for (auto const& x : values) {
    *list.add_values() = x;
  }
  return v;
}

state_value struct_value(session_state value) {
  state_value v;
  v.mutable_struct_value()->Swap(&value);
  return v;
}

session_state make_state(std::initializer_list<std::pair<std::string, state_value>> values) {
  session_state state;
  auto& fields = *state.mutable_fields();
  for (auto const& kv : values) {
    fields[kv.first] = kv.second;
  }
  return state;
}

session_state make_user_state(
    std::string const& user_name, std::string const& user_email, std::string const& user_preferences) {
  auto state = make_state({{"user_name", string_value(user_name)}});
  auto& fields = *state.mutable_fields();
  if (not user_email.empty()) {
    fields["user_email"] = string_value(user_email);
  }
  if (not user_preferences.empty()) {
    fields["user_preferences"] = string_value(user_preferences);
  }
  return state;
}

session_state make_user_state(
    std::string const& user_name, std::string const& user_email, std::string const& user_preferences,
    session_state const& extra) {
  auto state = make_user_state(user_name, user_email, user_preferences);
  for (auto const& kv : extra.fields()) {
    (*state.mutable_fields())[kv.first] = kv.second;
  }
  return state;
}

std::string state_string(session_state const& state, std::string const& key, std::string const& fallback) {
  auto i = state.fields().find(key);
  if (i == state.fields().end() or i->second.kind_case() != state_value::kStringValue) {
    return fallback;
  }
  return i->second.string_value();
}

std::ostream& operator<<(std::ostream& os, session const& x) {
  // ... compact JSON is the most readable form for the state, print and ignore errors, on failure we just get an
  // empty string ...
  std::string state;
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  (void)google::protobuf::util::MessageToJsonString(x.state, &state, options);

  auto created = std::chrono::system_clock::to_time_t(x.created_at);
  std::tm tm;
  gmtime_r(&created, &tm);
  os << "session{id=" << x.id << ", agent=" << x.agent_id << ", created=" << std::put_time(&tm, "%FT%TZ");
  if (x.slot != session::no_slot) {
    os << ", slot=" << x.slot;
  }
  if (x.stale) {
    os << ", stale";
  }
  return os << ", state=" << state << "}";
}

} // namespace sesh
