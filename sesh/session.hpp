#ifndef sesh_session_hpp
#define sesh_session_hpp
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

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <utility>

namespace sesh {

/**
 * The state of a session, a string-keyed mapping of state_value.
 *
 * The backend templates its prompts with these values.  The protobuf well-known Struct is a closed type: every
 * value is null, a number, a string, a bool, a nested mapping, or a list.  It is also the wire representation, so
 * the state crosses the gRPC boundary without conversions.
 */
using session_state = google::protobuf::Struct;

/// One value in a session_state.
using state_value = google::protobuf::Value;

//@{
/// @name state_value builders
state_value null_value();
state_value string_value(std::string value);
state_value number_value(double value);
state_value bool_value(bool value);
state_value list_value(std::initializer_list<state_value> values);
state_value struct_value(session_state value);
//@}

/**
 * Create a session_state from a list of key, value pairs.
 *
 * @code
 * auto state = sesh::make_state({{"user_name", sesh::string_value("Alice")}, {"visits", sesh::number_value(3)}});
 * @endcode
 */
session_state make_state(std::initializer_list<std::pair<std::string, state_value>> values);

/**
 * Create the state used by the agent templates to personalize a conversation.
 *
 * Sets @c user_name, and @c user_email and @c user_preferences when they are not empty.
 */
session_state make_user_state(
    std::string const& user_name, std::string const& user_email = "", std::string const& user_preferences = "");

/**
 * Create the user state, and add the fields in @a extra, which replace the user fields with the same key.
 *
 * @code
 * auto state = sesh::make_user_state(
 *     "Alice", "alice@example.com", "", sesh::make_state({{"plan", sesh::string_value("premium")}}));
 * @endcode
 */
session_state make_user_state(
    std::string const& user_name, std::string const& user_email, std::string const& user_preferences,
    session_state const& extra);

/**
 * Return the string value of @a key in @a state, or @a fallback if the key is missing or not a string.
 */
std::string state_string(session_state const& state, std::string const& key, std::string const& fallback = "");

/**
 * A session held by the backend, as seen by the last call that touched it.
 *
 * The id never changes after creation.  The state is a cache of the last server view: sesh never mutates it on its
 * own, it is replaced when a call returns the state, and marked stale when a call on the session fails.
 */
struct session {
  /// The value of slot for sessions not owned by a pool
  static int constexpr no_slot = -1;

  session()
      : id()
      , agent_id()
      , state()
      , created_at()
      , slot(no_slot)
      , lease(0)
      , stale(false) {
  }

  session(std::string i, std::string a, session_state s, std::chrono::system_clock::time_point c)
      : id(std::move(i))
      , agent_id(std::move(a))
      , state(std::move(s))
      , created_at(c)
      , slot(no_slot)
      , lease(0)
      , stale(false) {
  }

  std::string id;
  std::string agent_id;
  session_state state;
  std::chrono::system_clock::time_point created_at;
  /// The index of the owning pool slot, or no_slot.
  int slot;
  /// Identifies the pool acquisition that returned this copy, zero for sessions not owned by a pool.
  std::uint64_t lease;
  /// Set when a call on the session failed, the cached state may not match the backend.
  bool stale;
};

/// Streaming operator, mostly for logging and the command-line tools.
std::ostream& operator<<(std::ostream& os, session const& x);

/**
 * The result of sending a message to a session.
 */
struct message_reply {
  message_reply()
      : text()
      , state()
      , has_state(false) {
  }

  /// The agent response.
  std::string text;
  /// The session state after the message, only meaningful if has_state is true.
  session_state state;
  bool has_state;
};

} // namespace sesh

#endif // sesh_session_hpp
