#ifndef sesh_slot_state_hpp
#define sesh_slot_state_hpp
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

#include <iosfwd>

namespace sesh {
/**
 * The lifecycle of a session_pool slot.
 *
 * A slot holds at most one session.  The pool changes the state of its slots under its own mutex, and checks each
 * change with valid_transition(), an invalid change is a bug in the pool.
 */
enum class slot_state {
  /// No session, the slot can be filled.
  empty,
  /// A create_session call for the slot is in flight.
  initializing,
  /// Holds a session ready to be acquired.
  available,
  /// Holds a session acquired by a caller.
  in_use,
};

/**
 * The streaming operator for @c slot_state.
 *
 * Mostly used for unit testing and debugging / logging messages.
 */
std::ostream& operator<<(std::ostream& os, slot_state x);

/// Return true if a slot can move from @a from to @a to.
bool valid_transition(slot_state from, slot_state to);

} // namespace sesh

#endif // sesh_slot_state_hpp
