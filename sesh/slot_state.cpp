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
#include "sesh/slot_state.hpp"

#include <iostream>

namespace sesh {

std::ostream& operator<<(std::ostream& os, slot_state x) {
  char const* values[] = {
      "empty",
      "initializing",
      "available",
      "in_use",
  };
  return os << values[int(x)];
}

bool valid_transition(slot_state from, slot_state to) {
  using s = slot_state;
  switch (from) {
  case s::empty:
    return to == s::initializing;
  case s::initializing:
    return to == s::available or to == s::empty;
  case s::available:
    return to == s::in_use or to == s::empty;
  case s::in_use:
    return to == s::available or to == s::empty;
  }
  return false;
}

} // namespace sesh
