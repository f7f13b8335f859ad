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
#include "sesh/session_error.hpp"

#include <iostream>

namespace sesh {

std::ostream& operator<<(std::ostream& os, error_code x) {
  char const* names[] = {
      "unreachable", "remote_error", "invalid_request", "session_not_found", "pool_exhausted", "invalid_release",
      "cancelled",
  };
  return os << names[int(x)];
}

bool is_retryable(error_code code) {
  return code == error_code::unreachable or code == error_code::remote_error;
}

} // namespace sesh
