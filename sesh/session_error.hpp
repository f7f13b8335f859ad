#ifndef sesh_session_error_hpp
#define sesh_session_error_hpp
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
/**
 * @file
 *
 * Define the errors reported by sesh operations.
 */

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace sesh {
/**
 * Classify the failures of sesh operations.
 *
 * The classification drives the retry decisions: some failures are transient and the call is worth repeating, some
 * are caused by the caller (or the data) and repeating the call would fail the same way.
 */
enum class error_code {
  /// The backend could not be contacted, or the call deadline expired.  Retryable.
  unreachable,
  /// The backend returned an error response.  Retryable.
  remote_error,
  /// The request is malformed, or the backend rejected its arguments.  Terminal.
  invalid_request,
  /// The session id is unknown to the backend.  Terminal, except for deletes where it means success.
  session_not_found,
  /// No pool slot became available within the configured wait.  Terminal for that acquisition.
  pool_exhausted,
  /// The session released to a pool is not in use, or does not belong to that pool.  Indicates a caller bug.
  invalid_release,
  /// The batch was cancelled before the item was admitted.  Terminal.
  cancelled,
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, error_code x);

/// Return true if a call that failed with @a code may succeed if tried again.
bool is_retryable(error_code code);

/**
 * The exception raised by sesh operations.
 *
 * Argument validation errors in constructors and configuration are reported with std::invalid_argument, and broken
 * internal invariants with std::logic_error (see SESH_ASSERT_THROW), everything else is a session_error.
 */
class session_error : public std::runtime_error {
public:
  session_error(error_code code, std::string const& what)
      : std::runtime_error(what)
      , code_(code) {
  }

  error_code code() const {
    return code_;
  }

  bool retryable() const {
    return is_retryable(code_);
  }

private:
  error_code code_;
};

} // namespace sesh

#endif // sesh_session_error_hpp
