#ifndef sesh_work_item_hpp
#define sesh_work_item_hpp
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

#include <sesh/session.hpp>
#include <sesh/session_error.hpp>

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace sesh {

/// The remote operations that can be part of a batch.
enum class work_kind {
  create_session,
  send_message,
  delete_session,
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, work_kind x);

/**
 * One remote operation in a batch.
 *
 * Use the make_*_item() functions to create them.  The key is chosen by the caller and copied to the outcome, it is
 * typically the name of the user or the session the item is about.
 */
struct work_item {
  work_kind kind;
  /// The agent id for creates, the session id for messages and deletes.
  std::string target;
  /// The initial state for creates, ignored by the other operations.
  session_state initial_state;
  /// The message text for send_message, ignored by the other operations.
  std::string text;
  /// The caller-supplied correlation key.
  std::string key;
};

//@{
/// @name work_item factories
work_item make_create_item(std::string agent_id, session_state initial_state, std::string key = "");
work_item make_message_item(std::string session_id, std::string text, std::string key = "");
work_item make_delete_item(std::string session_id, std::string key = "");
//@}

/**
 * The terminal outcome of a work_item.
 */
struct work_outcome {
  work_outcome()
      : index(0)
      , key()
      , kind(work_kind::create_session)
      , success(false)
      , error(error_code::remote_error)
      , message()
      , session_id()
      , created_at()
      , response_text()
      , state()
      , has_state(false)
      , attempts(0) {
  }

  /// The position of the originating item in the batch.
  std::size_t index;
  std::string key;
  work_kind kind;
  bool success;
  /// The failure classification, only meaningful if success is false.
  error_code error;
  /// The failure description, only meaningful if success is false.
  std::string message;
  /// The session created, or the session the operation was applied to.
  std::string session_id;
  /// The creation time reported by the backend, for successful create_session items.
  std::chrono::system_clock::time_point created_at;
  /// The agent response, for successful send_message items.
  std::string response_text;
  /// The state returned by send_message, only meaningful if has_state is true.
  session_state state;
  bool has_state;
  /// The number of calls made, zero if the item was never admitted.
  int attempts;
};

/// Streaming operator, one line per outcome.
std::ostream& operator<<(std::ostream& os, work_outcome const& x);

/**
 * The outcomes of a batch, in the order of the original items.
 *
 * A batch never fails as a whole, the failures are reported here.
 */
struct batch_result {
  batch_result()
      : outcomes()
      , elapsed(0) {
  }

  std::vector<work_outcome> outcomes;
  /// The wall-clock time to run the batch.
  std::chrono::microseconds elapsed;

  std::size_t success_count() const;
  std::size_t failure_count() const;

  /// The failed outcomes, in item order.
  std::vector<work_outcome> failures() const;

  /// The ids of the sessions created by successful create_session items, in item order.
  std::vector<std::string> session_ids() const;

  /// Outcomes per second, zero for an empty batch.
  double throughput() const;
};

/**
 * Print a report: the counts, the elapsed time and throughput, and the reason for each failure.
 */
std::ostream& operator<<(std::ostream& os, batch_result const& x);

/**
 * Create one create_session item per state in @a states.
 *
 * The key of each item is the @c user_name in its state, or @c "create-<index>" if there is none.
 */
std::vector<work_item> make_create_batch(std::string const& agent_id, std::vector<session_state> const& states);

/// Create one send_message item per session, all with the same text, keyed by session id.
std::vector<work_item> make_broadcast_batch(std::vector<std::string> const& session_ids, std::string const& text);

/// Create one delete_session item per session, keyed by session id.
std::vector<work_item> make_delete_batch(std::vector<std::string> const& session_ids);

} // namespace sesh

#endif // sesh_work_item_hpp
