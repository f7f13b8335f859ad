/**
 * @file
 *
 * Helper functions to handle errors reported by gRPC++
 */
#ifndef sesh_detail_grpc_errors_hpp
#define sesh_detail_grpc_errors_hpp
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

#include <sesh/detail/append_annotations.hpp>
#include <sesh/session_error.hpp>

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>
#include <sstream>

namespace sesh {
namespace detail {

/**
 * Map a gRPC status code to the sesh error classification.
 *
 * Transport failures and expired deadlines are @c unreachable, argument errors are @c invalid_request, @c NOT_FOUND
 * is @c session_not_found, and everything else is a @c remote_error.
 */
error_code classify_grpc_status(grpc::StatusCode code);

/**
 * Convert a failed gRPC status into an exception.
 *
 * This is often converted into an exception, but it is easier to unit tests if separated.
 *
 * @param status the status to check.
 * @param where a string to let the user know where the error took place.
 * @param a a list of additional annotations to append (using operator<<) to the end of the exception what() message.
 * @throws sesh::session_error if @a status.ok() is false, with the code given by classify_grpc_status().
 */
template <typename Location, typename... Annotations>
void check_grpc_status(grpc::Status const& status, Location const& where, Annotations&&... a) {
  if (status.ok()) {
    return;
  }
  std::ostringstream os;
  os << where << " grpc error: " << status.error_message() << " [" << status.error_code() << "]";
  detail::append_annotations(os, std::forward<Annotations>(a)...);
  throw session_error(classify_grpc_status(status.error_code()), os.str());
}

/**
 * Print a protobuf on a std::ostream.
 *
 * Uses google::protobuf::TextFormat::PrintToString to print a protobuf.  Typically one would use is as in:
 *
 * @code
 * seshpb::SendMessageRequest const& req = ...;
 * std::ostream& os = ...;
 *
 * os << "foo " << 1 << print_to_stream(req) << " blah";
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace sesh

#endif // sesh_detail_grpc_errors_hpp
