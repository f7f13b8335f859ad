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
#include "sesh/detail/grpc_errors.hpp"

#include <google/protobuf/text_format.h>
#include <string>

namespace sesh {
namespace detail {

error_code classify_grpc_status(grpc::StatusCode code) {
  switch (code) {
  case grpc::StatusCode::UNAVAILABLE:
  case grpc::StatusCode::DEADLINE_EXCEEDED:
  case grpc::StatusCode::CANCELLED:
    return error_code::unreachable;
  case grpc::StatusCode::INVALID_ARGUMENT:
  case grpc::StatusCode::OUT_OF_RANGE:
    return error_code::invalid_request;
  case grpc::StatusCode::NOT_FOUND:
    return error_code::session_not_found;
  default:
    return error_code::remote_error;
  }
}

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  // Print and ignore errors, on failure we just get an empty string ...
  std::string formatted;
  (void)google::protobuf::TextFormat::PrintToString(x.msg, &formatted);
  return os << formatted;
}

} // namespace detail
} // namespace sesh
