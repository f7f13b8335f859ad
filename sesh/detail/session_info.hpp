#ifndef sesh_detail_session_info_hpp
#define sesh_detail_session_info_hpp
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

#include <seshpb/agent_sessions.pb.h>

#include <chrono>
#include <cstdint>

namespace sesh {
namespace detail {

/// Convert a timestamp to the milliseconds since the epoch used in the protos.
std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);

/// Convert the milliseconds since the epoch used in the protos to a timestamp.
std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);

/// Convert the wire representation of a session.
session to_session(seshpb::SessionInfo const& info);

} // namespace detail
} // namespace sesh

#endif // sesh_detail_session_info_hpp
