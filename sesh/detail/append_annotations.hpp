#ifndef sesh_detail_append_annotations_hpp
#define sesh_detail_append_annotations_hpp
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

#include <utility>

namespace sesh {
namespace detail {

/// Append an (empty) list of annotations to a stream.
template <typename Stream>
inline void append_annotations(Stream& os) {
}

/**
 * Append a list of annotations to a stream.
 *
 * Error messages in sesh carry context about the call that failed, say the session id and the attempt number.  The
 * callers pass that context as a variadic list that is streamed after the main message.
 *
 * @tparam Stream the type of the stream, typically std::ostream.
 * @tparam H the type of the first annotation in the list.
 * @tparam Tail the type of the remaining annotations in the list.
 */
template <typename Stream, typename H, typename... Tail>
inline void append_annotations(Stream& os, H&& h, Tail&&... t) {
  os << std::forward<H>(h);
  append_annotations(os, std::forward<Tail>(t)...);
}

} // namespace detail
} // namespace sesh

#endif // sesh_detail_append_annotations_hpp
