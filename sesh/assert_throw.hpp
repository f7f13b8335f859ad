#ifndef sesh_assert_throw_hpp
#define sesh_assert_throw_hpp
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
 * Define a macro to check internal invariants at runtime.
 */

#ifndef SESH_ASSERT_THROW
/**
 * Check the predicate @a P and if false raises an exception describing the problem.
 *
 * Use it for invariants of the library itself, such as the slot state machine or the limiter accounting.  Errors
 * caused by the backend or by the caller are reported with sesh::session_error instead.
 */
#define SESH_ASSERT_THROW(P)                                                                                           \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      sesh::assert_throw_impl(#P, __func__, __FILE__, __LINE__);                                                       \
    }                                                                                                                  \
  } while (false)
#endif // SESH_ASSERT_THROW

namespace sesh {

/**
 * Implement the @c SESH_ASSERT_THROW macro out-of-line.
 *
 * The failure is logged at critical severity before the exception is raised, the exception may be caught far away
 * from the broken invariant.
 *
 * @param what the text description of the predicate
 * @param function the location (function) where the predicate was asserted.
 * @param filename the location (source code filename) where the predicate was asserted.
 * @param lineno the location (line number) where the predicate was asserted.
 * @throws std::logic_error always.
 */
[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno);
} // namespace sesh

#endif // sesh_assert_throw_hpp
