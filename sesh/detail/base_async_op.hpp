#ifndef sesh_detail_base_async_op_hpp
#define sesh_detail_base_async_op_hpp
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

#include <functional>
#include <memory>
#include <string>

namespace sesh {
namespace detail {

/**
 * Base class for all asynchronous operations containers.
 *
 * These are helper classes used in the implementation of sesh::completion_queue, and not intended by direct use by
 * the application.  The application requests an asynchronous operation from a completion queue, and provides a
 * functor to call when the operation completes (or is cancelled).  The completion queue creates an object with dynamic
 * type derived from @c sesh::detail::base_async_op, saves the functor and any other data required to complete the
 * operation in that object, and issues the asynchronous call.  When the call completes the queue invokes the functor,
 * passing the operation results, its status, and whether the operation completed or was cancelled.  After the functor
 * returns the completion queue releases all resources associated with the operation, the functor must copy any
 * results it wants to keep.
 */
struct base_async_op {
  base_async_op() {
  }

  /// Make sure full destructor of derived class is called.
  virtual ~base_async_op() {
  }

  /**
   * Callback for the completion queue.
   *
   * The derived classes just create a std::function<> to wrap the user-supplied functor, so this is less code than a
   * virtual function.
   */
  std::function<void(base_async_op&, bool)> callback;

  /// For debugging, and to match operations in the mocks.
  std::string name;
};

} // namespace detail
} // namespace sesh

#endif // sesh_detail_base_async_op_hpp
