#ifndef sesh_detail_base_completion_queue_hpp
#define sesh_detail_base_completion_queue_hpp
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

#include <sesh/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace sesh {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The base class for the grpc::CompletionQueue wrappers.
 *
 * Refactor code common to all sesh::completion_queue<> template instantiations.
 */
class base_completion_queue {
public:
  /// Stop the loop periodically to check if we should shutdown.
  static std::chrono::milliseconds constexpr loop_timeout{50};

  base_completion_queue();
  virtual ~base_completion_queue();

  /// Run the completion queue loop.
  void run();

  /// Shutdown the completion queue loop.
  void shutdown();

  /// The number of operations started but not completed yet.
  std::size_t pending_count() const;

protected:
  /**
   * The underlying completion queue pointer for the gRPC APIs.
   */
  friend struct ::sesh::detail::base_completion_queue_test_only;
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /// Save a newly created operation and return its gRPC tag.
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Get an operation given its gRPC tag.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  mutable std::mutex mu_;
  using pending_ops_type = std::unordered_map<std::intptr_t, std::shared_ptr<base_async_op>>;
  pending_ops_type pending_ops_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
};
} // namespace detail
} // namespace sesh

#endif // sesh_detail_base_completion_queue_hpp
