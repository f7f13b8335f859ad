#ifndef sesh_detail_mocked_grpc_interceptor_hpp
#define sesh_detail_mocked_grpc_interceptor_hpp
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

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>
#include <memory>

namespace sesh {
namespace detail {

/**
 * A gRPC interceptor that sends every operation to a GoogleMock object.
 *
 * The test sets expectations on @c shared_mock, the actions downcast the operation to the right
 * sesh::detail::async_rpc_op<>, fill the response and status, and call the operation callback, either immediately or
 * later to simulate a slow backend.  No RPC leaves the process, the stub pointer may be null.
 */
struct mocked_grpc_interceptor {
  mocked_grpc_interceptor()
      : shared_mock(new mocked) {
  }

  /// Intercept posting of asynchronous RPC operations
  template <typename C, typename M, typename op_type>
  void async_rpc(C* async_client, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    shared_mock->async_rpc(op);
  }

  struct mocked {
    MOCK_CONST_METHOD1(async_rpc, void(std::shared_ptr<base_async_op> op));
  };

  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace sesh

#endif // sesh_detail_mocked_grpc_interceptor_hpp
