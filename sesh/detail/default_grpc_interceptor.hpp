#ifndef sesh_detail_default_grpc_interceptor_hpp
#define sesh_detail_default_grpc_interceptor_hpp
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

#include <grpc++/grpc++.h>
#include <memory>

namespace sesh {
namespace detail {

/**
 * Provides a dependency injection point to mock the gRPC++ library.
 *
 * The unit tests simulate the behavior of the gRPC++ library, and of the backend on the other side of it.  This class
 * defines a narrow interface where sesh intercepts all the gRPC++ calls.  Please see
 * sesh::detail::mocked_grpc_interceptor for a mocked version.
 */
struct default_grpc_interceptor {
  /// Post an asynchronous RPC operation via the completion queue
  template <typename C, typename M, typename op_type>
  void async_rpc(C* async_client, M C::*call, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->rpc = (async_client->*call)(&op->context, op->request, cq);
    op->rpc->Finish(&op->response, &op->status, tag);
  }
};

} // namespace detail
} // namespace sesh

#endif // sesh_detail_default_grpc_interceptor_hpp
