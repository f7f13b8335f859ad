#ifndef sesh_detail_async_rpc_op_hpp
#define sesh_detail_async_rpc_op_hpp
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
#include <memory>
#include <type_traits>

namespace sesh {
namespace detail {

/// Determine the Request and Response parameter for an RPC based on the Stub signature - mismatch case.
template <typename M>
struct async_rpc_op_requirements {
  using matches = std::false_type;
};

/// Determine the Request and Response parameter for an RPC based on the Stub signature - match case.
template <typename W, typename R>
struct async_rpc_op_requirements<std::unique_ptr<grpc::ClientAsyncResponseReader<R>>(
    grpc::ClientContext*, W const&, grpc::CompletionQueue*)> {
  using matches = std::true_type;

  using request_type = W;
  using response_type = R;
};

/**
 * A wrapper for asynchronous unary operations.
 *
 * Please see sesh::completion_queue::async_rpc for details.
 *
 * @tparam W the type of the request in the RPC operation.
 * @tparam R the type of the response in the RPC operation.
 */
template <typename W, typename R>
struct async_rpc_op : public base_async_op {
  grpc::ClientContext context;
  grpc::Status status;
  W request;
  R response;
  std::unique_ptr<grpc::ClientAsyncResponseReader<R>> rpc;
};

} // namespace detail
} // namespace sesh

#endif // sesh_detail_async_rpc_op_hpp
