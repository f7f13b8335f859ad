#ifndef sesh_completion_queue_hpp
#define sesh_completion_queue_hpp
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

#include <sesh/detail/async_rpc_op.hpp>
#include <sesh/detail/base_async_op.hpp>
#include <sesh/detail/base_completion_queue.hpp>
#include <sesh/detail/default_grpc_interceptor.hpp>
#include <sesh/detail/grpc_errors.hpp>
#include <sesh/session_error.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace sesh {

/// A struct to indicate the APIs should return futures instead of invoking a callback.
struct use_future {};

/**
 * Wrap a gRPC completion queue.
 *
 * The grpc::CompletionQueue is not much of an abstraction, nor is it idiomatic C++.  This wrapper makes it easier to
 * write asynchronous operations that call functors (lambdas, std::function<>, etc) when the operation completes.
 *
 * @tparam grpc_interceptor_t mediate all calls to the gRPC library.  The default inlines all the calls, so it is
 * basically zero overhead.  The main reason to change it is to mock the gRPC++ APIs in tests.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  //@{
  /**
   * @name type traits
   */
  using grpc_interceptor_type = grpc_interceptor_t;
  //@}

  explicit completion_queue(grpc_interceptor_type interceptor = grpc_interceptor_type())
      : detail::base_completion_queue()
      , interceptor_(std::move(interceptor)) {
  }

  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

  /**
   * Start an asynchronous RPC call and invoke a functor with the results.
   *
   * Consider a typical gRPC:
   *
   * @code
   * service AgentSessions {
   *    rpc GetSession(GetSessionRequest) returns (SessionInfo) {}
   * }
   * @endcode
   *
   * When making an asynchronous request use:
   *
   * @code
   * completion_queue<> queue = ...;
   * std::unique_ptr<AgentSessions::Stub> stub = ...;
   * queue.async_rpc(
   *     stub.get(), &AgentSessions::Stub::AsyncGetSession, std::move(req), deadline, "debug string",
   *     [](auto const& op, bool ok) { });
   * @endcode
   *
   * The @a ok flag is false if the operation was cancelled.  Otherwise @c op.status has the result of the RPC, and
   * @c op.response the response.  The @a op parameter is of type:
   *
   * @code
   * detail::async_rpc_op<GetSessionRequest, SessionInfo> const&
   * @endcode
   *
   * This function deduces the type of Request and Response parameter based on the member function argument.
   */
  template <typename C, typename M, typename W, typename Functor>
  void async_rpc(
      C* async_client, M C::*call, W&& request, std::chrono::system_clock::time_point deadline, std::string name,
      Functor&& f) {
    using requirements = detail::async_rpc_op_requirements<M>;
    static_assert(
        requirements::matches::value, "The member function signature does not match: "
                                      "std::unique_ptr<grpc::ClientAsyncResponseReader<R>>("
                                      "grpc::ClientContext*,W const&,grpc::CompletionQueue*)");
    using request_type = typename requirements::request_type;
    using response_type = typename requirements::response_type;
    static_assert(
        std::is_same<typename std::decay<W>::type, request_type>::value,
        "Mismatch request parameter type vs. operation signature");

    using op_type = detail::async_rpc_op<request_type, response_type>;
    auto op = create_op<op_type>(std::move(name), std::forward<Functor>(f));
    op->request.Swap(&request);
    op->context.set_deadline(deadline);
    void* tag = register_op("async_rpc()", op);
    interceptor_.async_rpc(async_client, call, op, cq(), tag);
  }

  /**
   * Start an asynchronous RPC call and return a future to wait until it completes.
   *
   * @code
   * completion_queue<> queue = ...;
   * std::unique_ptr<AgentSessions::Stub> stub = ...;
   * auto fut = queue.async_rpc(
   *     stub.get(), &AgentSessions::Stub::AsyncGetSession, std::move(req), deadline, "debug string", use_future());
   * // block until completed ..
   * auto result = fut.get();
   * @endcode
   *
   * The future holds the RPC response when the call succeeds.  Otherwise it holds a sesh::session_error: cancelled
   * operations are @c unreachable, and failed calls carry the classification of their gRPC status.
   *
   * @tparam C the type of the stub to make the request on
   * @tparam M the type of the member function on the stub to make the request
   * @tparam W the type of the request
   *
   * @returns a shared future to wait until the operation completes.
   */
  template <typename C, typename M, typename W>
  std::shared_future<typename detail::async_rpc_op_requirements<M>::response_type> async_rpc(
      C* async_client, M C::*call, W&& request, std::chrono::system_clock::time_point deadline, std::string name,
      use_future) {
    auto promise = std::make_shared<std::promise<typename detail::async_rpc_op_requirements<M>::response_type>>();
    this->async_rpc(
        async_client, call, std::forward<W>(request), deadline, std::move(name), [promise](auto const& op, bool ok) {
          if (not ok) {
            promise->set_exception(
                std::make_exception_ptr(session_error(error_code::unreachable, op.name + " cancelled")));
            return;
          }
          try {
            detail::check_grpc_status(op.status, op.name);
          } catch (session_error const&) {
            promise->set_exception(std::current_exception());
            return;
          }
          // ... protobufs copy, the op is const and released when the callback returns ...
          promise->set_value(op.response);
        });
    return promise->get_future().share();
  }

private:
  /**
   * Create an operation and perform the common initialization.
   *
   * The returned operation has the name and callback fields filled in.  The callback downcasts the operation object
   * and calls the user-provided functor.
   *
   * @tparam op_type the type derived from sesh::detail::base_async_op to create.
   * @tparam Functor the type of the user-provided functor to call when the operation completes.
   * @param name the name (for debugging purposes) of the operation.
   * @param f the user-provided functor to call when the operation completes.
   */
  template <typename op_type, typename Functor>
  std::shared_ptr<op_type> create_op(std::string name, Functor&& f) const {
    auto op = std::make_shared<op_type>();
    op->callback = [functor = std::forward<Functor>(f)](detail::base_async_op & bop, bool ok) {
      auto const& op = dynamic_cast<op_type const&>(bop);
      functor(op, ok);
    };
    op->name = std::move(name);
    return op;
  }

private:
  /// The interceptor to catch all interactions with the underlying grpc::CompletionQueue.
  grpc_interceptor_type interceptor_;
};

} // namespace sesh

#endif // sesh_completion_queue_hpp
