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
#include "sesh/detail/base_completion_queue.hpp"
#include <sesh/assert_throw.hpp>
#include <sesh/log.hpp>

#include <sstream>

namespace sesh {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::loop_timeout;

base_completion_queue::base_completion_queue()
    : mu_()
    , pending_ops_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  std::lock_guard<std::mutex> lock(mu_);
  if (not pending_ops_.empty()) {
    // The operations may point to objects already deleted, calling them to report a cancellation is not safe.  Print
    // the best debug message we can.
    std::ostringstream os;
    for (auto const& op : pending_ops_) {
      os << op.second->name << "\n";
    }
    SESH_LOG(error) << "completion queue deleted while holding " << pending_ops_.size()
                    << " pending operations: " << os.str();
  }
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  while (not shutdown_.load()) {
    auto deadline = std::chrono::system_clock::now() + loop_timeout;

    auto status = queue_.AsyncNext(&tag, &ok, deadline);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      SESH_LOG(trace) << "shutdown, exit loop";
      break;
    }
    if (status == grpc::CompletionQueue::TIMEOUT) {
      continue;
    }
    if (tag == nullptr) {
      SESH_LOG(error) << "null tag reported in asynchronous operation";
      continue;
    }

    // ... try to find the operation in our list of known operations ...
    std::shared_ptr<base_async_op> op = unregister_op(tag);
    if (not op) {
      SESH_LOG(error) << "unknown tag reported in asynchronous operation: " << std::hex << std::intptr_t(tag);
      continue;
    }
    // ... it was there, now it is removed, and the lock is released, call it ...
    op->callback(*op, ok);
  }
}

void base_completion_queue::shutdown() {
  SESH_LOG(trace) << "shutting down queue";
  shutdown_.store(true);
  queue_.Shutdown();
}

std::size_t base_completion_queue::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_ops_.size();
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = static_cast<void*>(op.get());
  auto key = reinterpret_cast<std::intptr_t>(tag);
  std::lock_guard<std::mutex> lock(mu_);
  auto r = pending_ops_.emplace(key, std::move(op));
  SESH_ASSERT_THROW(r.second != false);
  SESH_LOG(trace) << where << " registered " << r.first->second->name;
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  pending_ops_type::iterator i = pending_ops_.find(reinterpret_cast<std::intptr_t>(tag));
  if (i != pending_ops_.end()) {
    auto op = i->second;
    pending_ops_.erase(i);
    return op;
  }
  return std::shared_ptr<base_async_op>();
}

} // namespace detail
} // namespace sesh
