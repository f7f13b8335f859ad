#ifndef sesh_active_completion_queue_hpp
#define sesh_active_completion_queue_hpp
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

#include <sesh/completion_queue.hpp>

#include <memory>
#include <thread>

namespace sesh {

/**
 * Create a completion_queue with an associated thread running its loop.
 *
 * This deals with the awful order of construction problems.  It holds a completion queue and a thread running the
 * event loop for the queue.  On destruction it shuts down the completion queue first, and then joins the thread.
 * Every RPC made by an agent_sessions_client completes in this thread, the calling threads block on futures.
 */
class active_completion_queue {
public:
  /// Constructor, creates new completion queue and thread.
  active_completion_queue()
      : queue_(std::make_shared<completion_queue<>>())
      , thread_([q = queue()]() { q->run(); })
      , join_(&thread_)
      , shutdown_(queue()) {
  }

  /// Constructor from existing queue and thread.  Assumes thread calls q->run().
  active_completion_queue(std::shared_ptr<completion_queue<>> q, std::thread&& t)
      : queue_(std::move(q))
      , thread_(std::move(t))
      , join_(&thread_)
      , shutdown_(queue()) {
  }

  active_completion_queue(active_completion_queue&& rhs)
      : queue_(std::move(rhs.queue_))
      , thread_(std::move(rhs.thread_))
      , join_(&thread_)
      , shutdown_(queue()) {
    rhs.shutdown_.release();
  }
  active_completion_queue& operator=(active_completion_queue&& rhs) {
    active_completion_queue tmp(std::move(*this));
    queue_ = std::move(rhs.queue_);
    thread_ = std::move(rhs.thread_);
    shutdown_.queue = queue();
    rhs.shutdown_.release();
    return *this;
  }
  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  ~active_completion_queue();

  explicit operator bool() const {
    return (bool)queue_;
  }

  completion_queue<>& cq() {
    return *queue_;
  }

private:
  /// A helper for the lambdas in the constructor
  std::shared_ptr<completion_queue<>> queue() {
    return queue_;
  }

  /// Shutdown a completion queue
  struct defer_shutdown {
    explicit defer_shutdown(std::shared_ptr<completion_queue<>> q)
        : queue(std::move(q)) {
    }
    ~defer_shutdown();
    void release() {
      queue.reset();
    }
    std::shared_ptr<completion_queue<>> queue;
  };

  /// Join a thread
  struct defer_join {
    explicit defer_join(std::thread* t)
        : thread(t) {
    }
    ~defer_join();
    std::thread* thread;
  };

private:
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
  defer_join join_;
  defer_shutdown shutdown_;
};

} // namespace sesh

#endif // sesh_active_completion_queue_hpp
