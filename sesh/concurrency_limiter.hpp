#ifndef sesh_concurrency_limiter_hpp
#define sesh_concurrency_limiter_hpp
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

#include <sesh/cancellation.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sesh {

/**
 * Bound the number of remote calls in flight.
 *
 * A counting semaphore with a fixed capacity, shared by everything that talks to the same backend: the single-item
 * calls in the session_manager, the batch workers, and the session pools.  Callers block in acquire() until a slot is
 * free, and must call release() exactly once per successful acquire, use sesh::limiter_slot to make that automatic.
 */
class concurrency_limiter {
public:
  /// How often a cancellable acquire() checks the cancellation signal.
  static std::chrono::milliseconds constexpr poll_period{10};

  /// Create a limiter with @a capacity slots, @a capacity must be positive.
  explicit concurrency_limiter(int capacity);

  concurrency_limiter(concurrency_limiter const&) = delete;
  concurrency_limiter& operator=(concurrency_limiter const&) = delete;

  /// Block until a slot is free and take it.
  void acquire();

  /**
   * Block until a slot is free, or @a cancel is raised.
   *
   * @returns true if the slot was taken, false if the wait stopped because of the cancellation.
   */
  bool acquire(cancellation const& cancel);

  /// Return one slot.  Releasing more slots than acquired is a bug, and raises std::logic_error.
  void release();

  //@{
  /// @name Instrumentation
  int capacity() const {
    return capacity_;
  }
  int in_flight() const;
  /// The largest number of slots held at the same time since construction.
  int high_water_mark() const;
  //@}

private:
  /// Take a slot, must be called with mu_ held and a slot free.
  void take_slot();

private:
  int const capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int in_flight_;
  int high_water_mark_;
};

/**
 * Hold a concurrency_limiter slot for the duration of a scope.
 *
 * Releases the slot on every exit path, including exceptions.
 */
class limiter_slot {
public:
  explicit limiter_slot(concurrency_limiter& limiter)
      : limiter_(limiter)
      , held_(false) {
    limiter_.acquire();
    held_ = true;
  }

  /// Try to take a slot, check the result with the bool operator.
  limiter_slot(concurrency_limiter& limiter, cancellation const& cancel)
      : limiter_(limiter)
      , held_(false) {
    held_ = limiter_.acquire(cancel);
  }

  ~limiter_slot() {
    if (held_) {
      limiter_.release();
    }
  }

  explicit operator bool() const {
    return held_;
  }

  limiter_slot(limiter_slot&&) = delete;
  limiter_slot& operator=(limiter_slot&&) = delete;
  limiter_slot(limiter_slot const&) = delete;
  limiter_slot& operator=(limiter_slot const&) = delete;

private:
  concurrency_limiter& limiter_;
  bool held_;
};

} // namespace sesh

#endif // sesh_concurrency_limiter_hpp
