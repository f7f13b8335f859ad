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
#include "sesh/concurrency_limiter.hpp"
#include <sesh/assert_throw.hpp>
#include <sesh/log.hpp>

#include <sstream>
#include <stdexcept>

namespace sesh {

std::chrono::milliseconds constexpr concurrency_limiter::poll_period;

concurrency_limiter::concurrency_limiter(int capacity)
    : capacity_(capacity)
    , mu_()
    , cv_()
    , in_flight_(0)
    , high_water_mark_(0) {
  if (capacity_ <= 0) {
    std::ostringstream os;
    os << "concurrency_limiter() - capacity (" << capacity_ << ") should be > 0";
    throw std::invalid_argument(os.str());
  }
}

void concurrency_limiter::acquire() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this]() { return in_flight_ < capacity_; });
  take_slot();
}

bool concurrency_limiter::acquire(cancellation const& cancel) {
  std::unique_lock<std::mutex> lock(mu_);
  // ... the cancellation signal does not notify the condition variable, check it periodically ...
  while (in_flight_ >= capacity_) {
    if (cancel.cancelled()) {
      return false;
    }
    cv_.wait_for(lock, poll_period);
  }
  if (cancel.cancelled()) {
    return false;
  }
  take_slot();
  return true;
}

void concurrency_limiter::release() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    SESH_ASSERT_THROW(in_flight_ > 0);
    --in_flight_;
  }
  cv_.notify_one();
}

int concurrency_limiter::in_flight() const {
  std::lock_guard<std::mutex> lock(mu_);
  return in_flight_;
}

int concurrency_limiter::high_water_mark() const {
  std::lock_guard<std::mutex> lock(mu_);
  return high_water_mark_;
}

void concurrency_limiter::take_slot() {
  ++in_flight_;
  if (in_flight_ > high_water_mark_) {
    high_water_mark_ = in_flight_;
  }
  SESH_LOG(trace) << "limiter slot taken, in_flight=" << in_flight_ << "/" << capacity_;
}

} // namespace sesh
