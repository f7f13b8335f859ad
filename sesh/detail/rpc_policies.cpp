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
#include "sesh/detail/rpc_policies.hpp"

#include <sstream>

namespace sesh {
namespace detail {
std::chrono::milliseconds exponential_backoff::on_failure() {
  auto current = current_delay_;
  // ... compute in floating point, a large multiplier would overflow the milliseconds representation ...
  if (current_delay_.count() * multiplier_ >= static_cast<double>(max_delay_.count())) {
    current_delay_ = max_delay_;
  } else {
    current_delay_ = std::chrono::duration_cast<std::chrono::milliseconds>(current_delay_ * multiplier_);
  }
  return current;
}

std::unique_ptr<rpc_backoff_policy> exponential_backoff::clone() const {
  return std::unique_ptr<rpc_backoff_policy>(new exponential_backoff(min_delay_, max_delay_, multiplier_));
}

void exponential_backoff::validate_arguments() {
  if (min_delay_ > max_delay_) {
    std::ostringstream os;
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) should be <= max_delay ("
       << max_delay_.count() << "ms)";
    throw std::invalid_argument(os.str());
  }
  if (min_delay_.count() < 0) {
    std::ostringstream os;
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) should be >= 0";
    throw std::invalid_argument(os.str());
  }
  if (not(multiplier_ >= 1.0)) {
    std::ostringstream os;
    os << "exponential_backoff() - multiplier (" << multiplier_ << ") should be >= 1.0";
    throw std::invalid_argument(os.str());
  }
}

bool limited_attempts::on_failure() {
  return ++attempts_ < maximum_attempts_;
}

std::unique_ptr<rpc_retry_policy> limited_attempts::clone() const {
  return std::unique_ptr<rpc_retry_policy>(new limited_attempts(maximum_attempts_));
}

void limited_attempts::validate_arguments() {
  if (maximum_attempts_ <= 0) {
    std::ostringstream os;
    os << "limited_attempts() - maximum_attempts (" << maximum_attempts_ << ") should be > 0";
    throw std::invalid_argument(os.str());
  }
}

} // namespace detail
} // namespace sesh
