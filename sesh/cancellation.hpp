#ifndef sesh_cancellation_hpp
#define sesh_cancellation_hpp
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

#include <atomic>

namespace sesh {
/**
 * A one-shot signal to stop admitting new work.
 *
 * Raised by any thread, observed by the batch orchestrator and the limiter waits.  Work already admitted runs to
 * completion.
 */
class cancellation {
public:
  cancellation()
      : cancelled_(false) {
  }

  cancellation(cancellation const&) = delete;
  cancellation& operator=(cancellation const&) = delete;

  /// Raise the signal, it cannot be lowered.
  void cancel() {
    cancelled_.store(true);
  }

  bool cancelled() const {
    return cancelled_.load();
  }

private:
  std::atomic<bool> cancelled_;
};

} // namespace sesh

#endif // sesh_cancellation_hpp
