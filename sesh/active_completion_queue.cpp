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
#include "sesh/active_completion_queue.hpp"
#include <sesh/log.hpp>

namespace sesh {

active_completion_queue::~active_completion_queue() {
  SESH_LOG(trace) << "delete active completion queue";
}

active_completion_queue::defer_shutdown::~defer_shutdown() {
  if (queue) {
    SESH_LOG(trace) << "shutdown active completion queue";
    queue->shutdown();
  }
}

active_completion_queue::defer_join::~defer_join() {
  if (thread != nullptr and thread->joinable()) {
    SESH_LOG(trace) << "join active completion queue";
    thread->join();
  }
}

} // namespace sesh
