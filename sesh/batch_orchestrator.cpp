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
#include "sesh/batch_orchestrator.hpp"
#include <sesh/log.hpp>

#include <algorithm>
#include <atomic>

namespace sesh {

batch_result batch_orchestrator::run_batch(std::vector<work_item> const& items) {
  cancellation never;
  return run_batch(items, never);
}

batch_result batch_orchestrator::run_batch(std::vector<work_item> const& items, cancellation const& cancel) {
  auto start = std::chrono::steady_clock::now();
  batch_result result;
  result.outcomes.resize(items.size());
  for (std::size_t i = 0; i != items.size(); ++i) {
    auto& outcome = result.outcomes[i];
    outcome.index = i;
    outcome.key = items[i].key;
    outcome.kind = items[i].kind;
    outcome.session_id = items[i].kind == work_kind::create_session ? std::string() : items[i].target;
  }

  std::atomic<std::size_t> next(0);
  auto worker = [this, &items, &result, &cancel, &next]() {
    for (auto i = next++; i < items.size(); i = next++) {
      auto& outcome = result.outcomes[i];
      limiter_slot slot(limiter_, cancel);
      if (not slot) {
        outcome.error = error_code::cancelled;
        outcome.message = "batch cancelled before the item started";
        continue;
      }
      execute(items[i], outcome);
    }
  };

  auto count = std::min(items.size(), static_cast<std::size_t>(limiter_.capacity()));
  SESH_LOG(debug) << "running batch of " << items.size() << " item(s) on " << count << " worker(s)";
  {
    std::vector<std::thread> workers;
    defer_join join(workers);
    for (std::size_t i = 0; i != count; ++i) {
      workers.emplace_back(worker);
    }
  }

  result.elapsed =
      std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
  SESH_LOG(info) << "batch done: " << result.success_count() << " succeeded, " << result.failure_count()
                 << " failed, elapsed=" << std::chrono::duration_cast<std::chrono::milliseconds>(result.elapsed).count()
                 << "ms";
  return result;
}

void batch_orchestrator::execute(work_item const& item, work_outcome& outcome) {
  try {
    switch (item.kind) {
    case work_kind::create_session: {
      auto created = retry_.run(
          "batch/create_session", [this, &item]() { return client_.create_session(item.target, item.initial_state); },
          outcome.attempts);
      outcome.session_id = std::move(created.id);
      outcome.created_at = created.created_at;
    } break;
    case work_kind::send_message: {
      auto reply = retry_.run(
          "batch/send_message", [this, &item]() { return client_.send_message(item.target, item.text); },
          outcome.attempts);
      outcome.response_text = std::move(reply.text);
      outcome.state = std::move(reply.state);
      outcome.has_state = reply.has_state;
    } break;
    case work_kind::delete_session:
      retry_.run(
          "batch/delete_session", [this, &item]() { client_.delete_session(item.target); }, outcome.attempts);
      break;
    }
    outcome.success = true;
  } catch (session_error const& ex) {
    outcome.error = ex.code();
    outcome.message = ex.what();
  } catch (std::exception const& ex) {
    SESH_LOG(error) << "unexpected exception in batch item #" << outcome.index << ": " << ex.what();
    outcome.error = error_code::remote_error;
    outcome.message = ex.what();
  }
}

batch_orchestrator::defer_join::~defer_join() {
  for (auto& t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }
}

} // namespace sesh
