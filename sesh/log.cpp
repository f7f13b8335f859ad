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
#include "sesh/log.hpp"

#include <algorithm>
#include <cstring>
#include <ostream>

namespace {
std::once_flag log_initialized;

/// The sink returned by sesh::make_stream_sink()
class stream_sink : public sesh::log_sink {
public:
  explicit stream_sink(std::ostream& os)
      : mu_()
      , os_(os) {
  }

  void log(sesh::severity sev, std::string&& message) override {
    std::lock_guard<std::mutex> lock(mu_);
    os_ << message << "\n";
    os_.flush();
  }

private:
  std::mutex mu_;
  std::ostream& os_;
};

/// Only the basename of __FILE__ is interesting in a log line.
char const* file_basename(char const* path) {
  char const* slash = std::strrchr(path, '/');
  return slash == nullptr ? path : slash + 1;
}
} // anonymous namespace

namespace sesh {

std::unique_ptr<log> log::singleton_;

log& log::instance() {
  std::call_once(log_initialized, []() { singleton_.reset(new log); });
  return *singleton_;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

void log::remove_sink(std::shared_ptr<log_sink> const& sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  // ... copy the sinks so a slow sink does not block other threads from adding or removing sinks ...
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sinks_.empty() or sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // Special case, very common and avoid copying the message ...
  if (sinks.size() == 1) {
    sinks[0]->log(sev, std::move(msg));
    return;
  }
  for (auto const& s : sinks) {
    std::string copy(msg);
    s->log(sev, std::move(copy));
  }
}

logger<false>::logger(severity s, char const* func, char const* file, int l, log& sink)
    : os()
    , sev(s)
    , lineno(l)
    , closed(sev < sink.min_severity()) {
  if (closed) {
    return;
  }
  function = func;
  filename = file_basename(file);
  os << "[" << sev << "] ";
}

void logger<false>::write_to(log& sink) {
  closed = true;
  os << " in " << function << "(" << filename << ":" << lineno << ")";
  sink.write(sev, os.str());
}

std::shared_ptr<log_sink> make_stream_sink(std::ostream& os) {
  return std::make_shared<stream_sink>(os);
}

} // namespace sesh
