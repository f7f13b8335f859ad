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
#include "sesh/orchestrator_config.hpp"

#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>

namespace {
using setter = std::function<void(sesh::orchestrator_config&, std::string const&)>;

/// Raise the exception for a malformed value.
[[noreturn]] void bad_value(std::string const& name, std::string const& value, char const* expected) {
  std::ostringstream os;
  os << "apply_flag() - invalid value for --" << name << " (" << value << "), expected " << expected;
  throw std::invalid_argument(os.str());
}

long long parse_integer(std::string const& name, std::string const& value) {
  std::size_t pos = 0;
  long long r = 0;
  try {
    r = std::stoll(value, &pos);
  } catch (std::logic_error const&) {
    bad_value(name, value, "an integer");
  }
  if (pos != value.size()) {
    bad_value(name, value, "an integer");
  }
  return r;
}

double parse_double(std::string const& name, std::string const& value) {
  std::size_t pos = 0;
  double r = 0;
  try {
    r = std::stod(value, &pos);
  } catch (std::logic_error const&) {
    bad_value(name, value, "a number");
  }
  if (pos != value.size()) {
    bad_value(name, value, "a number");
  }
  return r;
}

setter milliseconds_field(std::chrono::milliseconds sesh::orchestrator_config::*field, std::string name) {
  return [field, name](sesh::orchestrator_config& c, std::string const& v) {
    c.*field = std::chrono::milliseconds(parse_integer(name, v));
  };
}

setter int_field(int sesh::orchestrator_config::*field, std::string name) {
  return [field, name](sesh::orchestrator_config& c, std::string const& v) {
    auto r = parse_integer(name, v);
    if (r < std::numeric_limits<int>::min() or r > std::numeric_limits<int>::max()) {
      bad_value(name, v, "a value in the int range");
    }
    c.*field = static_cast<int>(r);
  };
}

std::map<std::string, setter> const& setters() {
  static std::map<std::string, setter> const table{
      {"backend-address", [](sesh::orchestrator_config& c, std::string const& v) { c.backend_address = v; }},
      {"call-timeout-ms", milliseconds_field(&sesh::orchestrator_config::call_timeout, "call-timeout-ms")},
      {"retry-max-attempts", int_field(&sesh::orchestrator_config::retry_max_attempts, "retry-max-attempts")},
      {"retry-base-delay-ms", milliseconds_field(&sesh::orchestrator_config::retry_base_delay, "retry-base-delay-ms")},
      {"retry-multiplier",
       [](sesh::orchestrator_config& c, std::string const& v) {
         c.retry_multiplier = parse_double("retry-multiplier", v);
       }},
      {"retry-max-delay-ms", milliseconds_field(&sesh::orchestrator_config::retry_max_delay, "retry-max-delay-ms")},
      {"limiter-capacity", int_field(&sesh::orchestrator_config::limiter_capacity, "limiter-capacity")},
      {"pool-capacity", int_field(&sesh::orchestrator_config::pool_capacity, "pool-capacity")},
      {"pool-max-wait-ms", milliseconds_field(&sesh::orchestrator_config::pool_max_wait, "pool-max-wait-ms")},
      {"agent-id", [](sesh::orchestrator_config& c, std::string const& v) { c.agent_id = v; }},
      {"log-level", [](sesh::orchestrator_config& c, std::string const& v) { c.log_level = sesh::parse_severity(v); }},
  };
  return table;
}

/// Raise the exception for an invalid configuration.
[[noreturn]] void invalid(char const* field, std::string const& requirement) {
  std::ostringstream os;
  os << "orchestrator_config::validate() - " << field << " " << requirement;
  throw std::invalid_argument(os.str());
}
} // anonymous namespace

namespace sesh {

orchestrator_config::orchestrator_config()
    : backend_address("localhost:8000")
    , call_timeout(30000)
    , retry_max_attempts(3)
    , retry_base_delay(50)
    , retry_multiplier(2.0)
    , retry_max_delay(2000)
    , limiter_capacity(10)
    , pool_capacity(5)
    , pool_max_wait(0)
    , agent_id("dynamic_session_agent")
    , log_level(severity::info) {
}

void orchestrator_config::validate() const {
  if (backend_address.empty()) {
    invalid("backend_address", "should not be empty");
  }
  if (agent_id.empty()) {
    invalid("agent_id", "should not be empty");
  }
  if (call_timeout.count() <= 0) {
    invalid("call_timeout", "should be > 0ms");
  }
  if (retry_max_attempts <= 0) {
    invalid("retry_max_attempts", "should be > 0");
  }
  if (retry_base_delay.count() < 0) {
    invalid("retry_base_delay", "should be >= 0ms");
  }
  if (retry_max_delay < retry_base_delay) {
    invalid("retry_max_delay", "should be >= retry_base_delay");
  }
  if (not(retry_multiplier >= 1.0)) {
    invalid("retry_multiplier", "should be >= 1.0");
  }
  if (limiter_capacity <= 0) {
    invalid("limiter_capacity", "should be > 0");
  }
  if (pool_capacity < 0) {
    invalid("pool_capacity", "should be >= 0");
  }
  if (pool_max_wait.count() < 0) {
    invalid("pool_max_wait", "should be >= 0ms");
  }
}

std::ostream& operator<<(std::ostream& os, orchestrator_config const& x) {
  return os << "--backend-address=" << x.backend_address << " --call-timeout-ms=" << x.call_timeout.count()
            << " --retry-max-attempts=" << x.retry_max_attempts
            << " --retry-base-delay-ms=" << x.retry_base_delay.count() << " --retry-multiplier=" << x.retry_multiplier
            << " --retry-max-delay-ms=" << x.retry_max_delay.count() << " --limiter-capacity=" << x.limiter_capacity
            << " --pool-capacity=" << x.pool_capacity << " --pool-max-wait-ms=" << x.pool_max_wait.count()
            << " --agent-id=" << x.agent_id << " --log-level=" << x.log_level;
}

bool apply_flag(orchestrator_config& config, std::string const& arg) {
  if (arg.compare(0, 2, "--") != 0) {
    return false;
  }
  auto eq = arg.find('=');
  auto name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
  auto i = setters().find(name);
  if (i == setters().end()) {
    return false;
  }
  if (eq == std::string::npos) {
    std::ostringstream os;
    os << "apply_flag() - missing value for --" << name << ", expected --" << name << "=value";
    throw std::invalid_argument(os.str());
  }
  i->second(config, arg.substr(eq + 1));
  return true;
}

} // namespace sesh
