#include <sesh/detail/in_memory_backend.hpp>
#include <sesh/log.hpp>

#include <grpc++/grpc++.h>

#include <csignal>
#include <iostream>
#include <sstream>
#include <thread>

namespace {
bool interrupt = false;
extern "C" void signal_handler(int sig) {
  interrupt = true;
}

/// Extract the value of a --name=value argument, returns false if @a arg is not that flag.
bool flag_value(std::string const& arg, std::string const& name, std::string& value) {
  auto prefix = "--" + name + "=";
  if (arg.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

std::vector<std::string> split(std::string const& list) {
  std::vector<std::string> r;
  std::istringstream is(list);
  std::string item;
  while (std::getline(is, item, ',')) {
    if (not item.empty()) {
      r.push_back(item);
    }
  }
  return r;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  std::string address = "0.0.0.0:8000";
  std::vector<std::string> agents;
  std::chrono::milliseconds latency(0);
  int fail_next = 0;
  sesh::severity level = sesh::severity::info;
  for (int i = 1; i != argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (flag_value(arg, "address", value)) {
      address = value;
    } else if (flag_value(arg, "agents", value)) {
      agents = split(value);
    } else if (flag_value(arg, "latency-ms", value)) {
      latency = std::chrono::milliseconds(std::stoll(value));
    } else if (flag_value(arg, "fail-next", value)) {
      fail_next = std::stoi(value);
    } else if (flag_value(arg, "log-level", value)) {
      level = sesh::parse_severity(value);
    } else {
      std::cerr << "Usage: " << argv[0]
                << " [--address=host:port] [--agents=a,b,...] [--latency-ms=N] [--fail-next=N] [--log-level=level]"
                << std::endl;
      return 1;
    }
  }

  sesh::log::instance().add_sink(
      sesh::make_log_sink([](sesh::severity sev, std::string&& x) { std::cerr << x << std::endl; }));
  sesh::log::instance().min_severity(level);

  sesh::detail::in_memory_backend backend(agents);
  backend.latency(latency);
  if (fail_next > 0) {
    backend.fail_next(fail_next);
  }

  grpc::ServerBuilder builder;
  builder.AddListeningPort(address, grpc::InsecureServerCredentials());
  builder.RegisterService(&backend);
  auto server = builder.BuildAndStart();
  if (not server) {
    std::cerr << "could not start the server on " << address << std::endl;
    return 1;
  }
  SESH_LOG(notice) << "sesh_backend listening on " << address;

  // ... block here until a signal is received ...
  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);
  while (not interrupt) {
    std::this_thread::sleep_for(20ms);
  }

  SESH_LOG(notice) << "sesh_backend shutting down, " << backend.session_count() << " session(s), "
                   << backend.call_count() << " call(s) served";
  server->Shutdown();
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
