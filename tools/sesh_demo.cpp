#include <sesh/agent_sessions_client.hpp>
#include <sesh/log.hpp>
#include <sesh/session_manager.hpp>

#include <iostream>
#include <map>

namespace {
/// The parameters of the demos that are not part of the orchestrator configuration.
struct demo_options {
  std::string command = "all";
  int sessions = 5;
  int messages = 3;
  std::string text = "What can you help me with?";
};

void usage(char const* argv0) {
  std::cerr << "Usage: " << argv0 << " [create|broadcast|load|pool|all] [--sessions=N] [--messages=M] [--text=...]"
            << " [--backend-address=host:port] [--agent-id=id] [--limiter-capacity=N] [--pool-capacity=N]"
            << " [--call-timeout-ms=N] [--retry-max-attempts=N] [--retry-base-delay-ms=N] [--retry-multiplier=X]"
            << " [--retry-max-delay-ms=N] [--pool-max-wait-ms=N] [--log-level=level]" << std::endl;
}

bool flag_value(std::string const& arg, std::string const& name, std::string& value) {
  auto prefix = "--" + name + "=";
  if (arg.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

/// Delete the sessions created by a demo, and report any failure.
void cleanup(sesh::session_manager& manager, std::vector<std::string> const& ids) {
  auto deleted = manager.run_batch(sesh::make_delete_batch(ids));
  std::cout << "cleanup " << deleted << std::endl;
}

/// Create N sessions concurrently, each with its own user state.
void demo_create(sesh::session_manager& manager, demo_options const& options) {
  std::cout << "=== concurrent creation of " << options.sessions << " session(s)" << std::endl;
  std::vector<sesh::session_state> states;
  for (int i = 1; i <= options.sessions; ++i) {
    auto n = std::to_string(i);
    states.push_back(sesh::make_user_state("User " + n, "user" + n + "@example.com", "Interested in topic " + n));
  }
  auto result = manager.run_batch(sesh::make_create_batch(manager.config().agent_id, states));
  std::cout << result << std::endl;
  for (auto const& o : result.outcomes) {
    if (o.success) {
      std::cout << "  " << o.key << " -> " << o.session_id << std::endl;
    }
  }
  cleanup(manager, result.session_ids());
}

/// Send the same message to several sessions in parallel.
void demo_broadcast(sesh::session_manager& manager, demo_options const& options) {
  std::cout << "=== broadcast to 3 session(s): \"" << options.text << "\"" << std::endl;
  auto created = manager.run_batch(sesh::make_create_batch(
      manager.config().agent_id, {sesh::make_user_state("Alice", "", "Software engineer"),
                                  sesh::make_user_state("Bob", "", "Data scientist"),
                                  sesh::make_user_state("Carol", "", "Student")}));
  std::cout << "create " << created << std::endl;

  auto ids = created.session_ids();
  std::map<std::string, std::string> names;
  for (auto const& o : created.outcomes) {
    names[o.session_id] = o.key;
  }
  auto replies = manager.run_batch(sesh::make_broadcast_batch(ids, options.text));
  std::cout << "broadcast " << replies << std::endl;
  for (auto const& o : replies.outcomes) {
    if (o.success) {
      std::cout << "  " << names[o.session_id] << ": " << o.response_text << std::endl;
    }
  }
  cleanup(manager, ids);
}

/// Create N sessions and send M messages to each, report the throughput of each phase.
void demo_load(sesh::session_manager& manager, demo_options const& options) {
  std::cout << "=== load test: " << options.sessions << " session(s) x " << options.messages << " message(s)"
            << std::endl;
  std::vector<sesh::session_state> states;
  for (int i = 0; i != options.sessions; ++i) {
    states.push_back(sesh::make_user_state("LoadTest" + std::to_string(i)));
  }
  auto created = manager.run_batch(sesh::make_create_batch(manager.config().agent_id, states));
  std::cout << "phase 1 (create) " << created << std::endl;

  auto ids = created.session_ids();
  std::vector<sesh::work_item> items;
  for (auto const& id : ids) {
    for (int i = 1; i <= options.messages; ++i) {
      items.push_back(sesh::make_message_item(id, "Test message " + std::to_string(i), id));
    }
  }
  auto messages = manager.run_batch(items);
  std::cout << "phase 2 (messages) " << messages << std::endl;

  auto total = created.elapsed + messages.elapsed;
  auto ops = created.outcomes.size() + messages.outcomes.size();
  auto seconds = std::chrono::duration<double>(total).count();
  std::cout << "total: " << ops << " operation(s) in " << seconds << "s, "
            << (seconds > 0 ? ops / seconds : 0.0) << " op/s, limiter high water mark "
            << manager.limiter().high_water_mark() << "/" << manager.limiter().capacity() << std::endl;
  cleanup(manager, ids);
}

/// Fill a pool, run a few acquire / message / release cycles, and drain it.
void demo_pool(sesh::session_manager& manager, demo_options const& options) {
  std::cout << "=== pool round-trip, capacity " << manager.config().pool_capacity << std::endl;
  auto pool = manager.make_pool(manager.config().agent_id, sesh::make_user_state("Pooled User"));
  auto filled = pool->initialize(pool->capacity());
  std::cout << "initialize " << filled << std::endl;
  if (pool->available_count() == 0) {
    std::cout << "no sessions available, skipping the round-trip" << std::endl;
    return;
  }
  for (int i = 0; i != options.messages; ++i) {
    auto s = pool->acquire();
    try {
      auto reply = manager.send_message(s, options.text);
      std::cout << "  " << s.id << ": " << reply.text << std::endl;
    } catch (sesh::session_error const& ex) {
      std::cout << "  " << s.id << ": FAILED (" << ex.code() << ") " << ex.what() << std::endl;
    }
    pool->release(s);
  }
  std::cout << "drain " << pool->drain() << std::endl;
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  sesh::orchestrator_config config;
  demo_options options;
  for (int i = 1; i != argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (sesh::apply_flag(config, arg)) {
      continue;
    }
    if (flag_value(arg, "sessions", value)) {
      options.sessions = std::stoi(value);
    } else if (flag_value(arg, "messages", value)) {
      options.messages = std::stoi(value);
    } else if (flag_value(arg, "text", value)) {
      options.text = value;
    } else if (arg.compare(0, 2, "--") != 0) {
      options.command = arg;
    } else {
      usage(argv[0]);
      return 1;
    }
  }
  config.validate();

  sesh::log::instance().add_sink(
      sesh::make_log_sink([](sesh::severity sev, std::string&& x) { std::cerr << x << std::endl; }));
  sesh::log::instance().min_severity(config.log_level);

  sesh::session_manager manager(sesh::make_agent_sessions_client(config.backend_address, config.call_timeout), config);
  std::cout << "backend " << config.backend_address << ", agent " << config.agent_id << std::endl;

  using demo = void (*)(sesh::session_manager&, demo_options const&);
  std::map<std::string, demo> const demos{
      {"create", &demo_create}, {"broadcast", &demo_broadcast}, {"load", &demo_load}, {"pool", &demo_pool}};
  if (options.command == "all") {
    for (auto const& d : {"create", "broadcast", "load", "pool"}) {
      demos.at(d)(manager, options);
    }
    return 0;
  }
  auto d = demos.find(options.command);
  if (d == demos.end()) {
    usage(argv[0]);
    return 1;
  }
  d->second(manager, options);
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
