#include "sesh/orchestrator_config.hpp"

#include <gmock/gmock.h>

#include <functional>
#include <sstream>

/**
 * @test Verify the default values of sesh::orchestrator_config.
 */
TEST(orchestrator_config, defaults) {
  sesh::orchestrator_config config;
  EXPECT_EQ(config.backend_address, "localhost:8000");
  EXPECT_EQ(config.call_timeout.count(), 30000);
  EXPECT_EQ(config.retry_max_attempts, 3);
  EXPECT_EQ(config.retry_base_delay.count(), 50);
  EXPECT_EQ(config.retry_multiplier, 2.0);
  EXPECT_EQ(config.retry_max_delay.count(), 2000);
  EXPECT_EQ(config.limiter_capacity, 10);
  EXPECT_EQ(config.pool_capacity, 5);
  EXPECT_EQ(config.pool_max_wait.count(), 0);
  EXPECT_EQ(config.agent_id, "dynamic_session_agent");
  EXPECT_EQ(config.log_level, sesh::severity::info);
  EXPECT_NO_THROW(config.validate());
}

/**
 * @test Verify that validate() rejects inconsistent configurations.
 */
TEST(orchestrator_config, validate) {
  using namespace std::chrono_literals;
  auto check = [](std::function<void(sesh::orchestrator_config&)> change) {
    sesh::orchestrator_config config;
    change(config);
    EXPECT_THROW(config.validate(), std::invalid_argument);
  };
  check([](auto& c) { c.backend_address = ""; });
  check([](auto& c) { c.agent_id = ""; });
  check([](auto& c) { c.call_timeout = 0ms; });
  check([](auto& c) { c.retry_max_attempts = 0; });
  check([](auto& c) { c.retry_base_delay = -1ms; });
  check([](auto& c) { c.retry_max_delay = 10ms; });
  check([](auto& c) { c.retry_multiplier = 0.5; });
  check([](auto& c) { c.limiter_capacity = 0; });
  check([](auto& c) { c.pool_capacity = -1; });
  check([](auto& c) { c.pool_max_wait = -5ms; });

  sesh::orchestrator_config config;
  config.pool_capacity = 0;
  config.retry_max_attempts = 1;
  EXPECT_NO_THROW(config.validate());
}

/**
 * @test Verify that apply_flag() parses every flag.
 */
TEST(orchestrator_config, apply_flag) {
  sesh::orchestrator_config config;
  EXPECT_TRUE(sesh::apply_flag(config, "--backend-address=backend:9000"));
  EXPECT_TRUE(sesh::apply_flag(config, "--call-timeout-ms=1500"));
  EXPECT_TRUE(sesh::apply_flag(config, "--retry-max-attempts=5"));
  EXPECT_TRUE(sesh::apply_flag(config, "--retry-base-delay-ms=20"));
  EXPECT_TRUE(sesh::apply_flag(config, "--retry-multiplier=1.5"));
  EXPECT_TRUE(sesh::apply_flag(config, "--retry-max-delay-ms=800"));
  EXPECT_TRUE(sesh::apply_flag(config, "--limiter-capacity=4"));
  EXPECT_TRUE(sesh::apply_flag(config, "--pool-capacity=3"));
  EXPECT_TRUE(sesh::apply_flag(config, "--pool-max-wait-ms=250"));
  EXPECT_TRUE(sesh::apply_flag(config, "--agent-id=echo_agent"));
  EXPECT_TRUE(sesh::apply_flag(config, "--log-level=debug"));

  EXPECT_EQ(config.backend_address, "backend:9000");
  EXPECT_EQ(config.call_timeout.count(), 1500);
  EXPECT_EQ(config.retry_max_attempts, 5);
  EXPECT_EQ(config.retry_base_delay.count(), 20);
  EXPECT_EQ(config.retry_multiplier, 1.5);
  EXPECT_EQ(config.retry_max_delay.count(), 800);
  EXPECT_EQ(config.limiter_capacity, 4);
  EXPECT_EQ(config.pool_capacity, 3);
  EXPECT_EQ(config.pool_max_wait.count(), 250);
  EXPECT_EQ(config.agent_id, "echo_agent");
  EXPECT_EQ(config.log_level, sesh::severity::debug);
  EXPECT_NO_THROW(config.validate());
}

/**
 * @test Verify that apply_flag() ignores other arguments and rejects malformed values.
 */
TEST(orchestrator_config, apply_flag_errors) {
  sesh::orchestrator_config config;
  EXPECT_FALSE(sesh::apply_flag(config, "create"));
  EXPECT_FALSE(sesh::apply_flag(config, "--sessions=10"));
  EXPECT_FALSE(sesh::apply_flag(config, "-v"));

  EXPECT_THROW(sesh::apply_flag(config, "--limiter-capacity=ten"), std::invalid_argument);
  EXPECT_THROW(sesh::apply_flag(config, "--limiter-capacity=10x"), std::invalid_argument);
  EXPECT_THROW(sesh::apply_flag(config, "--limiter-capacity=99999999999"), std::invalid_argument);
  EXPECT_THROW(sesh::apply_flag(config, "--retry-multiplier="), std::invalid_argument);
  EXPECT_THROW(sesh::apply_flag(config, "--call-timeout-ms"), std::invalid_argument);
  EXPECT_THROW(sesh::apply_flag(config, "--log-level=loud"), std::invalid_argument);
  EXPECT_EQ(config.limiter_capacity, 10);
}

/**
 * @test Verify that the streaming operator prints flags apply_flag() accepts.
 */
TEST(orchestrator_config, streaming) {
  sesh::orchestrator_config config;
  config.agent_id = "echo_agent";
  config.limiter_capacity = 7;
  std::ostringstream os;
  os << config;
  using namespace ::testing;
  EXPECT_THAT(os.str(), HasSubstr("--agent-id=echo_agent"));
  EXPECT_THAT(os.str(), HasSubstr("--limiter-capacity=7"));

  sesh::orchestrator_config copy;
  std::istringstream is(os.str());
  std::string arg;
  while (is >> arg) {
    EXPECT_TRUE(sesh::apply_flag(copy, arg)) << arg;
  }
  EXPECT_EQ(copy.agent_id, "echo_agent");
  EXPECT_EQ(copy.limiter_capacity, 7);
}
