// Repository: Lockstep
// Component: Client configuration unit tests

#include <gtest/gtest.h>

#include <cstdlib>

#include "lockstep/session/ClientConfig.hpp"

namespace lockstep::session {
namespace {

class ClientConfigTest : public ::testing::Test {
 protected:
  void TearDown() override { ::unsetenv(kCoordinatorEnvVar); }
};

TEST_F(ClientConfigTest, Defaults) {
  ClientConfig config;
  EXPECT_EQ(config.coordinator, "localhost:8001");
  EXPECT_EQ(config.container, "player");
  EXPECT_EQ(config.max_reconnect_attempts, 5);
  EXPECT_EQ(config.reconnect_delay_ms, 1000);
  EXPECT_EQ(config.reconnect_delay_max_ms, 5000);
  EXPECT_DOUBLE_EQ(config.sync.drift_threshold_s, 0.35);
  EXPECT_EQ(config.sync.remote_apply_settle_ms, 200);
  EXPECT_EQ(config.sync.local_action_window_ms, 100);
}

TEST_F(ClientConfigTest, CoordinatorComesFromEnvironment) {
  ::unsetenv(kCoordinatorEnvVar);
  EXPECT_EQ(CoordinatorFromEnvironment(), kDefaultCoordinator);

  ::setenv(kCoordinatorEnvVar, "", 1);
  EXPECT_EQ(CoordinatorFromEnvironment(), kDefaultCoordinator);

  ::setenv(kCoordinatorEnvVar, "coordinator.internal:9000", 1);
  EXPECT_EQ(CoordinatorFromEnvironment(), "coordinator.internal:9000");
}

}  // namespace
}  // namespace lockstep::session
