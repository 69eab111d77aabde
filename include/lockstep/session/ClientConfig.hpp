// Repository: Lockstep
// Component: Client Configuration
// Purpose: Process-level settings for the headless client.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SESSION_CLIENT_CONFIG_HPP_
#define LOCKSTEP_SESSION_CLIENT_CONFIG_HPP_

#include <cstdint>
#include <string>

#include "lockstep/sync/SyncConfig.hpp"

namespace lockstep::session {

inline constexpr const char* kDefaultCoordinator = "localhost:8001";
inline constexpr const char* kCoordinatorEnvVar = "LOCKSTEP_COORDINATOR";

struct ClientConfig {
  // host:port of the SessionCoordinator service.
  std::string coordinator = kDefaultCoordinator;
  // Sent with every intent. Empty lets the coordinator assign one.
  std::string client_id;
  // Hosting container for the playback surface.
  std::string container = "player";

  // Transport (see GrpcTransportConfig).
  int64_t connect_timeout_ms = 20000;
  int64_t reconnect_delay_ms = 1000;
  int64_t reconnect_delay_max_ms = 5000;
  double reconnect_randomization = 0.5;
  int max_reconnect_attempts = 5;

  // Simulated surface.
  int64_t surface_load_delay_ms = 300;
  double surface_duration_s = 0.0;

  sync::SyncConfig sync;
};

// Coordinator from LOCKSTEP_COORDINATOR, else the default.
std::string CoordinatorFromEnvironment();

}  // namespace lockstep::session

#endif  // LOCKSTEP_SESSION_CLIENT_CONFIG_HPP_
