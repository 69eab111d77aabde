// Repository: Lockstep
// Component: Client Configuration
// Purpose: Process-level settings for the headless client.
// Copyright (c) 2026 Lockstep

#include "lockstep/session/ClientConfig.hpp"

#include <cstdlib>

namespace lockstep::session {

std::string CoordinatorFromEnvironment() {
  const char* value = std::getenv(kCoordinatorEnvVar);
  if (value == nullptr || value[0] == '\0') return kDefaultCoordinator;
  return value;
}

}  // namespace lockstep::session
