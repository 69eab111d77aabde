// Repository: Lockstep
// Component: Sync Configuration
// Purpose: Tunables for reconciliation, echo suppression and surface construction.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SYNC_SYNC_CONFIG_HPP_
#define LOCKSTEP_SYNC_SYNC_CONFIG_HPP_

#include <cstdint>

namespace lockstep::sync {

struct SyncConfig {
  // Drift at or below this is invisible; no corrective seek is issued.
  double drift_threshold_s = 0.35;

  // How long is_applying_remote_update stays raised after an apply.
  // Must exceed the time the surface needs to acknowledge seek/play.
  int64_t remote_apply_settle_ms = 200;

  // How long is_local_action_in_flight stays raised after a local command.
  // Longer than an echo round trip, short enough not to block real updates.
  int64_t local_action_window_ms = 100;

  // Surface construction retry while the hosting container is missing.
  int64_t construct_retry_backoff_ms = 500;
  int construct_max_attempts = 10;

  // Step used by the skip-back / skip-forward controls.
  double seek_step_s = 10.0;
};

}  // namespace lockstep::sync

#endif  // LOCKSTEP_SYNC_SYNC_CONFIG_HPP_
