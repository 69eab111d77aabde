// Repository: Lockstep
// Component: Reconciliation State
// Purpose: Per-client synchronization flags shared by the sync components.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SYNC_RECONCILIATION_STATE_HPP_
#define LOCKSTEP_SYNC_RECONCILIATION_STATE_HPP_

#include <cstdint>
#include <optional>

#include "lockstep/sync/SessionSnapshot.hpp"

namespace lockstep::sync {

// One instance per session. Owned by SyncSession and shared by reference
// with SnapshotReconciler, LocalActionTracker, InteractionGate and
// PlayerLifecycleManager.
//
// The boolean flags are short critical sections. They are only valid
// because every reader and writer runs on the session's EventLoop thread;
// nothing here is synchronized.
struct ReconciliationState {
  // Monotone non-decreasing. Raised before any other step of Consume().
  int64_t last_applied_version = 0;

  // Latest-wins slot. Intermediate snapshots are discarded on overwrite.
  std::optional<SessionSnapshot> pending_snapshot;

  // One-way: false → true, never reset.
  bool has_user_interacted = false;

  // Time-bounded: cleared by the remote-apply settle timer.
  bool is_applying_remote_update = false;

  // Time-bounded: cleared by the local-action timer.
  bool is_local_action_in_flight = false;

  bool is_manual_sync_requested = false;
};

}  // namespace lockstep::sync

#endif  // LOCKSTEP_SYNC_RECONCILIATION_STATE_HPP_
