// Repository: Lockstep
// Component: Interaction Gate
// Purpose: Platform autoplay policy: remotely-triggered playback waits for a
//          user gesture.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SYNC_INTERACTION_GATE_HPP_
#define LOCKSTEP_SYNC_INTERACTION_GATE_HPP_

#include <functional>

#include "lockstep/sync/ReconciliationState.hpp"

namespace lockstep::sync {

// InteractionGate owns ReconciliationState::has_user_interacted.
//
// The gate opens exactly once, on the first local control action or
// manual-sync request, and never closes. While closed, a remote snapshot
// that wants playback is parked and the UI is told to show a pending-sync
// indicator. Opening the gate hides the indicator and runs the opened
// handler, which SnapshotReconciler uses to apply the parked snapshot
// through the manual-sync path; the gate itself carries no play/pause
// semantics.
//
// Not thread-safe; runs on the session's event loop.
class InteractionGate {
 public:
  using PendingSyncHandler = std::function<void(bool visible)>;
  using OpenedHandler = std::function<void()>;

  explicit InteractionGate(ReconciliationState& state);

  InteractionGate(const InteractionGate&) = delete;
  InteractionGate& operator=(const InteractionGate&) = delete;

  void SetPendingSyncHandler(PendingSyncHandler handler);
  void SetOpenedHandler(OpenedHandler handler);

  // Records a qualifying user gesture. Returns true only for the call that
  // actually opened the gate. Always hides the pending-sync indicator.
  bool Open();

  [[nodiscard]] bool IsOpen() const { return state_.has_user_interacted; }

  // Shows the pending-sync indicator. No-op once the gate is open.
  void SignalPendingSync();

  [[nodiscard]] bool IsPendingSyncVisible() const { return pending_sync_visible_; }

 private:
  void SetPendingSyncVisible(bool visible);

  ReconciliationState& state_;
  PendingSyncHandler pending_sync_handler_;
  OpenedHandler opened_handler_;
  bool pending_sync_visible_ = false;
};

}  // namespace lockstep::sync

#endif  // LOCKSTEP_SYNC_INTERACTION_GATE_HPP_
