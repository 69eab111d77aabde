// Repository: Lockstep
// Component: Snapshot Reconciler
// Purpose: Decide whether and how an incoming session snapshot is applied to
//          the local playback surface.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SYNC_SNAPSHOT_RECONCILER_HPP_
#define LOCKSTEP_SYNC_SNAPSHOT_RECONCILER_HPP_

#include <cstdint>
#include <functional>
#include <string>

#include "lockstep/runtime/IScheduler.hpp"
#include "lockstep/surface/PlayerLifecycleManager.hpp"
#include "lockstep/sync/InteractionGate.hpp"
#include "lockstep/sync/ReconciliationState.hpp"
#include "lockstep/sync/SessionSnapshot.hpp"
#include "lockstep/sync/SyncConfig.hpp"

namespace lockstep::sync {

// SnapshotReconciler
//
// Evaluation order for every snapshot (first match wins):
//   1. version <= last_applied_version         → drop (stale)
//      otherwise last_applied_version = version, even if nothing is applied
//   2. non-empty media identity differs from
//      the surface                             → park, begin transition
//   3. surface not ready                       → park
//   4a. manual sync requested                  → apply, clear the request
//   4b. playing and gate closed                → park, show pending-sync
//   4c. no echo window raised                  → apply
//   4d. otherwise                              → suppressed (echo)
//
// Only the most recent parked snapshot is retained. A parked snapshot is
// flushed through step 4 when the surface becomes ready, or through 4a when
// the interaction gate opens.
//
// Not thread-safe; runs on the session's event loop.
class SnapshotReconciler {
 public:
  enum class Disposition {
    kStale,
    kMediaChange,
    kNotReady,
    kManualSync,
    kDeferredForGesture,
    kApplied,
    kSuppressed,
  };

  struct MetricsSnapshot {
    uint64_t consumed_total = 0;
    uint64_t stale_dropped_total = 0;
    uint64_t media_change_total = 0;
    uint64_t parked_not_ready_total = 0;
    uint64_t deferred_for_gesture_total = 0;
    uint64_t manual_sync_applied_total = 0;
    uint64_t applied_total = 0;
    uint64_t suppressed_total = 0;
    uint64_t corrective_seek_total = 0;
    uint64_t command_failure_total = 0;
    double last_target_s = 0.0;
    double last_drift_s = 0.0;
  };

  using PlayingHandler = std::function<void(bool playing)>;
  using CommandFailedHandler = std::function<void(const std::string& what)>;

  SnapshotReconciler(ReconciliationState& state,
                     surface::PlayerLifecycleManager& lifecycle,
                     InteractionGate& gate,
                     runtime::IScheduler& scheduler,
                     SyncConfig config);
  ~SnapshotReconciler();

  SnapshotReconciler(const SnapshotReconciler&) = delete;
  SnapshotReconciler& operator=(const SnapshotReconciler&) = delete;

  // Displayed playing state after every apply.
  void SetPlayingHandler(PlayingHandler handler);
  // A surface command threw while applying; the snapshot is not retried.
  void SetCommandFailedHandler(CommandFailedHandler handler);

  Disposition Consume(const SessionSnapshot& snapshot);

  // Surface readiness hook. Flushes the parked snapshot through step 4;
  // the staleness filter is not re-run because the version was already
  // recorded when the snapshot was first consumed.
  void OnSurfaceReady();

  // Gate-opened hook. Applies the parked snapshot through the manual-sync
  // path. Leaves it parked for the readiness flush if no surface is ready.
  void OnGateOpened();

  // User asked to resync: raise the request and apply what is parked.
  // Returns true if a snapshot was applied now, in which case the request
  // is already consumed. Otherwise it stays raised for the next snapshot
  // or the readiness flush.
  bool RequestManualSync();

  [[nodiscard]] MetricsSnapshot GetMetrics() const { return metrics_; }

 private:
  Disposition Dispose(const SessionSnapshot& snapshot);
  bool ApplyParkedViaManualSync();
  void Park(const SessionSnapshot& snapshot);
  void Apply(const SessionSnapshot& snapshot);
  void ArmSettleTimer();
  void Trace(const char* event, const SessionSnapshot& snapshot) const;

  ReconciliationState& state_;
  surface::PlayerLifecycleManager& lifecycle_;
  InteractionGate& gate_;
  runtime::IScheduler& scheduler_;
  SyncConfig config_;

  PlayingHandler playing_handler_;
  CommandFailedHandler command_failed_handler_;

  runtime::TimerId settle_timer_ = runtime::kInvalidTimerId;
  MetricsSnapshot metrics_;
};

const char* DispositionName(SnapshotReconciler::Disposition disposition);

}  // namespace lockstep::sync

#endif  // LOCKSTEP_SYNC_SNAPSHOT_RECONCILER_HPP_
