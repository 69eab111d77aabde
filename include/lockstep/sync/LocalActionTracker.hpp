// Repository: Lockstep
// Component: Local Action Tracker
// Purpose: Apply user-initiated playback commands locally, emit the matching
//          intent, and mark the echo-suppression window.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SYNC_LOCAL_ACTION_TRACKER_HPP_
#define LOCKSTEP_SYNC_LOCAL_ACTION_TRACKER_HPP_

#include <cstdint>
#include <functional>
#include <string>

#include "lockstep/runtime/IScheduler.hpp"
#include "lockstep/surface/PlayerLifecycleManager.hpp"
#include "lockstep/sync/InteractionGate.hpp"
#include "lockstep/sync/ReconciliationState.hpp"
#include "lockstep/sync/SyncConfig.hpp"
#include "lockstep/transport/ITransportChannel.hpp"

namespace lockstep::sync {

// LocalActionTracker
//
// Every command follows the same sequence:
//   refuse unless a surface is ready and the transport is connected
//   open the interaction gate (the action is a user gesture)
//   raise is_local_action_in_flight and (re)arm its clearing timer
//   read the position, apply the command to the surface, send the intent
//
// While the flag is raised SnapshotReconciler does not apply snapshots
// through its ordinary path, so the coordinator's echo of this action
// cannot overwrite it.
//
// Not thread-safe; runs on the session's event loop.
class LocalActionTracker {
 public:
  struct MetricsSnapshot {
    uint64_t play_total = 0;
    uint64_t pause_total = 0;
    uint64_t seek_total = 0;
    uint64_t refused_total = 0;
    uint64_t command_failure_total = 0;
    uint64_t send_failure_total = 0;
  };

  using PlayingHandler = std::function<void(bool playing)>;
  using CommandFailedHandler = std::function<void(const std::string& what)>;

  LocalActionTracker(ReconciliationState& state,
                     surface::PlayerLifecycleManager& lifecycle,
                     InteractionGate& gate,
                     transport::ITransportChannel& transport,
                     runtime::IScheduler& scheduler,
                     SyncConfig config);
  ~LocalActionTracker();

  LocalActionTracker(const LocalActionTracker&) = delete;
  LocalActionTracker& operator=(const LocalActionTracker&) = delete;

  void SetPlayingHandler(PlayingHandler handler);
  void SetCommandFailedHandler(CommandFailedHandler handler);

  // Each returns false when the action was refused or the surface command
  // failed. A failed send is logged but the local command stands.
  bool Play();
  bool Pause();
  // Relative seek from the current position; the target never goes below 0.
  bool SeekBy(double delta_s);

  [[nodiscard]] MetricsSnapshot GetMetrics() const { return metrics_; }

 private:
  using Command =
      std::function<transport::OutboundIntent(surface::IPlaybackSurface& surface)>;

  bool Run(const char* action, const Command& command);
  void ArmWindow();

  ReconciliationState& state_;
  surface::PlayerLifecycleManager& lifecycle_;
  InteractionGate& gate_;
  transport::ITransportChannel& transport_;
  runtime::IScheduler& scheduler_;
  SyncConfig config_;

  PlayingHandler playing_handler_;
  CommandFailedHandler command_failed_handler_;

  runtime::TimerId window_timer_ = runtime::kInvalidTimerId;
  MetricsSnapshot metrics_;
};

}  // namespace lockstep::sync

#endif  // LOCKSTEP_SYNC_LOCAL_ACTION_TRACKER_HPP_
