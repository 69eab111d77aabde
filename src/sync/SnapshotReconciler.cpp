// Repository: Lockstep
// Component: Snapshot Reconciler
// Purpose: Decide whether and how an incoming session snapshot is applied to
//          the local playback surface.
// Copyright (c) 2026 Lockstep

#include "lockstep/sync/SnapshotReconciler.hpp"

#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>

#include "lockstep/util/Logger.hpp"

namespace lockstep::sync {

using lockstep::util::Logger;

const char* DispositionName(SnapshotReconciler::Disposition disposition) {
  switch (disposition) {
    case SnapshotReconciler::Disposition::kStale: return "STALE";
    case SnapshotReconciler::Disposition::kMediaChange: return "MEDIA_CHANGE";
    case SnapshotReconciler::Disposition::kNotReady: return "NOT_READY";
    case SnapshotReconciler::Disposition::kManualSync: return "MANUAL_SYNC";
    case SnapshotReconciler::Disposition::kDeferredForGesture: return "DEFERRED_FOR_GESTURE";
    case SnapshotReconciler::Disposition::kApplied: return "APPLIED";
    case SnapshotReconciler::Disposition::kSuppressed: return "SUPPRESSED";
  }
  return "UNKNOWN";
}

SnapshotReconciler::SnapshotReconciler(ReconciliationState& state,
                                       surface::PlayerLifecycleManager& lifecycle,
                                       InteractionGate& gate,
                                       runtime::IScheduler& scheduler,
                                       SyncConfig config)
    : state_(state),
      lifecycle_(lifecycle),
      gate_(gate),
      scheduler_(scheduler),
      config_(config) {}

SnapshotReconciler::~SnapshotReconciler() {
  if (settle_timer_ != runtime::kInvalidTimerId) {
    scheduler_.Cancel(settle_timer_);
  }
}

void SnapshotReconciler::SetPlayingHandler(PlayingHandler handler) {
  playing_handler_ = std::move(handler);
}

void SnapshotReconciler::SetCommandFailedHandler(CommandFailedHandler handler) {
  command_failed_handler_ = std::move(handler);
}

SnapshotReconciler::Disposition SnapshotReconciler::Consume(
    const SessionSnapshot& snapshot) {
  ++metrics_.consumed_total;

  if (snapshot.version <= state_.last_applied_version) {
    ++metrics_.stale_dropped_total;
    if (Logger::DebugEnabled()) {
      std::ostringstream oss;
      oss << "[SnapshotReconciler] STALE " << DescribeSnapshot(snapshot)
          << " last_applied=" << state_.last_applied_version;
      Logger::Debug(oss.str());
    }
    return Disposition::kStale;
  }
  state_.last_applied_version = snapshot.version;

  // An empty identifier carries no media change.
  if (snapshot.media_id && !snapshot.media_id->empty() &&
      snapshot.media_id != lifecycle_.ActiveMediaId()) {
    ++metrics_.media_change_total;
    Trace("MEDIA_CHANGE", snapshot);
    // Parked before the transition starts: a surface that reports ready
    // synchronously flushes it from inside BeginTransition().
    Park(snapshot);
    if (snapshot.is_playing && !state_.has_user_interacted) {
      gate_.SignalPendingSync();
    }
    lifecycle_.BeginTransition(*snapshot.media_id);
    return Disposition::kMediaChange;
  }

  if (!lifecycle_.IsReady()) {
    ++metrics_.parked_not_ready_total;
    Trace("PARKED_NOT_READY", snapshot);
    Park(snapshot);
    return Disposition::kNotReady;
  }

  return Dispose(snapshot);
}

SnapshotReconciler::Disposition SnapshotReconciler::Dispose(
    const SessionSnapshot& snapshot) {
  if (state_.is_manual_sync_requested) {
    Apply(snapshot);
    state_.is_manual_sync_requested = false;
    ++metrics_.manual_sync_applied_total;
    Trace("MANUAL_SYNC", snapshot);
    return Disposition::kManualSync;
  }

  if (snapshot.is_playing && !state_.has_user_interacted) {
    ++metrics_.deferred_for_gesture_total;
    Trace("DEFERRED_FOR_GESTURE", snapshot);
    Park(snapshot);
    gate_.SignalPendingSync();
    return Disposition::kDeferredForGesture;
  }

  if (!state_.is_applying_remote_update && !state_.is_local_action_in_flight) {
    Apply(snapshot);
    return Disposition::kApplied;
  }

  ++metrics_.suppressed_total;
  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[SnapshotReconciler] SUPPRESSED " << DescribeSnapshot(snapshot)
        << " applying_remote=" << (state_.is_applying_remote_update ? "Y" : "N")
        << " local_in_flight=" << (state_.is_local_action_in_flight ? "Y" : "N");
    Logger::Debug(oss.str());
  }
  return Disposition::kSuppressed;
}

void SnapshotReconciler::OnSurfaceReady() {
  if (!state_.pending_snapshot) return;
  SessionSnapshot snapshot = std::move(*state_.pending_snapshot);
  state_.pending_snapshot.reset();
  Trace("FLUSH_ON_READY", snapshot);
  Dispose(snapshot);
}

void SnapshotReconciler::OnGateOpened() {
  ApplyParkedViaManualSync();
}

bool SnapshotReconciler::RequestManualSync() {
  state_.is_manual_sync_requested = true;
  Logger::Info("[SnapshotReconciler] MANUAL_SYNC_REQUESTED");
  return ApplyParkedViaManualSync();
}

bool SnapshotReconciler::ApplyParkedViaManualSync() {
  if (!state_.pending_snapshot || !lifecycle_.IsReady()) return false;
  SessionSnapshot snapshot = std::move(*state_.pending_snapshot);
  state_.pending_snapshot.reset();
  Apply(snapshot);
  state_.is_manual_sync_requested = false;
  ++metrics_.manual_sync_applied_total;
  Trace("MANUAL_SYNC", snapshot);
  return true;
}

void SnapshotReconciler::Park(const SessionSnapshot& snapshot) {
  state_.pending_snapshot = snapshot;
}

void SnapshotReconciler::Apply(const SessionSnapshot& snapshot) {
  surface::IPlaybackSurface* surface = lifecycle_.ReadySurface();
  if (surface == nullptr) {
    Park(snapshot);
    return;
  }

  // Raised before the first command so the settle timer always clears it,
  // even when a command below throws.
  state_.is_applying_remote_update = true;
  ArmSettleTimer();
  ++metrics_.applied_total;

  double target = ComputeTargetTime(snapshot);
  try {
    target = ClampToDuration(target, surface->GetDuration());
    const double current = surface->GetCurrentTime();
    const double drift = std::fabs(target - current);
    metrics_.last_target_s = target;
    metrics_.last_drift_s = drift;

    const bool seek = drift > config_.drift_threshold_s;
    if (seek) {
      surface->SeekTo(target, true);
      ++metrics_.corrective_seek_total;
    }
    if (snapshot.is_playing) {
      surface->PlayVideo();
    } else {
      surface->PauseVideo();
    }

    if (Logger::DebugEnabled()) {
      std::ostringstream oss;
      oss << "[SnapshotReconciler] APPLY " << DescribeSnapshot(snapshot)
          << std::fixed << std::setprecision(3)
          << " current=" << current
          << " target=" << target
          << " drift=" << drift
          << " seek=" << (seek ? "Y" : "N");
      Logger::Debug(oss.str());
    }
  } catch (const std::exception& e) {
    ++metrics_.command_failure_total;
    std::ostringstream oss;
    oss << "[SnapshotReconciler] COMMAND_FAILED version=" << snapshot.version
        << " what=" << e.what();
    Logger::Warn(oss.str());
    if (command_failed_handler_) command_failed_handler_(e.what());
    return;
  }

  if (playing_handler_) playing_handler_(snapshot.is_playing);
}

void SnapshotReconciler::ArmSettleTimer() {
  if (settle_timer_ != runtime::kInvalidTimerId) {
    scheduler_.Cancel(settle_timer_);
  }
  settle_timer_ = scheduler_.ScheduleAfter(config_.remote_apply_settle_ms, [this] {
    settle_timer_ = runtime::kInvalidTimerId;
    state_.is_applying_remote_update = false;
  });
}

void SnapshotReconciler::Trace(const char* event, const SessionSnapshot& snapshot) const {
  if (!Logger::DebugEnabled()) return;
  Logger::Debug(std::string("[SnapshotReconciler] ") + event + " " +
                DescribeSnapshot(snapshot));
}

}  // namespace lockstep::sync
