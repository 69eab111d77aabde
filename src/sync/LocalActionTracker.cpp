// Repository: Lockstep
// Component: Local Action Tracker
// Purpose: Apply user-initiated playback commands locally, emit the matching
//          intent, and mark the echo-suppression window.
// Copyright (c) 2026 Lockstep

#include "lockstep/sync/LocalActionTracker.hpp"

#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>

#include "lockstep/sync/SessionSnapshot.hpp"
#include "lockstep/util/Logger.hpp"

namespace lockstep::sync {

using lockstep::transport::OutboundIntent;
using lockstep::util::Logger;

LocalActionTracker::LocalActionTracker(ReconciliationState& state,
                                       surface::PlayerLifecycleManager& lifecycle,
                                       InteractionGate& gate,
                                       transport::ITransportChannel& transport,
                                       runtime::IScheduler& scheduler,
                                       SyncConfig config)
    : state_(state),
      lifecycle_(lifecycle),
      gate_(gate),
      transport_(transport),
      scheduler_(scheduler),
      config_(config) {}

LocalActionTracker::~LocalActionTracker() {
  if (window_timer_ != runtime::kInvalidTimerId) {
    scheduler_.Cancel(window_timer_);
  }
}

void LocalActionTracker::SetPlayingHandler(PlayingHandler handler) {
  playing_handler_ = std::move(handler);
}

void LocalActionTracker::SetCommandFailedHandler(CommandFailedHandler handler) {
  command_failed_handler_ = std::move(handler);
}

bool LocalActionTracker::Play() {
  if (!Run("PLAY", [](surface::IPlaybackSurface& surface) {
        const double now = surface.GetCurrentTime();
        surface.PlayVideo();
        return OutboundIntent::Play(now);
      })) {
    return false;
  }
  ++metrics_.play_total;
  if (playing_handler_) playing_handler_(true);
  return true;
}

bool LocalActionTracker::Pause() {
  if (!Run("PAUSE", [](surface::IPlaybackSurface& surface) {
        const double now = surface.GetCurrentTime();
        surface.PauseVideo();
        return OutboundIntent::Pause(now);
      })) {
    return false;
  }
  ++metrics_.pause_total;
  if (playing_handler_) playing_handler_(false);
  return true;
}

bool LocalActionTracker::SeekBy(double delta_s) {
  if (!Run("SEEK", [delta_s](surface::IPlaybackSurface& surface) {
        const double target =
            ClampToDuration(surface.GetCurrentTime() + delta_s, surface.GetDuration());
        surface.SeekTo(target, true);
        return OutboundIntent::Seek(target);
      })) {
    return false;
  }
  ++metrics_.seek_total;
  return true;
}

bool LocalActionTracker::Run(const char* action, const Command& command) {
  surface::IPlaybackSurface* surface = lifecycle_.ReadySurface();
  if (surface == nullptr || !transport_.IsConnected()) {
    ++metrics_.refused_total;
    std::ostringstream oss;
    oss << "[LocalActionTracker] REFUSED action=" << action
        << " surface_ready=" << (surface != nullptr ? "Y" : "N")
        << " connected=" << (transport_.IsConnected() ? "Y" : "N");
    Logger::Debug(oss.str());
    return false;
  }

  // Opening the gate may apply a parked snapshot; the local command below
  // is issued after it and wins.
  gate_.Open();
  surface = lifecycle_.ReadySurface();
  if (surface == nullptr) {
    ++metrics_.refused_total;
    return false;
  }

  state_.is_local_action_in_flight = true;
  ArmWindow();

  OutboundIntent intent;
  try {
    intent = command(*surface);
  } catch (const std::exception& e) {
    ++metrics_.command_failure_total;
    std::ostringstream oss;
    oss << "[LocalActionTracker] COMMAND_FAILED action=" << action
        << " what=" << e.what();
    Logger::Warn(oss.str());
    if (command_failed_handler_) command_failed_handler_(e.what());
    return false;
  }

  if (!transport_.Send(intent)) {
    ++metrics_.send_failure_total;
    Logger::Warn(std::string("[LocalActionTracker] SEND_FAILED action=") + action);
  }

  std::ostringstream oss;
  oss << "[LocalActionTracker] " << action
      << " t=" << std::fixed << std::setprecision(2) << intent.current_time;
  Logger::Info(oss.str());
  return true;
}

void LocalActionTracker::ArmWindow() {
  if (window_timer_ != runtime::kInvalidTimerId) {
    scheduler_.Cancel(window_timer_);
  }
  window_timer_ = scheduler_.ScheduleAfter(config_.local_action_window_ms, [this] {
    window_timer_ = runtime::kInvalidTimerId;
    state_.is_local_action_in_flight = false;
  });
}

}  // namespace lockstep::sync
