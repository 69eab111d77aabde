// Repository: Lockstep
// Component: Simulated Playback Surface
// Purpose: Headless, clock-driven player for the CLI client and soak runs.
// Copyright (c) 2026 Lockstep

#include "lockstep/surface/SimulatedPlaybackSurface.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "lockstep/util/Logger.hpp"

namespace lockstep::surface {

using lockstep::util::Logger;

SimulatedPlaybackSurface::SimulatedPlaybackSurface(std::string media_id,
                                                   const time::ITimeSource& clock,
                                                   SurfaceCallbacks callbacks,
                                                   double duration_s)
    : media_id_(std::move(media_id)),
      clock_(clock),
      callbacks_(std::move(callbacks)),
      duration_s_(duration_s),
      anchor_utc_ms_(clock.NowUtcMs()),
      alive_(std::make_shared<int>(0)) {}

SimulatedPlaybackSurface::~SimulatedPlaybackSurface() = default;

double SimulatedPlaybackSurface::GetCurrentTime() const {
  RequireAlive("GetCurrentTime");
  double position = anchor_position_s_;
  if (playing_) {
    position += static_cast<double>(clock_.NowUtcMs() - anchor_utc_ms_) / 1000.0;
  }
  if (duration_s_ > 0.0) position = std::min(position, duration_s_);
  return position;
}

void SimulatedPlaybackSurface::SeekTo(double seconds, bool /*allow_ahead*/) {
  RequireAlive("SeekTo");
  anchor_position_s_ = std::max(0.0, seconds);
  if (duration_s_ > 0.0) anchor_position_s_ = std::min(anchor_position_s_, duration_s_);
  anchor_utc_ms_ = clock_.NowUtcMs();
}

void SimulatedPlaybackSurface::PlayVideo() {
  RequireAlive("PlayVideo");
  if (playing_) return;
  anchor_position_s_ = GetCurrentTime();
  anchor_utc_ms_ = clock_.NowUtcMs();
  playing_ = true;
  Report(SurfaceState::kPlaying);
}

void SimulatedPlaybackSurface::PauseVideo() {
  RequireAlive("PauseVideo");
  if (!playing_) return;
  anchor_position_s_ = GetCurrentTime();
  anchor_utc_ms_ = clock_.NowUtcMs();
  playing_ = false;
  Report(SurfaceState::kPaused);
}

void SimulatedPlaybackSurface::Destroy() {
  if (destroyed_) return;
  destroyed_ = true;
  playing_ = false;
  alive_.reset();
  Logger::Debug("[SimulatedPlaybackSurface] DESTROYED media=" + media_id_);
}

void SimulatedPlaybackSurface::CompleteLoad() {
  if (destroyed_) return;
  Report(SurfaceState::kCued);
  if (callbacks_.on_ready) callbacks_.on_ready();
}

void SimulatedPlaybackSurface::RequireAlive(const char* op) const {
  if (destroyed_) {
    throw std::logic_error(std::string(op) + " on destroyed surface media=" + media_id_);
  }
}

void SimulatedPlaybackSurface::Report(SurfaceState state) const {
  if (callbacks_.on_state_change) callbacks_.on_state_change(state);
}

SimulatedSurfaceFactory::SimulatedSurfaceFactory(runtime::IScheduler& scheduler,
                                                 const time::ITimeSource& clock,
                                                 int64_t load_delay_ms,
                                                 double duration_s)
    : scheduler_(scheduler),
      clock_(clock),
      load_delay_ms_(load_delay_ms),
      duration_s_(duration_s) {}

std::unique_ptr<IPlaybackSurface> SimulatedSurfaceFactory::Construct(
    const std::string& container,
    const std::string& media_id,
    const SurfaceConfig& config,
    SurfaceCallbacks callbacks) {
  if (media_id.empty()) {
    throw std::invalid_argument("empty media id");
  }
  if (config.autoplay) {
    Logger::Warn("[SimulatedSurfaceFactory] AUTOPLAY_IGNORED media=" + media_id);
  }

  auto surface = std::make_unique<SimulatedPlaybackSurface>(
      media_id, clock_, std::move(callbacks), duration_s_);

  std::ostringstream oss;
  oss << "[SimulatedSurfaceFactory] CONSTRUCT media=" << media_id
      << " container=" << container
      << " load_delay_ms=" << load_delay_ms_;
  Logger::Debug(oss.str());

  SimulatedPlaybackSurface* raw = surface.get();
  std::weak_ptr<void> alive = raw->LivenessToken();
  scheduler_.ScheduleAfter(load_delay_ms_, [raw, alive] {
    if (alive.expired()) return;
    raw->CompleteLoad();
  });
  return surface;
}

}  // namespace lockstep::surface
