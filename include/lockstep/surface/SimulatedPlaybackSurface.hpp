// Repository: Lockstep
// Component: Simulated Playback Surface
// Purpose: Headless, clock-driven player for the CLI client and soak runs.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SURFACE_SIMULATED_PLAYBACK_SURFACE_HPP_
#define LOCKSTEP_SURFACE_SIMULATED_PLAYBACK_SURFACE_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "lockstep/runtime/IScheduler.hpp"
#include "lockstep/surface/IPlaybackSurface.hpp"
#include "lockstep/time/ITimeSource.hpp"

namespace lockstep::surface {

// Position advances with the time source while playing and freezes while
// paused. A known duration caps the position.
class SimulatedPlaybackSurface : public IPlaybackSurface {
 public:
  SimulatedPlaybackSurface(std::string media_id,
                           const time::ITimeSource& clock,
                           SurfaceCallbacks callbacks,
                           double duration_s);
  ~SimulatedPlaybackSurface() override;

  double GetCurrentTime() const override;
  double GetDuration() const override { return duration_s_; }
  void SeekTo(double seconds, bool allow_ahead) override;
  void PlayVideo() override;
  void PauseVideo() override;
  void Destroy() override;

  // Simulates the library finishing its load: reports kCued then on_ready.
  void CompleteLoad();

  [[nodiscard]] const std::string& media_id() const { return media_id_; }
  [[nodiscard]] bool IsPlaying() const { return playing_; }

  // Expires when the surface is destroyed; deferred work checks it.
  [[nodiscard]] std::weak_ptr<void> LivenessToken() const { return alive_; }

 private:
  void RequireAlive(const char* op) const;
  void Report(SurfaceState state) const;

  std::string media_id_;
  const time::ITimeSource& clock_;
  SurfaceCallbacks callbacks_;
  double duration_s_;

  bool playing_ = false;
  bool destroyed_ = false;
  double anchor_position_s_ = 0.0;
  int64_t anchor_utc_ms_ = 0;
  std::shared_ptr<int> alive_;
};

// Builds SimulatedPlaybackSurface instances that become ready load_delay_ms
// after construction.
class SimulatedSurfaceFactory : public IPlaybackSurfaceFactory {
 public:
  SimulatedSurfaceFactory(runtime::IScheduler& scheduler,
                          const time::ITimeSource& clock,
                          int64_t load_delay_ms = 300,
                          double duration_s = 0.0);

  std::unique_ptr<IPlaybackSurface> Construct(const std::string& container,
                                              const std::string& media_id,
                                              const SurfaceConfig& config,
                                              SurfaceCallbacks callbacks) override;

 private:
  runtime::IScheduler& scheduler_;
  const time::ITimeSource& clock_;
  int64_t load_delay_ms_;
  double duration_s_;
};

// Container that exists as soon as it has a name.
class NamedSurfaceHost : public ISurfaceHost {
 public:
  explicit NamedSurfaceHost(std::string container_id)
      : container_id_(std::move(container_id)) {}

  bool HasContainer() const override { return !container_id_.empty(); }
  std::string ContainerId() const override { return container_id_; }

 private:
  std::string container_id_;
};

}  // namespace lockstep::surface

#endif  // LOCKSTEP_SURFACE_SIMULATED_PLAYBACK_SURFACE_HPP_
