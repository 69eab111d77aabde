// Repository: Lockstep
// Component: Playback Surface Interface
// Purpose: Capability contract required from the external media player.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SURFACE_IPLAYBACK_SURFACE_HPP_
#define LOCKSTEP_SURFACE_IPLAYBACK_SURFACE_HPP_

#include <functional>
#include <memory>
#include <string>

namespace lockstep::surface {

// Numeric player-state codes reported by the media library.
enum class SurfaceState : int {
  kUnstarted = -1,
  kEnded = 0,
  kPlaying = 1,
  kPaused = 2,
  kBuffering = 3,
  kCued = 5,
};

const char* SurfaceStateName(SurfaceState state);

// Player configuration. The coordination layer owns every control surface,
// so native controls and keyboard shortcuts stay off and the player never
// starts by itself.
struct SurfaceConfig {
  bool native_controls = false;
  bool keyboard_controls = false;
  bool autoplay = false;
  bool modest_branding = true;
  bool show_related = false;
};

// Lifecycle callbacks. The surface may invoke them from any thread;
// PlayerLifecycleManager expects its owner to marshal them onto the
// session's event loop before they reach it.
struct SurfaceCallbacks {
  std::function<void()> on_ready;
  std::function<void(SurfaceState)> on_state_change;
  std::function<void(int error_code)> on_error;
};

// IPlaybackSurface is one player instance bound to one media identity.
// Every method may throw; callers treat a throw as a failed command.
class IPlaybackSurface {
 public:
  virtual ~IPlaybackSurface() = default;

  virtual double GetCurrentTime() const = 0;

  // Seconds; 0 when the player does not know the duration yet.
  virtual double GetDuration() const { return 0.0; }

  // allow_ahead: permit seeking into media not yet buffered.
  virtual void SeekTo(double seconds, bool allow_ahead) = 0;
  virtual void PlayVideo() = 0;
  virtual void PauseVideo() = 0;

  // Releases player resources. No other method is called afterwards.
  virtual void Destroy() = 0;
};

// Hosting container (the region the player renders into). It may not
// exist yet when a media change arrives.
class ISurfaceHost {
 public:
  virtual ~ISurfaceHost() = default;
  virtual bool HasContainer() const = 0;
  virtual std::string ContainerId() const = 0;
};

class IPlaybackSurfaceFactory {
 public:
  virtual ~IPlaybackSurfaceFactory() = default;

  // Constructs a player for media_id inside container. Readiness is
  // reported later through callbacks.on_ready, never by return value.
  // Throws on construction failure.
  virtual std::unique_ptr<IPlaybackSurface> Construct(
      const std::string& container,
      const std::string& media_id,
      const SurfaceConfig& config,
      SurfaceCallbacks callbacks) = 0;
};

}  // namespace lockstep::surface

#endif  // LOCKSTEP_SURFACE_IPLAYBACK_SURFACE_HPP_
