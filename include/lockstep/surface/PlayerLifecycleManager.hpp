// Repository: Lockstep
// Component: Player Lifecycle Manager
// Purpose: One playback surface per media identity. Constructs it, waits for
//          readiness, retries while the container is missing.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SURFACE_PLAYER_LIFECYCLE_MANAGER_HPP_
#define LOCKSTEP_SURFACE_PLAYER_LIFECYCLE_MANAGER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "lockstep/runtime/IScheduler.hpp"
#include "lockstep/surface/IPlaybackSurface.hpp"
#include "lockstep/surface/SurfaceApiReadiness.hpp"
#include "lockstep/sync/SyncConfig.hpp"

namespace lockstep::surface {

// A media session is never mutated in place: an identity change destroys
// it wholesale, because every cached position and pending flag tied to the
// old surface is meaningless for the new one.
struct MediaSession {
  std::string media_id;
  std::unique_ptr<IPlaybackSurface> surface;
  bool ready = false;
};

// PlayerLifecycleManager
//
//   kUninitialized ─BeginTransition→ kConstructing ─on_ready→ kReady
//   kReady ─BeginTransition→ kDestroyed → kConstructing → ...
//   kConstructing ─attempts exhausted→ kFailed
//
// Readiness comes only from the surface's on_ready callback; internal
// surface state is never polled. Construction is retried on a fixed
// backoff while the container (or the media library itself) is not
// available, or while the factory throws. The pending retry timer is the
// one timer that must be cancelled on teardown or on the next identity
// change.
//
// Not thread-safe: every method, and every handler it invokes, runs on the
// scheduler's thread. Surface callbacks are routed through the dispatcher
// so the owner can marshal them onto that thread.
class PlayerLifecycleManager {
 public:
  enum class Phase {
    kUninitialized,
    kConstructing,
    kReady,
    kDestroyed,
    kFailed,
  };

  using Dispatcher = std::function<void(std::function<void()>)>;
  using ReadyHandler = std::function<void()>;
  using ConstructionFailedHandler =
      std::function<void(const std::string& media_id, const std::string& reason)>;
  using StateChangeHandler = std::function<void(SurfaceState)>;
  using SurfaceErrorHandler = std::function<void(int error_code)>;

  PlayerLifecycleManager(runtime::IScheduler& scheduler,
                         IPlaybackSurfaceFactory& factory,
                         ISurfaceHost& host,
                         const SurfaceApiReadiness& api_readiness,
                         sync::SyncConfig config);
  ~PlayerLifecycleManager();

  PlayerLifecycleManager(const PlayerLifecycleManager&) = delete;
  PlayerLifecycleManager& operator=(const PlayerLifecycleManager&) = delete;

  // Default dispatcher invokes inline.
  void SetDispatcher(Dispatcher dispatcher);
  void SetReadyHandler(ReadyHandler handler);
  void SetConstructionFailedHandler(ConstructionFailedHandler handler);
  void SetStateChangeHandler(StateChangeHandler handler);
  void SetSurfaceErrorHandler(SurfaceErrorHandler handler);

  // Destroys the current surface (best effort) and starts constructing one
  // for media_id. Cancels any scheduled construction retry.
  void BeginTransition(const std::string& media_id);

  // Re-runs construction for the active media after kFailed.
  // Returns false in any other phase.
  bool RetryFailed();

  // Destroys the current surface and cancels any pending retry.
  void Shutdown();

  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] std::optional<std::string> ActiveMediaId() const;
  [[nodiscard]] bool IsReady() const { return phase_ == Phase::kReady; }

  // The ready surface, or nullptr while none is ready.
  [[nodiscard]] IPlaybackSurface* ReadySurface() const;

  [[nodiscard]] int ConstructionAttempts() const { return attempts_; }
  [[nodiscard]] bool HasPendingRetry() const {
    return retry_timer_ != runtime::kInvalidTimerId;
  }

 private:
  void TryConstruct();
  void ScheduleRetry(const std::string& reason);
  void CancelRetry();
  void TeardownActive();
  SurfaceCallbacks MakeCallbacks(uint64_t generation);
  void OnSurfaceReady(uint64_t generation);

  runtime::IScheduler& scheduler_;
  IPlaybackSurfaceFactory& factory_;
  ISurfaceHost& host_;
  const SurfaceApiReadiness& api_readiness_;
  sync::SyncConfig config_;
  SurfaceConfig surface_config_;

  Dispatcher dispatcher_;
  ReadyHandler ready_handler_;
  ConstructionFailedHandler construction_failed_handler_;
  StateChangeHandler state_change_handler_;
  SurfaceErrorHandler surface_error_handler_;

  Phase phase_ = Phase::kUninitialized;
  std::optional<MediaSession> active_;
  // Bumped on every identity change; callbacks from older surfaces are dropped.
  uint64_t generation_ = 0;
  int attempts_ = 0;
  // on_ready fired from inside Construct(), before the surface was stored.
  bool early_ready_ = false;
  runtime::TimerId retry_timer_ = runtime::kInvalidTimerId;

  // Expires with this object; callbacks dispatched after destruction see it
  // expired and do nothing.
  std::shared_ptr<PlayerLifecycleManager*> self_token_;
};

const char* PhaseName(PlayerLifecycleManager::Phase phase);

}  // namespace lockstep::surface

#endif  // LOCKSTEP_SURFACE_PLAYER_LIFECYCLE_MANAGER_HPP_
