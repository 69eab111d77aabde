// Repository: Lockstep
// Component: Sync Session
// Purpose: Composition root that wires transport, surface lifecycle, gate,
//          reconciler and local actions onto one event loop.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SESSION_SYNC_SESSION_HPP_
#define LOCKSTEP_SESSION_SYNC_SESSION_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "lockstep/runtime/IScheduler.hpp"
#include "lockstep/session/ISessionView.hpp"
#include "lockstep/surface/IPlaybackSurface.hpp"
#include "lockstep/surface/PlayerLifecycleManager.hpp"
#include "lockstep/surface/SurfaceApiReadiness.hpp"
#include "lockstep/sync/InteractionGate.hpp"
#include "lockstep/sync/LocalActionTracker.hpp"
#include "lockstep/sync/ReconciliationState.hpp"
#include "lockstep/sync/SnapshotReconciler.hpp"
#include "lockstep/sync/SyncConfig.hpp"
#include "lockstep/transport/ITransportChannel.hpp"

namespace lockstep::session {

// User-facing notices.
inline constexpr const char* kNoticeConnected = "Connected to watch party!";
inline constexpr const char* kNoticeConnectFailed = "Failed to connect to server. Retrying...";
inline constexpr const char* kNoticeDisconnected = "Disconnected from server";
inline constexpr const char* kNoticeNotConnected = "Not connected to server. Please wait...";
inline constexpr const char* kNoticeVideoFailed = "Video failed to load";
inline constexpr const char* kNoticeInitFailed = "Failed to initialize video player";

// SyncSession
//
// Owns one ReconciliationState and the four components that share it.
// Transport handlers, surface callbacks and user commands may arrive on any
// thread; each is posted to the scheduler and runs there, so the state is
// only ever touched by the scheduler's thread.
//
// Lifecycle:
//   1. Construct with a running scheduler
//   2. Start(): waits for the surface API, then starts the transport
//   3. Commands from any thread
//   4. Stop(): stops the transport (joins its threads), tears the surface
//      down on the scheduler
//   5. Destroy after the scheduler has stopped, or on its thread
class SyncSession {
 public:
  struct Status {
    ConnectionStatus connection = ConnectionStatus::kDisconnected;
    int viewer_count = 0;
    std::string media_id;
    surface::PlayerLifecycleManager::Phase phase =
        surface::PlayerLifecycleManager::Phase::kUninitialized;
    bool playing = false;
    bool gate_open = false;
    bool pending_sync = false;
    int64_t last_applied_version = 0;
    double position_s = 0.0;
  };

  SyncSession(runtime::IScheduler& scheduler,
              transport::ITransportChannel& transport,
              surface::IPlaybackSurfaceFactory& factory,
              surface::ISurfaceHost& host,
              const surface::SurfaceApiReadiness& api_readiness,
              sync::SyncConfig config,
              ISessionView* view = nullptr);
  ~SyncSession();

  SyncSession(const SyncSession&) = delete;
  SyncSession& operator=(const SyncSession&) = delete;

  void Start();
  void Stop();

  // User commands. Thread-safe; executed asynchronously on the scheduler.
  void Play();
  void Pause();
  void SeekBy(double delta_s);
  void SkipForward() { SeekBy(config_.seek_step_s); }
  void SkipBack() { SeekBy(-config_.seek_step_s); }
  void ChangeMedia(const std::string& identifier);
  void SyncToSession();

  // Posts a STATUS log line.
  void LogStatus();

  // Scheduler thread only.
  [[nodiscard]] Status GetStatus() const;
  [[nodiscard]] const sync::ReconciliationState& state() const { return state_; }
  [[nodiscard]] const sync::SnapshotReconciler& reconciler() const { return reconciler_; }
  [[nodiscard]] const sync::LocalActionTracker& tracker() const { return tracker_; }
  [[nodiscard]] const surface::PlayerLifecycleManager& lifecycle() const { return lifecycle_; }
  [[nodiscard]] const sync::InteractionGate& gate() const { return gate_; }

 private:
  // Posts fn to the scheduler; dropped if this session is gone.
  void Dispatch(std::function<void()> fn);
  void WireComponents();
  void StartTransportWhenApiReady();
  void StartTransport();

  void HandleConnected();
  void HandleDisconnected(const std::string& reason, bool server_initiated);
  void HandleConnectError(const std::string& message);
  void HandleSnapshot(const sync::SessionSnapshot& snapshot);
  void HandleViewerCount(int count);
  void HandleSurfaceState(surface::SurfaceState state);

  void DoChangeMedia(const std::string& identifier);
  void DoSyncToSession();

  void SetConnection(ConnectionStatus status);
  void SetPlaying(bool playing);
  void Notify(NoticeLevel level, const std::string& message);

  runtime::IScheduler& scheduler_;
  transport::ITransportChannel& transport_;
  const surface::SurfaceApiReadiness& api_readiness_;
  sync::SyncConfig config_;
  ISessionView* view_;

  sync::ReconciliationState state_;
  sync::InteractionGate gate_;
  surface::PlayerLifecycleManager lifecycle_;
  sync::SnapshotReconciler reconciler_;
  sync::LocalActionTracker tracker_;

  ConnectionStatus connection_ = ConnectionStatus::kDisconnected;
  int viewer_count_ = 0;
  bool playing_ = false;
  bool started_ = false;
  bool transport_started_ = false;
  runtime::TimerId api_poll_timer_ = runtime::kInvalidTimerId;

  std::shared_ptr<SyncSession*> self_token_;
};

}  // namespace lockstep::session

#endif  // LOCKSTEP_SESSION_SYNC_SESSION_HPP_
