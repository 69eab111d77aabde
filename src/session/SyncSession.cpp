// Repository: Lockstep
// Component: Sync Session
// Purpose: Composition root that wires transport, surface lifecycle, gate,
//          reconciler and local actions onto one event loop.
// Copyright (c) 2026 Lockstep

#include "lockstep/session/SyncSession.hpp"

#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>

#include "lockstep/util/Logger.hpp"

namespace lockstep::session {

using lockstep::util::Logger;

namespace {

constexpr int64_t kApiPollIntervalMs = 100;

}  // namespace

const char* ConnectionStatusName(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::kConnecting: return "CONNECTING";
    case ConnectionStatus::kConnected: return "CONNECTED";
    case ConnectionStatus::kDisconnected: return "DISCONNECTED";
  }
  return "UNKNOWN";
}

const char* NoticeLevelName(NoticeLevel level) {
  switch (level) {
    case NoticeLevel::kSuccess: return "SUCCESS";
    case NoticeLevel::kInfo: return "INFO";
    case NoticeLevel::kWarning: return "WARNING";
    case NoticeLevel::kError: return "ERROR";
  }
  return "UNKNOWN";
}

SyncSession::SyncSession(runtime::IScheduler& scheduler,
                         transport::ITransportChannel& transport,
                         surface::IPlaybackSurfaceFactory& factory,
                         surface::ISurfaceHost& host,
                         const surface::SurfaceApiReadiness& api_readiness,
                         sync::SyncConfig config,
                         ISessionView* view)
    : scheduler_(scheduler),
      transport_(transport),
      api_readiness_(api_readiness),
      config_(config),
      view_(view),
      gate_(state_),
      lifecycle_(scheduler, factory, host, api_readiness, config),
      reconciler_(state_, lifecycle_, gate_, scheduler, config),
      tracker_(state_, lifecycle_, gate_, transport, scheduler, config),
      self_token_(std::make_shared<SyncSession*>(this)) {
  WireComponents();
}

SyncSession::~SyncSession() {
  self_token_.reset();
  if (api_poll_timer_ != runtime::kInvalidTimerId) {
    scheduler_.Cancel(api_poll_timer_);
  }
}

void SyncSession::Dispatch(std::function<void()> fn) {
  std::weak_ptr<SyncSession*> token = self_token_;
  scheduler_.Post([token, fn = std::move(fn)] {
    if (token.lock()) fn();
  });
}

void SyncSession::WireComponents() {
  gate_.SetPendingSyncHandler([this](bool visible) {
    if (view_) view_->OnPendingSync(visible);
  });
  gate_.SetOpenedHandler([this] { reconciler_.OnGateOpened(); });

  lifecycle_.SetDispatcher([this](std::function<void()> fn) { Dispatch(std::move(fn)); });
  lifecycle_.SetReadyHandler([this] {
    if (view_) view_->OnControlsReady(true);
    reconciler_.OnSurfaceReady();
  });
  lifecycle_.SetConstructionFailedHandler(
      [this](const std::string& /*media_id*/, const std::string& /*reason*/) {
        if (view_) view_->OnControlsReady(false);
        Notify(NoticeLevel::kError, kNoticeInitFailed);
      });
  lifecycle_.SetStateChangeHandler(
      [this](surface::SurfaceState state) { HandleSurfaceState(state); });
  lifecycle_.SetSurfaceErrorHandler(
      [this](int /*error_code*/) { Notify(NoticeLevel::kError, kNoticeVideoFailed); });

  reconciler_.SetPlayingHandler([this](bool playing) { SetPlaying(playing); });
  reconciler_.SetCommandFailedHandler([this](const std::string& what) {
    Notify(NoticeLevel::kWarning, "Playback command failed: " + what);
  });
  tracker_.SetPlayingHandler([this](bool playing) { SetPlaying(playing); });
  tracker_.SetCommandFailedHandler([this](const std::string& what) {
    Notify(NoticeLevel::kWarning, "Playback command failed: " + what);
  });
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void SyncSession::Start() {
  Dispatch([this] {
    if (started_) return;
    started_ = true;
    Logger::Info("[SyncSession] START");
    StartTransportWhenApiReady();
  });
}

void SyncSession::StartTransportWhenApiReady() {
  api_poll_timer_ = runtime::kInvalidTimerId;
  if (!started_) return;
  if (api_readiness_.IsResolved()) {
    StartTransport();
    return;
  }
  Logger::Debug("[SyncSession] WAITING_FOR_SURFACE_API");
  api_poll_timer_ = scheduler_.ScheduleAfter(kApiPollIntervalMs,
                                             [this] { StartTransportWhenApiReady(); });
}

void SyncSession::StartTransport() {
  if (transport_started_) return;
  transport_started_ = true;
  SetConnection(ConnectionStatus::kConnecting);

  transport::TransportHandlers handlers;
  handlers.on_connected = [this] { Dispatch([this] { HandleConnected(); }); };
  handlers.on_disconnected = [this](const std::string& reason, bool server_initiated) {
    Dispatch([this, reason, server_initiated] { HandleDisconnected(reason, server_initiated); });
  };
  handlers.on_connect_error = [this](const std::string& message) {
    Dispatch([this, message] { HandleConnectError(message); });
  };
  handlers.on_snapshot = [this](const sync::SessionSnapshot& snapshot) {
    Dispatch([this, snapshot] { HandleSnapshot(snapshot); });
  };
  handlers.on_viewer_count = [this](int count) {
    Dispatch([this, count] { HandleViewerCount(count); });
  };
  transport_.Start(std::move(handlers));
}

void SyncSession::Stop() {
  Logger::Info("[SyncSession] STOP");
  transport_.Stop();
  Dispatch([this] {
    started_ = false;
    if (api_poll_timer_ != runtime::kInvalidTimerId) {
      scheduler_.Cancel(api_poll_timer_);
      api_poll_timer_ = runtime::kInvalidTimerId;
    }
    lifecycle_.Shutdown();
    SetConnection(ConnectionStatus::kDisconnected);
  });
}

// ---------------------------------------------------------------------------
// User commands
// ---------------------------------------------------------------------------

void SyncSession::Play() {
  Dispatch([this] { tracker_.Play(); });
}

void SyncSession::Pause() {
  Dispatch([this] { tracker_.Pause(); });
}

void SyncSession::SeekBy(double delta_s) {
  Dispatch([this, delta_s] { tracker_.SeekBy(delta_s); });
}

void SyncSession::ChangeMedia(const std::string& identifier) {
  Dispatch([this, identifier] { DoChangeMedia(identifier); });
}

void SyncSession::SyncToSession() {
  Dispatch([this] { DoSyncToSession(); });
}

void SyncSession::DoChangeMedia(const std::string& identifier) {
  if (identifier.empty()) return;
  if (!transport_.IsConnected()) {
    Notify(NoticeLevel::kError, kNoticeNotConnected);
    return;
  }

  double current = 0.0;
  if (surface::IPlaybackSurface* surface = lifecycle_.ReadySurface()) {
    try {
      current = surface->GetCurrentTime();
    } catch (const std::exception& e) {
      Logger::Warn(std::string("[SyncSession] POSITION_UNAVAILABLE what=") + e.what());
    }
  }

  Logger::Info("[SyncSession] CHANGE_MEDIA identifier=" + identifier);
  if (!transport_.Send(transport::OutboundIntent::ChangeMedia(identifier, current, playing_))) {
    Notify(NoticeLevel::kError, kNoticeNotConnected);
  }
}

void SyncSession::DoSyncToSession() {
  // Raised before the gate opens: applying the parked snapshot must consume
  // the request.
  reconciler_.RequestManualSync();
  gate_.Open();
  if (lifecycle_.phase() == surface::PlayerLifecycleManager::Phase::kFailed) {
    lifecycle_.RetryFailed();
  }
  if (transport_.IsConnected()) {
    transport_.Send(transport::OutboundIntent::RequestCurrentState());
  }
}

// ---------------------------------------------------------------------------
// Transport events
// ---------------------------------------------------------------------------

void SyncSession::HandleConnected() {
  SetConnection(ConnectionStatus::kConnected);
  Notify(NoticeLevel::kSuccess, kNoticeConnected);
  // Intents sent while disconnected are lost; ask for the current state
  // instead of replaying them.
  if (!transport_.Send(transport::OutboundIntent::RequestCurrentState())) {
    Logger::Warn("[SyncSession] REQUEST_STATE_FAILED connected=N");
  }
}

void SyncSession::HandleDisconnected(const std::string& reason, bool server_initiated) {
  std::ostringstream oss;
  oss << "[SyncSession] DISCONNECTED reason=" << reason
      << " server_initiated=" << (server_initiated ? "Y" : "N");
  Logger::Info(oss.str());
  if (server_initiated) {
    SetConnection(ConnectionStatus::kConnecting);
    return;
  }
  SetConnection(ConnectionStatus::kDisconnected);
  Notify(NoticeLevel::kError, kNoticeDisconnected);
}

void SyncSession::HandleConnectError(const std::string& message) {
  Logger::Warn("[SyncSession] CONNECT_ERROR what=" + message);
  SetConnection(ConnectionStatus::kDisconnected);
  Notify(NoticeLevel::kError, kNoticeConnectFailed);
}

void SyncSession::HandleSnapshot(const sync::SessionSnapshot& snapshot) {
  const sync::SnapshotReconciler::Disposition disposition = reconciler_.Consume(snapshot);
  if (disposition == sync::SnapshotReconciler::Disposition::kMediaChange) {
    if (view_) {
      view_->OnMediaChanged(*snapshot.media_id);
      view_->OnControlsReady(lifecycle_.IsReady());
    }
  }
}

void SyncSession::HandleViewerCount(int count) {
  viewer_count_ = count;
  if (view_) view_->OnViewerCount(count);
}

void SyncSession::HandleSurfaceState(surface::SurfaceState state) {
  Logger::Debug(std::string("[SyncSession] SURFACE_STATE state=") +
                surface::SurfaceStateName(state));
  switch (state) {
    case surface::SurfaceState::kPlaying:
      SetPlaying(true);
      if (view_) view_->OnBuffering(false);
      break;
    case surface::SurfaceState::kPaused:
    case surface::SurfaceState::kEnded:
      SetPlaying(false);
      if (view_) view_->OnBuffering(false);
      break;
    case surface::SurfaceState::kBuffering:
      if (view_) view_->OnBuffering(true);
      break;
    case surface::SurfaceState::kUnstarted:
    case surface::SurfaceState::kCued:
      break;
  }
}

// ---------------------------------------------------------------------------
// View plumbing
// ---------------------------------------------------------------------------

void SyncSession::SetConnection(ConnectionStatus status) {
  if (connection_ == status) return;
  connection_ = status;
  if (view_) view_->OnConnectionStatus(status);
}

void SyncSession::SetPlaying(bool playing) {
  if (playing_ == playing) return;
  playing_ = playing;
  if (view_) view_->OnPlaying(playing);
}

void SyncSession::Notify(NoticeLevel level, const std::string& message) {
  std::ostringstream oss;
  oss << "[SyncSession] NOTICE level=" << NoticeLevelName(level) << " message=\"" << message << "\"";
  if (level == NoticeLevel::kError) {
    Logger::Warn(oss.str());
  } else {
    Logger::Info(oss.str());
  }
  if (view_) view_->OnNotice(level, message);
}

SyncSession::Status SyncSession::GetStatus() const {
  Status status;
  status.connection = connection_;
  status.viewer_count = viewer_count_;
  status.media_id = lifecycle_.ActiveMediaId().value_or("");
  status.phase = lifecycle_.phase();
  status.playing = playing_;
  status.gate_open = gate_.IsOpen();
  status.pending_sync = gate_.IsPendingSyncVisible();
  status.last_applied_version = state_.last_applied_version;
  if (surface::IPlaybackSurface* surface = lifecycle_.ReadySurface()) {
    try {
      status.position_s = surface->GetCurrentTime();
    } catch (const std::exception& e) {
      Logger::Debug(std::string("[SyncSession] POSITION_UNAVAILABLE what=") + e.what());
    }
  }
  return status;
}

void SyncSession::LogStatus() {
  Dispatch([this] {
    const Status s = GetStatus();
    std::ostringstream oss;
    oss << "[SyncSession] STATUS connection=" << ConnectionStatusName(s.connection)
        << " viewers=" << s.viewer_count
        << " media=" << (s.media_id.empty() ? "-" : s.media_id)
        << " phase=" << surface::PhaseName(s.phase)
        << " playing=" << (s.playing ? "Y" : "N")
        << " gate_open=" << (s.gate_open ? "Y" : "N")
        << " pending_sync=" << (s.pending_sync ? "Y" : "N")
        << " version=" << s.last_applied_version
        << " position=" << std::fixed << std::setprecision(2) << s.position_s;
    Logger::Info(oss.str());
  });
}

}  // namespace lockstep::session
