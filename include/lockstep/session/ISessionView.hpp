// Repository: Lockstep
// Component: Session View
// Purpose: UI-facing observer of session state (connection, viewers,
//          pending-sync prompt, controls, notices).
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SESSION_ISESSION_VIEW_HPP_
#define LOCKSTEP_SESSION_ISESSION_VIEW_HPP_

#include <string>

namespace lockstep::session {

enum class ConnectionStatus {
  kConnecting,
  kConnected,
  kDisconnected,
};

const char* ConnectionStatusName(ConnectionStatus status);

enum class NoticeLevel {
  kSuccess,
  kInfo,
  kWarning,
  kError,
};

const char* NoticeLevelName(NoticeLevel level);

// Every method runs on the session's event loop and defaults to a no-op.
class ISessionView {
 public:
  virtual ~ISessionView() = default;

  virtual void OnConnectionStatus(ConnectionStatus /*status*/) {}
  virtual void OnViewerCount(int /*count*/) {}

  // "Click to sync" prompt: a remote session is playing and the local
  // player waits for a user gesture.
  virtual void OnPendingSync(bool /*visible*/) {}

  // Playback controls are usable only while a surface is ready.
  virtual void OnControlsReady(bool /*ready*/) {}
  virtual void OnMediaChanged(const std::string& /*media_id*/) {}

  virtual void OnPlaying(bool /*playing*/) {}
  virtual void OnBuffering(bool /*buffering*/) {}

  // Transient user-facing message.
  virtual void OnNotice(NoticeLevel /*level*/, const std::string& /*message*/) {}
};

}  // namespace lockstep::session

#endif  // LOCKSTEP_SESSION_ISESSION_VIEW_HPP_
