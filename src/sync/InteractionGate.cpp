// Repository: Lockstep
// Component: Interaction Gate
// Purpose: Platform autoplay policy: remotely-triggered playback waits for a
//          user gesture.
// Copyright (c) 2026 Lockstep

#include "lockstep/sync/InteractionGate.hpp"

#include <utility>

#include "lockstep/util/Logger.hpp"

namespace lockstep::sync {

using lockstep::util::Logger;

InteractionGate::InteractionGate(ReconciliationState& state) : state_(state) {}

void InteractionGate::SetPendingSyncHandler(PendingSyncHandler handler) {
  pending_sync_handler_ = std::move(handler);
}

void InteractionGate::SetOpenedHandler(OpenedHandler handler) {
  opened_handler_ = std::move(handler);
}

bool InteractionGate::Open() {
  SetPendingSyncVisible(false);
  if (state_.has_user_interacted) return false;

  state_.has_user_interacted = true;
  Logger::Info("[InteractionGate] OPENED");
  if (opened_handler_) opened_handler_();
  return true;
}

void InteractionGate::SignalPendingSync() {
  if (state_.has_user_interacted) return;
  if (!pending_sync_visible_) {
    Logger::Info("[InteractionGate] PENDING_SYNC waiting_for=user_gesture");
  }
  SetPendingSyncVisible(true);
}

void InteractionGate::SetPendingSyncVisible(bool visible) {
  if (pending_sync_visible_ == visible) return;
  pending_sync_visible_ = visible;
  if (pending_sync_handler_) pending_sync_handler_(visible);
}

}  // namespace lockstep::sync
