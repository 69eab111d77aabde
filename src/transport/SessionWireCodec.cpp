// Repository: Lockstep
// Component: Session wire codec
// Purpose: Convert between lockstep.session.v1 messages and in-process types.
// Copyright (c) 2026 Lockstep

#include "lockstep/transport/SessionWireCodec.hpp"

namespace lockstep::transport {

wire::ClientIntent ToProto(const OutboundIntent& intent, const std::string& client_id) {
  wire::ClientIntent p;
  p.set_client_id(client_id);

  switch (intent.type) {
    case IntentType::kChangeMedia: {
      auto* cm = p.mutable_change_media();
      cm->set_identifier(intent.identifier);
      cm->set_current_time(intent.current_time);
      cm->set_is_playing(intent.is_playing);
      break;
    }
    case IntentType::kPlay:
      p.mutable_play()->set_current_time(intent.current_time);
      break;
    case IntentType::kPause:
      p.mutable_pause()->set_current_time(intent.current_time);
      break;
    case IntentType::kSeek:
      p.mutable_seek()->set_current_time(intent.current_time);
      break;
    case IntentType::kRequestCurrentState:
      p.mutable_request_current_state();
      break;
  }
  return p;
}

sync::SessionSnapshot FromProto(const wire::SessionState& state) {
  sync::SessionSnapshot s;
  s.version = state.version();
  if (state.has_media_id()) s.media_id = state.media_id();
  s.is_playing = state.is_playing();
  s.playback_time_at_last_event = state.playback_time_at_last_event();
  s.last_event_at_ms = state.last_event_at_ms();
  s.coordinator_time_ms = state.coordinator_time_ms();
  return s;
}

wire::SessionState ToProto(const sync::SessionSnapshot& snapshot) {
  wire::SessionState p;
  p.set_version(snapshot.version);
  if (snapshot.media_id) p.set_media_id(*snapshot.media_id);
  p.set_is_playing(snapshot.is_playing);
  p.set_playback_time_at_last_event(snapshot.playback_time_at_last_event);
  p.set_last_event_at_ms(snapshot.last_event_at_ms);
  p.set_coordinator_time_ms(snapshot.coordinator_time_ms);
  return p;
}

std::optional<OutboundIntent> FromProto(const wire::ClientIntent& message) {
  switch (message.intent_case()) {
    case wire::ClientIntent::kChangeMedia:
      return OutboundIntent::ChangeMedia(message.change_media().identifier(),
                                         message.change_media().current_time(),
                                         message.change_media().is_playing());
    case wire::ClientIntent::kPlay:
      return OutboundIntent::Play(message.play().current_time());
    case wire::ClientIntent::kPause:
      return OutboundIntent::Pause(message.pause().current_time());
    case wire::ClientIntent::kSeek:
      return OutboundIntent::Seek(message.seek().current_time());
    case wire::ClientIntent::kRequestCurrentState:
      return OutboundIntent::RequestCurrentState();
    case wire::ClientIntent::INTENT_NOT_SET:
      break;
  }
  return std::nullopt;
}

}  // namespace lockstep::transport
