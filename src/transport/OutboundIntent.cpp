// Repository: Lockstep
// Component: Outbound Intent
// Purpose: Locally-originated requests sent to the coordinator.
// Copyright (c) 2026 Lockstep

#include "lockstep/transport/OutboundIntent.hpp"

#include <utility>

namespace lockstep::transport {

const char* IntentTypeName(IntentType type) {
  switch (type) {
    case IntentType::kChangeMedia: return "change-media";
    case IntentType::kPlay: return "play";
    case IntentType::kPause: return "pause";
    case IntentType::kSeek: return "seek";
    case IntentType::kRequestCurrentState: return "request-current-state";
  }
  return "unknown";
}

OutboundIntent OutboundIntent::ChangeMedia(std::string identifier,
                                           double current_time,
                                           bool is_playing) {
  OutboundIntent intent;
  intent.type = IntentType::kChangeMedia;
  intent.identifier = std::move(identifier);
  intent.current_time = current_time;
  intent.is_playing = is_playing;
  return intent;
}

OutboundIntent OutboundIntent::Play(double current_time) {
  OutboundIntent intent;
  intent.type = IntentType::kPlay;
  intent.current_time = current_time;
  return intent;
}

OutboundIntent OutboundIntent::Pause(double current_time) {
  OutboundIntent intent;
  intent.type = IntentType::kPause;
  intent.current_time = current_time;
  return intent;
}

OutboundIntent OutboundIntent::Seek(double current_time) {
  OutboundIntent intent;
  intent.type = IntentType::kSeek;
  intent.current_time = current_time;
  return intent;
}

OutboundIntent OutboundIntent::RequestCurrentState() {
  return OutboundIntent{};
}

}  // namespace lockstep::transport
