// Repository: Lockstep
// Component: Outbound Intent
// Purpose: Locally-originated requests sent to the coordinator.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_TRANSPORT_OUTBOUND_INTENT_HPP_
#define LOCKSTEP_TRANSPORT_OUTBOUND_INTENT_HPP_

#include <string>

namespace lockstep::transport {

enum class IntentType {
  kChangeMedia,
  kPlay,
  kPause,
  kSeek,
  kRequestCurrentState,
};

const char* IntentTypeName(IntentType type);

// Fields not used by a given type keep their defaults.
//   change-media          {identifier, current_time, is_playing}
//   play / pause / seek   {current_time}
//   request-current-state {}
struct OutboundIntent {
  IntentType type = IntentType::kRequestCurrentState;
  std::string identifier;
  double current_time = 0.0;
  bool is_playing = false;

  static OutboundIntent ChangeMedia(std::string identifier,
                                    double current_time,
                                    bool is_playing);
  static OutboundIntent Play(double current_time);
  static OutboundIntent Pause(double current_time);
  static OutboundIntent Seek(double current_time);
  static OutboundIntent RequestCurrentState();
};

}  // namespace lockstep::transport

#endif  // LOCKSTEP_TRANSPORT_OUTBOUND_INTENT_HPP_
