// Repository: Lockstep
// Component: Session wire codec
// Purpose: Convert between lockstep.session.v1 messages and in-process types.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_TRANSPORT_SESSION_WIRE_CODEC_HPP_
#define LOCKSTEP_TRANSPORT_SESSION_WIRE_CODEC_HPP_

#include <optional>
#include <string>

#include "lockstep/sync/SessionSnapshot.hpp"
#include "lockstep/transport/OutboundIntent.hpp"
#include "session_coordinator.pb.h"

namespace lockstep::transport {

namespace wire = lockstep::session::v1;

// Client side.
wire::ClientIntent ToProto(const OutboundIntent& intent, const std::string& client_id);
sync::SessionSnapshot FromProto(const wire::SessionState& state);

// Coordinator side; used by the in-process coordinator in tests and by
// tooling that replays captured sessions.
wire::SessionState ToProto(const sync::SessionSnapshot& snapshot);

// nullopt when the message carries no intent.
std::optional<OutboundIntent> FromProto(const wire::ClientIntent& message);

}  // namespace lockstep::transport

#endif  // LOCKSTEP_TRANSPORT_SESSION_WIRE_CODEC_HPP_
