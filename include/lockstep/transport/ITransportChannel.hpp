// Repository: Lockstep
// Component: Transport Channel Interface
// Purpose: Bidirectional event channel to the coordinator. Connection,
//          reconnection and backoff belong to the implementation.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_TRANSPORT_ITRANSPORT_CHANNEL_HPP_
#define LOCKSTEP_TRANSPORT_ITRANSPORT_CHANNEL_HPP_

#include <functional>
#include <string>

#include "lockstep/sync/SessionSnapshot.hpp"
#include "lockstep/transport/OutboundIntent.hpp"

namespace lockstep::transport {

// Handlers run on the channel's own thread. Consumers that keep state
// marshal them onto their event loop.
struct TransportHandlers {
  std::function<void()> on_connected;
  // server_initiated: the coordinator closed the stream deliberately.
  std::function<void(const std::string& reason, bool server_initiated)> on_disconnected;
  std::function<void(const std::string& message)> on_connect_error;
  std::function<void(const sync::SessionSnapshot& snapshot)> on_snapshot;
  std::function<void(int count)> on_viewer_count;
};

class ITransportChannel {
 public:
  virtual ~ITransportChannel() = default;

  // Begins connecting. Handlers must outlive the channel or Stop().
  virtual void Start(TransportHandlers handlers) = 0;

  // Closes the connection and stops reconnecting. Idempotent.
  virtual void Stop() = 0;

  [[nodiscard]] virtual bool IsConnected() const = 0;

  // Queues an intent for the current connection. Returns false while
  // disconnected; intents are not retried across reconnects.
  virtual bool Send(const OutboundIntent& intent) = 0;
};

}  // namespace lockstep::transport

#endif  // LOCKSTEP_TRANSPORT_ITRANSPORT_CHANNEL_HPP_
