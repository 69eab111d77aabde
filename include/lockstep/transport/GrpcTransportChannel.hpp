// Repository: Lockstep
// Component: gRPC transport channel (bidirectional stream to the coordinator)
// Purpose: Join the session stream, deliver coordinator events, send intents,
//          and reconnect with randomized exponential backoff.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_TRANSPORT_GRPC_TRANSPORT_CHANNEL_HPP_
#define LOCKSTEP_TRANSPORT_GRPC_TRANSPORT_CHANNEL_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "lockstep/transport/ITransportChannel.hpp"
#include "session_coordinator.grpc.pb.h"

namespace lockstep::transport {

struct GrpcTransportConfig {
  std::string target_address = "localhost:8001";
  std::string client_id;

  // Per attempt: how long to wait for the channel to become READY.
  int64_t connect_timeout_ms = 20000;

  // Delay before reconnect attempt n is
  //   min(reconnect_delay_ms * 2^(n-1), reconnect_delay_max_ms)
  // scaled by a uniform factor in [1 - randomization, 1 + randomization].
  int64_t reconnect_delay_ms = 1000;
  int64_t reconnect_delay_max_ms = 5000;
  double randomization_factor = 0.5;

  // Consecutive failed attempts before the channel gives up.
  int max_reconnect_attempts = 5;
};

// Delay before reconnect attempt `attempt` (1-based), before randomization.
int64_t ReconnectDelayMs(const GrpcTransportConfig& config, int attempt);

// Streams ClientIntent messages to the coordinator's Join RPC and delivers
// CoordinatorEvent messages to the handlers.
//
// Threads:
//   connection thread: connect, write queued intents, reconnect
//   reader thread (per stream): reads events, invokes on_snapshot /
//                               on_viewer_count
// Handlers run on those threads, never on the caller's.
//
// On disconnect:
//   server ended the stream cleanly → reconnect immediately
//   anything else                   → reconnect after backoff
// After max_reconnect_attempts consecutive connect failures the channel
// reports a final connect error and stops. Queued intents are dropped
// when a stream ends.
class GrpcTransportChannel : public ITransportChannel {
 public:
  explicit GrpcTransportChannel(GrpcTransportConfig config);
  ~GrpcTransportChannel() override;

  GrpcTransportChannel(const GrpcTransportChannel&) = delete;
  GrpcTransportChannel& operator=(const GrpcTransportChannel&) = delete;

  void Start(TransportHandlers handlers) override;
  void Stop() override;
  [[nodiscard]] bool IsConnected() const override {
    return connected_.load(std::memory_order_acquire);
  }
  bool Send(const OutboundIntent& intent) override;

  // True while the connection thread is alive (connected or retrying).
  [[nodiscard]] bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Streams successfully opened since Start().
  [[nodiscard]] uint64_t ConnectCount() const {
    return connect_count_.load(std::memory_order_relaxed);
  }

 private:
  enum class SessionOutcome {
    kConnectFailed,
    kServerEnded,
    kStreamLost,
    kShutdown,
  };

  // Outer loop: connects, streams, reconnects on failure.
  void ConnectionLoop();

  // One stream session. Returns on disconnect or shutdown.
  SessionOutcome RunOneSession(std::string* error);

  // Waits for the channel to become READY, in slices so Stop() stays prompt.
  bool WaitForReady();

  // Sleeps for the attempt's backoff unless Stop() is called first.
  void Backoff(int attempt);

  // Event reader: one per stream, exits when the stream ends.
  void ReaderLoop(grpc::ClientReaderWriter<lockstep::session::v1::ClientIntent,
                                           lockstep::session::v1::CoordinatorEvent>* stream);

  GrpcTransportConfig config_;
  TransportHandlers handlers_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<lockstep::session::v1::SessionCoordinator::Stub> stub_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::vector<OutboundIntent> send_queue_;
  bool stream_closed_ = false;

  // Active call, so Stop() can cancel a blocked Read().
  std::mutex context_mutex_;
  grpc::ClientContext* active_context_ = nullptr;

  std::mt19937 rng_;

  std::atomic<bool> shutdown_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};
  std::atomic<uint64_t> connect_count_{0};

  std::thread connection_thread_;
};

}  // namespace lockstep::transport

#endif  // LOCKSTEP_TRANSPORT_GRPC_TRANSPORT_CHANNEL_HPP_
