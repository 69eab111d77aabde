// Repository: Lockstep
// Component: gRPC transport channel implementation
// Copyright (c) 2026 Lockstep

#include "lockstep/transport/GrpcTransportChannel.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "lockstep/transport/SessionWireCodec.hpp"
#include "lockstep/util/Logger.hpp"

namespace lockstep::transport {

namespace proto = lockstep::session::v1;
using lockstep::util::Logger;

namespace {

constexpr int64_t kReadyPollSliceMs = 250;

std::shared_ptr<grpc::Channel> MakeChannel(const GrpcTransportConfig& config) {
  // Keep gRPC's own subchannel backoff short; the connection loop owns the
  // reconnect schedule.
  grpc::ChannelArguments args;
  args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS, 100);
  args.SetInt(GRPC_ARG_MIN_RECONNECT_BACKOFF_MS, 100);
  args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS,
              static_cast<int>(config.reconnect_delay_max_ms));
  return grpc::CreateCustomChannel(config.target_address,
                                   grpc::InsecureChannelCredentials(), args);
}

}  // namespace

int64_t ReconnectDelayMs(const GrpcTransportConfig& config, int attempt) {
  int64_t delay = config.reconnect_delay_ms;
  for (int i = 1; i < attempt && delay < config.reconnect_delay_max_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, config.reconnect_delay_max_ms);
}

GrpcTransportChannel::GrpcTransportChannel(GrpcTransportConfig config)
    : config_(std::move(config)),
      grpc_channel_(MakeChannel(config_)),
      stub_(proto::SessionCoordinator::NewStub(grpc_channel_)),
      rng_(std::random_device{}()) {}

GrpcTransportChannel::~GrpcTransportChannel() {
  Stop();
}

void GrpcTransportChannel::Start(TransportHandlers handlers) {
  if (connection_thread_.joinable()) {
    Logger::Warn("[GrpcTransportChannel] START_IGNORED already_started=Y");
    return;
  }
  handlers_ = std::move(handlers);
  shutdown_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  Logger::Info("[GrpcTransportChannel] START target=" + config_.target_address);
  connection_thread_ = std::thread([this] { ConnectionLoop(); });
}

void GrpcTransportChannel::Stop() {
  shutdown_.store(true, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (active_context_ != nullptr) active_context_->TryCancel();
  }
  queue_cv_.notify_all();
  if (connection_thread_.joinable() &&
      connection_thread_.get_id() != std::this_thread::get_id()) {
    connection_thread_.join();
  }
}

bool GrpcTransportChannel::Send(const OutboundIntent& intent) {
  if (!connected_.load(std::memory_order_acquire)) {
    Logger::Debug(std::string("[GrpcTransportChannel] SEND_DROPPED type=") +
                  IntentTypeName(intent.type) + " connected=N");
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    send_queue_.push_back(intent);
  }
  queue_cv_.notify_one();
  return true;
}

// ---------------------------------------------------------------------------
// Connection loop: reconnect with backoff
// ---------------------------------------------------------------------------

void GrpcTransportChannel::ConnectionLoop() {
  int failed_attempts = 0;

  while (!shutdown_.load(std::memory_order_acquire)) {
    std::string error;
    SessionOutcome outcome = RunOneSession(&error);
    if (shutdown_.load(std::memory_order_acquire) || outcome == SessionOutcome::kShutdown) {
      break;
    }

    if (outcome == SessionOutcome::kServerEnded) {
      // Coordinator asked us to go away and come back; no delay.
      failed_attempts = 0;
      continue;
    }

    if (outcome == SessionOutcome::kStreamLost) {
      failed_attempts = 0;
    } else {
      ++failed_attempts;
      if (handlers_.on_connect_error) handlers_.on_connect_error(error);
      if (failed_attempts >= config_.max_reconnect_attempts) {
        std::ostringstream oss;
        oss << "[GrpcTransportChannel] GIVE_UP target=" << config_.target_address
            << " attempts=" << failed_attempts
            << " last_error=" << error;
        Logger::Error(oss.str());
        break;
      }
    }

    Backoff(failed_attempts + 1);
  }

  running_.store(false, std::memory_order_release);
}

void GrpcTransportChannel::Backoff(int attempt) {
  int64_t delay_ms = ReconnectDelayMs(config_, attempt);
  if (config_.randomization_factor > 0.0) {
    std::uniform_real_distribution<double> jitter(1.0 - config_.randomization_factor,
                                                  1.0 + config_.randomization_factor);
    delay_ms = static_cast<int64_t>(static_cast<double>(delay_ms) * jitter(rng_));
  }

  std::ostringstream oss;
  oss << "[GrpcTransportChannel] RECONNECT_SCHEDULED attempt=" << attempt
      << " delay_ms=" << delay_ms;
  Logger::Warn(oss.str());

  std::unique_lock<std::mutex> lock(queue_mutex_);
  queue_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this] {
    return shutdown_.load(std::memory_order_relaxed);
  });
}

bool GrpcTransportChannel::WaitForReady() {
  const auto deadline = std::chrono::system_clock::now() +
                        std::chrono::milliseconds(config_.connect_timeout_ms);
  while (!shutdown_.load(std::memory_order_acquire)) {
    const auto now = std::chrono::system_clock::now();
    if (now >= deadline) return false;
    const auto slice = std::min(deadline, now + std::chrono::milliseconds(kReadyPollSliceMs));
    if (grpc_channel_->WaitForConnected(slice)) return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Single stream session
// ---------------------------------------------------------------------------

GrpcTransportChannel::SessionOutcome GrpcTransportChannel::RunOneSession(
    std::string* error) {
  if (!WaitForReady()) {
    if (shutdown_.load(std::memory_order_acquire)) return SessionOutcome::kShutdown;
    *error = "connect timeout after " + std::to_string(config_.connect_timeout_ms) + "ms";
    Logger::Warn("[GrpcTransportChannel] CONNECT_FAILED target=" +
                 config_.target_address + " error=" + *error);
    return SessionOutcome::kConnectFailed;
  }

  grpc::ClientContext context;
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) return SessionOutcome::kShutdown;
    active_context_ = &context;
  }
  auto stream = stub_->Join(&context);
  if (!stream) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    active_context_ = nullptr;
    *error = "stream open failed";
    return SessionOutcome::kConnectFailed;
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    send_queue_.clear();
    stream_closed_ = false;
  }
  connected_.store(true, std::memory_order_release);
  connect_count_.fetch_add(1, std::memory_order_relaxed);
  Logger::Info("[GrpcTransportChannel] CONNECTED target=" + config_.target_address);
  if (handlers_.on_connected) handlers_.on_connected();

  std::thread reader([this, &stream] { ReaderLoop(stream.get()); });

  bool write_failed = false;
  while (!shutdown_.load(std::memory_order_relaxed)) {
    std::vector<OutboundIntent> batch;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] {
        return !send_queue_.empty() || stream_closed_ ||
               shutdown_.load(std::memory_order_relaxed);
      });
      if (stream_closed_ && send_queue_.empty()) break;
      batch.swap(send_queue_);
    }

    for (const auto& intent : batch) {
      if (!stream->Write(ToProto(intent, config_.client_id))) {
        write_failed = true;
        break;
      }
    }
    if (write_failed) break;
  }

  connected_.store(false, std::memory_order_release);
  stream->WritesDone();
  if (shutdown_.load(std::memory_order_acquire) || write_failed) {
    context.TryCancel();
  }
  if (reader.joinable()) reader.join();
  grpc::Status status = stream->Finish();
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    active_context_ = nullptr;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    send_queue_.clear();
  }

  if (shutdown_.load(std::memory_order_acquire)) return SessionOutcome::kShutdown;

  const bool server_initiated = status.ok() && !write_failed;
  const std::string reason =
      server_initiated ? "server ended stream"
                       : (status.ok() ? "write failed" : status.error_message());
  std::ostringstream oss;
  oss << "[GrpcTransportChannel] DISCONNECTED reason=" << reason
      << " code=" << static_cast<int>(status.error_code())
      << " server_initiated=" << (server_initiated ? "Y" : "N");
  Logger::Info(oss.str());
  if (handlers_.on_disconnected) handlers_.on_disconnected(reason, server_initiated);

  return server_initiated ? SessionOutcome::kServerEnded : SessionOutcome::kStreamLost;
}

// ---------------------------------------------------------------------------
// Event reader: delivers coordinator broadcasts
// ---------------------------------------------------------------------------

void GrpcTransportChannel::ReaderLoop(
    grpc::ClientReaderWriter<proto::ClientIntent, proto::CoordinatorEvent>* stream) {
  proto::CoordinatorEvent event;
  while (stream->Read(&event)) {
    switch (event.event_case()) {
      case proto::CoordinatorEvent::kSessionState:
        if (handlers_.on_snapshot) handlers_.on_snapshot(FromProto(event.session_state()));
        break;
      case proto::CoordinatorEvent::kViewerCount:
        if (handlers_.on_viewer_count) handlers_.on_viewer_count(event.viewer_count().count());
        break;
      case proto::CoordinatorEvent::EVENT_NOT_SET:
        Logger::Debug("[GrpcTransportChannel] EMPTY_EVENT ignored");
        break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stream_closed_ = true;
  }
  queue_cv_.notify_all();
}

}  // namespace lockstep::transport
