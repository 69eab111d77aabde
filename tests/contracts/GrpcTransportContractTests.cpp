// Contract tests for the gRPC transport against an in-process coordinator
// listening on a loopback port.

#include "BaseContractTest.h"
#include "contracts/ContractRegistryEnvironment.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "lockstep/transport/GrpcTransportChannel.hpp"
#include "lockstep/transport/SessionWireCodec.hpp"
#include "session_coordinator.grpc.pb.h"

namespace lockstep::tests::contracts {

namespace {

namespace wire = lockstep::session::v1;
using transport::GrpcTransportChannel;
using transport::GrpcTransportConfig;
using transport::OutboundIntent;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "GrpcTransport", {"GT-001", "GT-002", "GT-003", "GT-004", "GT-005"});
  return true;
}();

// Polls until pred() holds or the timeout passes.
bool WaitUntil(const std::function<bool()>& pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

// Coordinator double: on every Join it sends one session state (version =
// join number) and a viewer count, then records intents until the client
// goes away. With end_first_stream set, the first Join returns right after
// the greeting.
class TestCoordinator final : public wire::SessionCoordinator::Service {
 public:
  grpc::Status Join(grpc::ServerContext* /*context*/,
                    grpc::ServerReaderWriter<wire::CoordinatorEvent, wire::ClientIntent>* stream)
      override {
    const int join = ++joins;

    sync::SessionSnapshot snapshot;
    snapshot.version = join;
    snapshot.media_id = "abc";
    snapshot.is_playing = true;
    snapshot.playback_time_at_last_event = 10.0;
    snapshot.last_event_at_ms = 5'000;
    snapshot.coordinator_time_ms = 5'200;

    wire::CoordinatorEvent state;
    *state.mutable_session_state() = transport::ToProto(snapshot);
    stream->Write(state);

    wire::CoordinatorEvent viewers;
    viewers.mutable_viewer_count()->set_count(3);
    stream->Write(viewers);

    if (join == 1 && end_first_stream) return grpc::Status::OK;

    wire::ClientIntent intent;
    while (stream->Read(&intent)) {
      std::lock_guard<std::mutex> lock(mutex_);
      intents_.push_back(intent);
    }
    return grpc::Status::OK;
  }

  std::vector<wire::ClientIntent> Intents() {
    std::lock_guard<std::mutex> lock(mutex_);
    return intents_;
  }

  std::atomic<int> joins{0};
  std::atomic<bool> end_first_stream{false};

 private:
  std::mutex mutex_;
  std::vector<wire::ClientIntent> intents_;
};

// Thread-safe record of handler invocations.
struct HandlerLog {
  std::mutex mutex;
  int connected = 0;
  int connect_errors = 0;
  std::vector<std::pair<std::string, bool>> disconnects;
  std::vector<sync::SessionSnapshot> snapshots;
  int viewer_count = 0;

  transport::TransportHandlers Handlers() {
    transport::TransportHandlers h;
    h.on_connected = [this] {
      std::lock_guard<std::mutex> lock(mutex);
      ++connected;
    };
    h.on_disconnected = [this](const std::string& reason, bool server_initiated) {
      std::lock_guard<std::mutex> lock(mutex);
      disconnects.emplace_back(reason, server_initiated);
    };
    h.on_connect_error = [this](const std::string& /*message*/) {
      std::lock_guard<std::mutex> lock(mutex);
      ++connect_errors;
    };
    h.on_snapshot = [this](const sync::SessionSnapshot& s) {
      std::lock_guard<std::mutex> lock(mutex);
      snapshots.push_back(s);
    };
    h.on_viewer_count = [this](int count) {
      std::lock_guard<std::mutex> lock(mutex);
      viewer_count = count;
    };
    return h;
  }

  template <typename Fn>
  auto With(Fn fn) {
    std::lock_guard<std::mutex> lock(mutex);
    return fn();
  }
};

}  // namespace

class GrpcTransportContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "GrpcTransport"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"GT-001", "GT-002", "GT-003", "GT-004", "GT-005"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
    builder.RegisterService(&coordinator_);
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    ASSERT_GT(port_, 0);
  }

  void TearDown() override {
    if (channel_) channel_->Stop();
    channel_.reset();
    if (server_) {
      server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
    }
  }

  GrpcTransportConfig Config() const {
    GrpcTransportConfig config;
    config.target_address = "127.0.0.1:" + std::to_string(port_);
    config.client_id = "client-a";
    config.connect_timeout_ms = 3'000;
    // Large enough that a backed-off reconnect would miss every wait below.
    config.reconnect_delay_ms = 10'000;
    config.reconnect_delay_max_ms = 10'000;
    return config;
  }

  void StartChannel(GrpcTransportConfig config) {
    channel_ = std::make_unique<GrpcTransportChannel>(std::move(config));
    channel_->Start(log_.Handlers());
  }

  TestCoordinator coordinator_;
  int port_ = 0;
  std::unique_ptr<grpc::Server> server_;
  HandlerLog log_;
  std::unique_ptr<GrpcTransportChannel> channel_;
};

TEST_F(GrpcTransportContractTest, GT_001_JoinDeliversSessionStateAndViewerCount) {
  StartChannel(Config());

  ASSERT_TRUE(WaitUntil([&] {
    return log_.With([&] { return !log_.snapshots.empty() && log_.viewer_count == 3; });
  }));
  EXPECT_TRUE(channel_->IsConnected());
  EXPECT_EQ(channel_->ConnectCount(), 1u);

  const sync::SessionSnapshot snapshot = log_.With([&] { return log_.snapshots.front(); });
  EXPECT_EQ(snapshot.version, 1);
  ASSERT_TRUE(snapshot.media_id.has_value());
  EXPECT_EQ(*snapshot.media_id, "abc");
  EXPECT_TRUE(snapshot.is_playing);
  EXPECT_EQ(snapshot.coordinator_time_ms, 5'200);
  EXPECT_EQ(log_.With([&] { return log_.connected; }), 1);
}

TEST_F(GrpcTransportContractTest, GT_002_IntentsReachTheCoordinatorInOrder) {
  StartChannel(Config());
  ASSERT_TRUE(WaitUntil([&] { return channel_->IsConnected(); }));

  EXPECT_TRUE(channel_->Send(OutboundIntent::RequestCurrentState()));
  EXPECT_TRUE(channel_->Send(OutboundIntent::Play(12.5)));
  EXPECT_TRUE(channel_->Send(OutboundIntent::ChangeMedia("https://media.example/v", 3.0, true)));

  ASSERT_TRUE(WaitUntil([&] { return coordinator_.Intents().size() == 3; }));
  const auto intents = coordinator_.Intents();
  EXPECT_EQ(intents[0].intent_case(), wire::ClientIntent::kRequestCurrentState);
  EXPECT_EQ(intents[1].intent_case(), wire::ClientIntent::kPlay);
  EXPECT_DOUBLE_EQ(intents[1].play().current_time(), 12.5);
  EXPECT_EQ(intents[2].change_media().identifier(), "https://media.example/v");
  for (const auto& intent : intents) {
    EXPECT_EQ(intent.client_id(), "client-a");
  }
}

TEST_F(GrpcTransportContractTest, GT_003_ServerEndedStreamReconnectsWithoutBackoff) {
  coordinator_.end_first_stream = true;
  StartChannel(Config());

  ASSERT_TRUE(WaitUntil([&] { return channel_->ConnectCount() >= 2; }));
  ASSERT_TRUE(WaitUntil([&] { return channel_->IsConnected(); }));

  const auto disconnects = log_.With([&] { return log_.disconnects; });
  ASSERT_FALSE(disconnects.empty());
  EXPECT_TRUE(disconnects.front().second);
  EXPECT_EQ(log_.With([&] { return log_.connect_errors; }), 0);

  // The fresh stream carries the coordinator's next greeting.
  ASSERT_TRUE(WaitUntil([&] {
    return log_.With([&] { return log_.snapshots.size() >= 2; });
  }));
  EXPECT_EQ(log_.With([&] { return log_.snapshots.back().version; }), 2);
}

TEST_F(GrpcTransportContractTest, GT_004_UnreachableCoordinatorGivesUpAndRefusesSends) {
  GrpcTransportConfig config = Config();
  // Nothing listens here once the server is gone.
  server_->Shutdown(std::chrono::system_clock::now());
  server_.reset();
  config.connect_timeout_ms = 300;
  config.reconnect_delay_ms = 10;
  config.reconnect_delay_max_ms = 20;
  config.max_reconnect_attempts = 2;

  StartChannel(config);
  EXPECT_FALSE(channel_->Send(OutboundIntent::Play(1.0)));

  ASSERT_TRUE(WaitUntil([&] { return !channel_->IsRunning(); }));
  EXPECT_EQ(log_.With([&] { return log_.connect_errors; }), 2);
  EXPECT_EQ(channel_->ConnectCount(), 0u);
  EXPECT_FALSE(channel_->IsConnected());
}

TEST_F(GrpcTransportContractTest, GT_005_ReconnectDelayDoublesUpToTheCap) {
  GrpcTransportConfig config;
  config.reconnect_delay_ms = 1'000;
  config.reconnect_delay_max_ms = 5'000;

  EXPECT_EQ(transport::ReconnectDelayMs(config, 1), 1'000);
  EXPECT_EQ(transport::ReconnectDelayMs(config, 2), 2'000);
  EXPECT_EQ(transport::ReconnectDelayMs(config, 3), 4'000);
  EXPECT_EQ(transport::ReconnectDelayMs(config, 4), 5'000);
  EXPECT_EQ(transport::ReconnectDelayMs(config, 12), 5'000);
}

}  // namespace lockstep::tests::contracts
