// Contract tests for locally-initiated playback commands and the echo
// suppression window they open.

#include "BaseContractTest.h"
#include "contracts/ContractRegistryEnvironment.h"

#include <memory>
#include <string>

#include "fixtures/FakePlaybackSurface.h"
#include "fixtures/FakeTransportChannel.h"
#include "lockstep/surface/PlayerLifecycleManager.hpp"
#include "lockstep/surface/SurfaceApiReadiness.hpp"
#include "lockstep/sync/InteractionGate.hpp"
#include "lockstep/sync/LocalActionTracker.hpp"
#include "lockstep/sync/SnapshotReconciler.hpp"
#include "support/ManualScheduler.hpp"

namespace lockstep::tests::contracts {

namespace {

using fixtures::FakeSurfaceFactory;
using fixtures::FakeSurfaceHost;
using fixtures::FakeTransportChannel;
using fixtures::SurfaceProbe;
using transport::IntentType;
using Disposition = sync::SnapshotReconciler::Disposition;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage(
      "LocalActionTracker",
      {"LA-001", "LA-002", "LA-003", "LA-004", "LA-005", "LA-006", "LA-007"});
  return true;
}();

sync::SessionSnapshot Snap(int64_t version, bool playing, double t) {
  sync::SessionSnapshot s;
  s.version = version;
  s.media_id = "abc";
  s.is_playing = playing;
  s.playback_time_at_last_event = t;
  s.last_event_at_ms = 5'000;
  s.coordinator_time_ms = 5'000;
  return s;
}

}  // namespace

class LocalActionTrackerContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "LocalActionTracker"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"LA-001", "LA-002", "LA-003", "LA-004", "LA-005", "LA-006", "LA-007"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    readiness_.Resolve();
    lifecycle_ = std::make_unique<surface::PlayerLifecycleManager>(
        scheduler_, factory_, host_, readiness_, config_);
    gate_ = std::make_unique<sync::InteractionGate>(state_);
    reconciler_ = std::make_unique<sync::SnapshotReconciler>(state_, *lifecycle_, *gate_,
                                                             scheduler_, config_);
    tracker_ = std::make_unique<sync::LocalActionTracker>(state_, *lifecycle_, *gate_,
                                                          transport_, scheduler_, config_);
    lifecycle_->SetReadyHandler([this] { reconciler_->OnSurfaceReady(); });
    gate_->SetOpenedHandler([this] { reconciler_->OnGateOpened(); });
  }

  std::shared_ptr<SurfaceProbe> MakeReady() {
    lifecycle_->BeginTransition("abc");
    auto probe = factory_.Last();
    probe->FireReady();
    return probe;
  }

  sync::ReconciliationState state_;
  ManualScheduler scheduler_;
  FakeSurfaceFactory factory_;
  FakeSurfaceHost host_;
  FakeTransportChannel transport_;
  surface::SurfaceApiReadiness readiness_;
  sync::SyncConfig config_;

  std::unique_ptr<surface::PlayerLifecycleManager> lifecycle_;
  std::unique_ptr<sync::InteractionGate> gate_;
  std::unique_ptr<sync::SnapshotReconciler> reconciler_;
  std::unique_ptr<sync::LocalActionTracker> tracker_;
};

TEST_F(LocalActionTrackerContractTest, LA_001_PlayAppliesLocallyAndEmitsIntent) {
  auto probe = MakeReady();
  transport_.SetConnected(true);
  probe->current_time = 12.5;

  ASSERT_TRUE(tracker_->Play());
  EXPECT_EQ(probe->play_calls, 1);
  ASSERT_EQ(transport_.sent.size(), 1u);
  EXPECT_EQ(transport_.sent[0].type, IntentType::kPlay);
  EXPECT_DOUBLE_EQ(transport_.sent[0].current_time, 12.5);
  EXPECT_TRUE(gate_->IsOpen());
  EXPECT_TRUE(state_.is_local_action_in_flight);

  scheduler_.AdvanceMs(config_.local_action_window_ms);
  EXPECT_FALSE(state_.is_local_action_in_flight);

  ASSERT_TRUE(tracker_->Pause());
  EXPECT_EQ(probe->pause_calls, 1);
  ASSERT_EQ(transport_.sent.size(), 2u);
  EXPECT_EQ(transport_.sent[1].type, IntentType::kPause);
  EXPECT_DOUBLE_EQ(transport_.sent[1].current_time, 12.5);
}

TEST_F(LocalActionTrackerContractTest, LA_002_RefusedWithoutReadySurfaceOrConnection) {
  transport_.SetConnected(true);
  EXPECT_FALSE(tracker_->Play());  // no surface yet

  auto probe = MakeReady();
  transport_.SetConnected(false);
  EXPECT_FALSE(tracker_->Pause());
  EXPECT_FALSE(tracker_->SeekBy(10.0));

  EXPECT_TRUE(probe->commands.empty());
  EXPECT_TRUE(transport_.sent.empty());
  EXPECT_FALSE(gate_->IsOpen());
  EXPECT_FALSE(state_.is_local_action_in_flight);
  EXPECT_EQ(tracker_->GetMetrics().refused_total, 3u);
}

TEST_F(LocalActionTrackerContractTest, LA_003_RelativeSeekFromCurrentPosition) {
  auto probe = MakeReady();
  transport_.SetConnected(true);
  probe->current_time = 30.0;

  ASSERT_TRUE(tracker_->SeekBy(config_.seek_step_s));
  EXPECT_DOUBLE_EQ(probe->last_seek, 40.0);
  EXPECT_TRUE(probe->last_seek_allow_ahead);
  ASSERT_EQ(transport_.sent.size(), 1u);
  EXPECT_EQ(transport_.sent[0].type, IntentType::kSeek);
  EXPECT_DOUBLE_EQ(transport_.sent[0].current_time, 40.0);

  // Never before the start of the media.
  ASSERT_TRUE(tracker_->SeekBy(-50.0));
  EXPECT_DOUBLE_EQ(probe->last_seek, 0.0);
  EXPECT_DOUBLE_EQ(transport_.sent[1].current_time, 0.0);
}

TEST_F(LocalActionTrackerContractTest, LA_004_EchoOfOwnActionIsNotReapplied) {
  auto probe = MakeReady();
  transport_.SetConnected(true);
  probe->current_time = 20.0;

  ASSERT_TRUE(tracker_->Pause());
  const size_t commands_after_pause = probe->commands.size();

  // Coordinator broadcasts the pause back 50 ms later with a stale position.
  scheduler_.AdvanceMs(50);
  EXPECT_EQ(reconciler_->Consume(Snap(1, false, 19.0)), Disposition::kSuppressed);
  EXPECT_EQ(probe->commands.size(), commands_after_pause);

  // After the window an independent update applies normally.
  scheduler_.AdvanceMs(config_.local_action_window_ms);
  EXPECT_EQ(reconciler_->Consume(Snap(2, false, 25.0)), Disposition::kApplied);
  EXPECT_DOUBLE_EQ(probe->current_time, 25.0);
}

TEST_F(LocalActionTrackerContractTest, LA_005_WindowIsDebouncedAcrossActions) {
  MakeReady();
  transport_.SetConnected(true);

  ASSERT_TRUE(tracker_->Play());
  scheduler_.AdvanceMs(80);
  ASSERT_TRUE(tracker_->Pause());

  scheduler_.AdvanceMs(70);  // 150 ms after the first action
  EXPECT_TRUE(state_.is_local_action_in_flight);
  scheduler_.AdvanceMs(30);  // 100 ms after the second
  EXPECT_FALSE(state_.is_local_action_in_flight);
}

TEST_F(LocalActionTrackerContractTest, LA_006_GestureAppliesParkedSnapshotThenLocalCommandWins) {
  auto probe = MakeReady();
  transport_.SetConnected(true);

  ASSERT_EQ(reconciler_->Consume(Snap(1, true, 60.0)), Disposition::kDeferredForGesture);
  ASSERT_TRUE(probe->commands.empty());

  ASSERT_TRUE(tracker_->Pause());
  ASSERT_EQ(probe->commands.size(), 3u);
  EXPECT_EQ(probe->commands[0], "seek:60.00");
  EXPECT_EQ(probe->commands[1], "play");
  EXPECT_EQ(probe->commands[2], "pause");
  EXPECT_FALSE(probe->playing);
  EXPECT_FALSE(state_.pending_snapshot.has_value());

  ASSERT_EQ(transport_.sent.size(), 1u);
  EXPECT_EQ(transport_.sent[0].type, IntentType::kPause);
  EXPECT_DOUBLE_EQ(transport_.sent[0].current_time, 60.0);
}

TEST_F(LocalActionTrackerContractTest, LA_007_SurfaceFailureSendsNothing) {
  auto probe = MakeReady();
  transport_.SetConnected(true);
  std::string reported;
  tracker_->SetCommandFailedHandler([&reported](const std::string& what) { reported = what; });

  probe->throw_on_command = true;
  EXPECT_FALSE(tracker_->Play());
  EXPECT_TRUE(transport_.sent.empty());
  EXPECT_FALSE(reported.empty());
  EXPECT_EQ(tracker_->GetMetrics().command_failure_total, 1u);

  EXPECT_TRUE(state_.is_local_action_in_flight);
  scheduler_.AdvanceMs(config_.local_action_window_ms);
  EXPECT_FALSE(state_.is_local_action_in_flight);
}

}  // namespace lockstep::tests::contracts
