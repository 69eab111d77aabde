// Repository: Lockstep
// Component: Session snapshot unit tests

#include <gtest/gtest.h>

#include "lockstep/sync/SessionSnapshot.hpp"

namespace lockstep::sync {
namespace {

SessionSnapshot Make(bool playing, double t, int64_t last_event_at_ms, int64_t now_ms) {
  SessionSnapshot s;
  s.version = 7;
  s.is_playing = playing;
  s.playback_time_at_last_event = t;
  s.last_event_at_ms = last_event_at_ms;
  s.coordinator_time_ms = now_ms;
  return s;
}

// -----------------------------------------------------------------------------
// Target time: frozen when paused, extrapolated on the coordinator clock when
// playing
// -----------------------------------------------------------------------------
TEST(SessionSnapshotTest, PausedTargetIsFrozen) {
  EXPECT_DOUBLE_EQ(ComputeTargetTime(Make(false, 42.0, 1'000, 60'000)), 42.0);
}

TEST(SessionSnapshotTest, PlayingTargetAddsElapsedCoordinatorTime) {
  EXPECT_DOUBLE_EQ(ComputeTargetTime(Make(true, 10.0, 5'000, 5'200)), 10.2);
  EXPECT_DOUBLE_EQ(ComputeTargetTime(Make(true, 0.0, 0, 90'000)), 90.0);
}

TEST(SessionSnapshotTest, NegativeElapsedCountsAsZero) {
  // coordinator_time before last_event is malformed; never rewind.
  EXPECT_DOUBLE_EQ(ComputeTargetTime(Make(true, 10.0, 5'000, 4'000)), 10.0);
  EXPECT_DOUBLE_EQ(ComputeTargetTime(Make(false, -3.0, 0, 0)), 0.0);
}

// -----------------------------------------------------------------------------
// Duration clamp
// -----------------------------------------------------------------------------
TEST(SessionSnapshotTest, ClampToDuration) {
  EXPECT_DOUBLE_EQ(ClampToDuration(130.0, 120.0), 120.0);
  EXPECT_DOUBLE_EQ(ClampToDuration(-1.0, 120.0), 0.0);
  EXPECT_DOUBLE_EQ(ClampToDuration(60.0, 120.0), 60.0);
  // Unknown duration: only the lower bound applies.
  EXPECT_DOUBLE_EQ(ClampToDuration(5'000.0, 0.0), 5'000.0);
  EXPECT_DOUBLE_EQ(ClampToDuration(-2.0, 0.0), 0.0);
}

TEST(SessionSnapshotTest, DescribeSnapshotForLogs) {
  SessionSnapshot s = Make(true, 10.0, 5'000, 5'200);
  s.version = 12;
  s.media_id = "abc";
  EXPECT_EQ(DescribeSnapshot(s), "v12 media=abc playing=Y t=10.20");

  s.media_id.reset();
  s.is_playing = false;
  EXPECT_EQ(DescribeSnapshot(s), "v12 media=- playing=N t=10.00");
}

}  // namespace
}  // namespace lockstep::sync
