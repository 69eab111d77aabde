// Repository: Lockstep
// Component: Session Snapshot
// Purpose: Coordinator-authoritative playback state and target-time math.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SYNC_SESSION_SNAPSHOT_HPP_
#define LOCKSTEP_SYNC_SESSION_SNAPSHOT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace lockstep::sync {

// Versioned description of shared playback state, broadcast by the
// coordinator. Both timestamps are on the coordinator's clock, so the
// client never consults its own wall clock when extrapolating.
//
// media_id absent or empty means "no media change", never "clear media".
struct SessionSnapshot {
  int64_t version = 0;
  std::optional<std::string> media_id;
  bool is_playing = false;
  double playback_time_at_last_event = 0.0;  // seconds
  int64_t last_event_at_ms = 0;              // coordinator clock
  int64_t coordinator_time_ms = 0;           // coordinator clock, >= last_event_at_ms
};

// Authoritative position the surface should be at.
//   paused  → playback_time_at_last_event (frozen)
//   playing → playback_time_at_last_event + (coordinator_time - last_event_at) / 1000
// Negative elapsed time (malformed snapshot) counts as zero; result is >= 0.
double ComputeTargetTime(const SessionSnapshot& snapshot);

// Clamps a target into [0, duration_s]. A non-positive duration means the
// surface does not know its duration yet; only the lower bound applies.
double ClampToDuration(double target_s, double duration_s);

// "v12 media=abc playing=Y t=10.20", for log lines.
std::string DescribeSnapshot(const SessionSnapshot& snapshot);

}  // namespace lockstep::sync

#endif  // LOCKSTEP_SYNC_SESSION_SNAPSHOT_HPP_
