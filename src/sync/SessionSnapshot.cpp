// Repository: Lockstep
// Component: Session Snapshot
// Purpose: Coordinator-authoritative playback state and target-time math.
// Copyright (c) 2026 Lockstep

#include "lockstep/sync/SessionSnapshot.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace lockstep::sync {

double ComputeTargetTime(const SessionSnapshot& snapshot) {
  const double base = std::max(0.0, snapshot.playback_time_at_last_event);
  if (!snapshot.is_playing) {
    return base;
  }
  const int64_t elapsed_ms =
      std::max<int64_t>(0, snapshot.coordinator_time_ms - snapshot.last_event_at_ms);
  return base + static_cast<double>(elapsed_ms) / 1000.0;
}

double ClampToDuration(double target_s, double duration_s) {
  if (target_s < 0.0) return 0.0;
  if (duration_s > 0.0 && target_s > duration_s) return duration_s;
  return target_s;
}

std::string DescribeSnapshot(const SessionSnapshot& snapshot) {
  std::ostringstream oss;
  oss << "v" << snapshot.version
      << " media=" << (snapshot.media_id ? *snapshot.media_id : "-")
      << " playing=" << (snapshot.is_playing ? "Y" : "N")
      << " t=" << std::fixed << std::setprecision(2)
      << ComputeTargetTime(snapshot);
  return oss.str();
}

}  // namespace lockstep::sync
