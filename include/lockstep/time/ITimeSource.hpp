// Repository: Lockstep
// Component: Time Source Interface
// Purpose: Wall-clock milliseconds behind an interface so tests can drive time.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_TIME_ITIME_SOURCE_HPP_
#define LOCKSTEP_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace lockstep::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace lockstep::time

#endif  // LOCKSTEP_TIME_ITIME_SOURCE_HPP_
