// Repository: Lockstep
// Component: System Time Source
// Purpose: Production ITimeSource backed by the system clock.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_TIME_SYSTEM_TIME_SOURCE_HPP_
#define LOCKSTEP_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "lockstep/time/ITimeSource.hpp"

namespace lockstep::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace lockstep::time

#endif  // LOCKSTEP_TIME_SYSTEM_TIME_SOURCE_HPP_
