// Repository: Lockstep
// Component: Scheduler Interface
// Purpose: Decouple the sync engine's bounded timers from the thread that runs them.
//          Production: EventLoop (single owner thread, real deadlines).
//          Tests: ManualScheduler (virtual time, fires on AdvanceMs).
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_RUNTIME_ISCHEDULER_HPP_
#define LOCKSTEP_RUNTIME_ISCHEDULER_HPP_

#include <cstdint>
#include <functional>

namespace lockstep::runtime {

using TimerId = uint64_t;
inline constexpr TimerId kInvalidTimerId = 0;

class IScheduler {
 public:
  using Task = std::function<void()>;

  virtual ~IScheduler() = default;

  // Monotonic milliseconds. Only differences are meaningful.
  virtual int64_t NowMs() const = 0;

  // Runs task as soon as possible on the scheduler's owning thread, after
  // tasks already posted. Safe from any thread. Returns false once the
  // scheduler is stopping and the task was dropped.
  virtual bool Post(Task task) = 0;

  // Runs task once, no earlier than delay_ms from now, on the scheduler's
  // owning thread. Timers are best-effort debounces, not precise schedules.
  virtual TimerId ScheduleAfter(int64_t delay_ms, Task task) = 0;

  // Safe from any thread.
  // Returns false if the timer already fired, was cancelled, or is unknown.
  virtual bool Cancel(TimerId id) = 0;
};

}  // namespace lockstep::runtime

#endif  // LOCKSTEP_RUNTIME_ISCHEDULER_HPP_
