// Repository: Lockstep
// Component: Event Loop
// Purpose: Single-owner actor thread that serializes every touch of
//          ReconciliationState (tasks + deadline timers).
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_RUNTIME_EVENT_LOOP_HPP_
#define LOCKSTEP_RUNTIME_EVENT_LOOP_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "lockstep/runtime/IScheduler.hpp"

namespace lockstep::runtime {

// EventLoop owns one worker thread. Post() and ScheduleAfter() are safe
// from any thread; the tasks themselves always run on the worker, one at a
// time, in submission order (timers in deadline order).
//
// Lifecycle:
//   1. Construct (thread starts immediately)
//   2. Post / ScheduleAfter from any thread
//   3. Optional Drain() to let already-posted work finish
//   4. Stop() or destructor: pending tasks and timers are discarded,
//      the worker is joined
//
// A task that throws std::exception is logged and dropped; the loop keeps
// running.
class EventLoop : public IScheduler {
 public:
  explicit EventLoop(std::string name = "EventLoop");
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  bool Post(Task task) override;

  int64_t NowMs() const override;
  TimerId ScheduleAfter(int64_t delay_ms, Task task) override;
  bool Cancel(TimerId id) override;

  // Blocks until every task posted before this call has run. Returns false
  // on timeout, when the loop is stopped, or when called from the loop
  // thread.
  bool Drain(std::chrono::milliseconds timeout);

  // Idempotent. Must not be called from a task running on this loop.
  void Stop();

  [[nodiscard]] bool IsLoopThread() const;
  [[nodiscard]] bool IsRunning() const { return !stop_.load(std::memory_order_acquire); }

 private:
  using Clock = std::chrono::steady_clock;

  void Run();
  void RunTask(Task& task);

  std::string name_;
  const Clock::time_point origin_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> queue_;
  // Deadline-ordered index; task bodies are held in timer_tasks_ so Cancel()
  // is a single erase.
  std::set<std::pair<Clock::time_point, TimerId>> timers_;
  std::unordered_map<TimerId, Task> timer_tasks_;
  TimerId next_timer_id_ = 1;

  std::atomic<bool> stop_{false};
  std::thread::id loop_thread_id_;
  std::thread thread_;
};

}  // namespace lockstep::runtime

#endif  // LOCKSTEP_RUNTIME_EVENT_LOOP_HPP_
