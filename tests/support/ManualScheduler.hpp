#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <utility>

#include "lockstep/runtime/IScheduler.hpp"

// Virtual-time IScheduler for deterministic tests.
//
// Nothing runs until the test asks: RunPending() drains posted tasks,
// AdvanceMs() moves virtual time forward and fires every timer that comes
// due (in deadline order), draining posted tasks after each one. Timers
// scheduled while advancing fire in the same call if they fall inside the
// window.
class ManualScheduler : public lockstep::runtime::IScheduler {
public:
  int64_t NowMs() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_ms_;
  }

  bool Post(Task task) override {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(std::move(task));
    return true;
  }

  lockstep::runtime::TimerId ScheduleAfter(int64_t delay_ms, Task task) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const lockstep::runtime::TimerId id = next_id_++;
    timers_.emplace(std::make_pair(now_ms_ + (delay_ms < 0 ? 0 : delay_ms), id),
                    std::move(task));
    return id;
  }

  bool Cancel(lockstep::runtime::TimerId id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->first.second == id) {
        timers_.erase(it);
        ++cancelled_;
        return true;
      }
    }
    return false;
  }

  // Runs posted tasks (including ones they post) until none remain.
  void RunPending() {
    for (;;) {
      Task task;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (posted_.empty()) return;
        task = std::move(posted_.front());
        posted_.pop_front();
      }
      task();
    }
  }

  void AdvanceMs(int64_t delta_ms) {
    RunPending();
    int64_t target;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      target = now_ms_ + delta_ms;
    }
    for (;;) {
      Task task;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (timers_.empty() || timers_.begin()->first.first > target) {
          now_ms_ = target;
          break;
        }
        auto it = timers_.begin();
        now_ms_ = it->first.first;
        task = std::move(it->second);
        timers_.erase(it);
      }
      task();
      RunPending();
    }
    RunPending();
  }

  [[nodiscard]] size_t PendingTimerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
  }

  [[nodiscard]] size_t CancelledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

private:
  mutable std::mutex mutex_;
  int64_t now_ms_ = 0;
  lockstep::runtime::TimerId next_id_ = 1;
  std::deque<Task> posted_;
  // (deadline, id) keeps same-deadline timers in scheduling order.
  std::map<std::pair<int64_t, lockstep::runtime::TimerId>, Task> timers_;
  size_t cancelled_ = 0;
};
