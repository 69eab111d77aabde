// Repository: Lockstep
// Component: Event Loop
// Purpose: Single-owner actor thread that serializes every touch of
//          ReconciliationState (tasks + deadline timers).
// Copyright (c) 2026 Lockstep

#include "lockstep/runtime/EventLoop.hpp"

#include <exception>
#include <future>
#include <memory>
#include <sstream>

#include "lockstep/util/Logger.hpp"

namespace lockstep::runtime {

using lockstep::util::Logger;

EventLoop::EventLoop(std::string name)
    : name_(std::move(name)), origin_(Clock::now()) {
  // Hold the lock so loop_thread_id_ is published before any IsLoopThread().
  std::lock_guard<std::mutex> lock(mutex_);
  thread_ = std::thread(&EventLoop::Run, this);
  loop_thread_id_ = thread_.get_id();
}

EventLoop::~EventLoop() {
  Stop();
}

bool EventLoop::Post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_.load(std::memory_order_acquire)) return false;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

int64_t EventLoop::NowMs() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - origin_).count();
}

TimerId EventLoop::ScheduleAfter(int64_t delay_ms, Task task) {
  const auto deadline =
      Clock::now() + std::chrono::milliseconds(delay_ms < 0 ? 0 : delay_ms);
  TimerId id = kInvalidTimerId;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_.load(std::memory_order_acquire)) return kInvalidTimerId;
    id = next_timer_id_++;
    timers_.emplace(deadline, id);
    timer_tasks_.emplace(id, std::move(task));
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::Cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = timer_tasks_.find(id);
  if (it == timer_tasks_.end()) return false;
  timer_tasks_.erase(it);
  // The (deadline, id) entry stays in timers_ and is skipped when it comes due.
  return true;
}

bool EventLoop::Drain(std::chrono::milliseconds timeout) {
  if (IsLoopThread()) return false;
  auto done = std::make_shared<std::promise<void>>();
  std::future<void> drained = done->get_future();
  if (!Post([done] { done->set_value(); })) return false;
  return drained.wait_for(timeout) == std::future_status::ready;
}

void EventLoop::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_.exchange(true, std::memory_order_acq_rel) && !thread_.joinable()) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable() && std::this_thread::get_id() != loop_thread_id_) {
    thread_.join();
  }
}

bool EventLoop::IsLoopThread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::this_thread::get_id() == loop_thread_id_;
}

void EventLoop::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_.load(std::memory_order_acquire)) {
    if (!queue_.empty()) {
      Task task = std::move(queue_.front());
      queue_.pop_front();
      lock.unlock();
      RunTask(task);
      lock.lock();
      continue;
    }

    if (timers_.empty()) {
      cv_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !queue_.empty() ||
               !timers_.empty();
      });
      continue;
    }

    auto earliest = timers_.begin();
    if (earliest->first > Clock::now()) {
      cv_.wait_until(lock, earliest->first);
      continue;
    }

    const TimerId id = earliest->second;
    timers_.erase(earliest);
    auto it = timer_tasks_.find(id);
    if (it == timer_tasks_.end()) continue;  // cancelled
    Task task = std::move(it->second);
    timer_tasks_.erase(it);
    lock.unlock();
    RunTask(task);
    lock.lock();
  }

  queue_.clear();
  timers_.clear();
  timer_tasks_.clear();
}

void EventLoop::RunTask(Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[" << name_ << "] TASK_FAILED what=" << e.what();
    Logger::Error(oss.str());
  }
}

}  // namespace lockstep::runtime
