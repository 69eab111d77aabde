// Repository: Lockstep
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; one line per call, never interleaved.
// Copyright (c) 2026 Lockstep

#include "lockstep/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace lockstep::util {

std::mutex Logger::mutex_;
Logger::CaptureSink Logger::capture_sink_;
std::atomic<int> Logger::debug_state_{-1};

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "UNKNOWN";
}

bool Logger::DebugEnabled() {
  int state = debug_state_.load(std::memory_order_relaxed);
  if (state < 0) {
    const char* env = std::getenv("LOCKSTEP_DEBUG");
    state = (env != nullptr && env[0] != '\0' && env[0] != '0') ? 1 : 0;
    int expected = -1;
    // A concurrent SetDebugEnabled() wins over the environment.
    if (!debug_state_.compare_exchange_strong(expected, state, std::memory_order_relaxed)) {
      state = expected;
    }
  }
  return state == 1;
}

void Logger::SetDebugEnabled(bool enabled) {
  debug_state_.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

void Logger::SetCaptureSink(CaptureSink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  capture_sink_ = std::move(sink);
}

void Logger::Write(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugEnabled()) return;

  std::ostream& out = (level == LogLevel::kWarn || level == LogLevel::kError) ? std::cerr
                                                                              : std::cout;
  std::lock_guard<std::mutex> lock(mutex_);
  if (capture_sink_) {
    capture_sink_(level, line);
  }
  out << line << '\n';
  out.flush();
}

}  // namespace lockstep::util
