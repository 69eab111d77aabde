// Repository: Lockstep
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; one line per call, never interleaved.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_UTIL_LOGGER_HPP_
#define LOCKSTEP_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace lockstep::util {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

const char* LogLevelName(LogLevel level);

// Logger writes whole lines under one static mutex, so output from the
// event loop, the gRPC threads and the CLI input thread never interleaves.
//
//   Debug → stdout, only while debug is enabled (per-snapshot tracing)
//   Info  → stdout
//   Warn  → stderr (degraded but recoverable)
//   Error → stderr (exhausted retries, give-up)
//
// Debug starts enabled when LOCKSTEP_DEBUG is set in the environment.
class Logger {
 public:
  using CaptureSink = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line) { Write(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Write(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Write(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Write(LogLevel::kError, line); }

  static void Write(LogLevel level, const std::string& line);

  // Lets callers skip building expensive Debug lines.
  [[nodiscard]] static bool DebugEnabled();
  static void SetDebugEnabled(bool enabled);

  // Test-only: receives every emitted line (Debug only while enabled)
  // before it reaches the stream. The sink must not log. nullptr clears.
  static void SetCaptureSink(CaptureSink sink);

 private:
  static std::mutex mutex_;
  static CaptureSink capture_sink_;
  static std::atomic<int> debug_state_;  // -1 unread, 0 off, 1 on
};

}  // namespace lockstep::util

#endif  // LOCKSTEP_UTIL_LOGGER_HPP_
