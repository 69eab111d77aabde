// Repository: Lockstep
// Component: Surface API Readiness
// Purpose: Process-wide one-shot signal that the media library finished loading.
// Copyright (c) 2026 Lockstep

#ifndef LOCKSTEP_SURFACE_SURFACE_API_READINESS_HPP_
#define LOCKSTEP_SURFACE_SURFACE_API_READINESS_HPP_

#include <chrono>
#include <future>
#include <mutex>

namespace lockstep::surface {

// The media library announces itself once per process. SurfaceApiReadiness
// models that as a shared_future resolved exactly once; every session
// construction reads the same future instead of a global flag.
class SurfaceApiReadiness {
 public:
  SurfaceApiReadiness();

  SurfaceApiReadiness(const SurfaceApiReadiness&) = delete;
  SurfaceApiReadiness& operator=(const SurfaceApiReadiness&) = delete;

  // Process-wide instance.
  static SurfaceApiReadiness& Instance();

  // Resolves the future. Returns false if already resolved (later calls
  // are no-ops).
  bool Resolve();

  // Non-blocking read of the future.
  [[nodiscard]] bool IsResolved() const;

  // Blocks up to timeout. Returns IsResolved().
  bool WaitFor(std::chrono::milliseconds timeout) const;

  [[nodiscard]] std::shared_future<void> Future() const { return future_; }

 private:
  // Serializes Resolve(); the promise may be satisfied only once.
  std::mutex resolve_mutex_;
  std::promise<void> promise_;
  std::shared_future<void> future_;
};

}  // namespace lockstep::surface

#endif  // LOCKSTEP_SURFACE_SURFACE_API_READINESS_HPP_
