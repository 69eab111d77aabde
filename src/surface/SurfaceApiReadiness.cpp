// Repository: Lockstep
// Component: Surface API Readiness
// Purpose: Process-wide one-shot signal that the media library finished loading.
// Copyright (c) 2026 Lockstep

#include "lockstep/surface/SurfaceApiReadiness.hpp"

#include "lockstep/util/Logger.hpp"

namespace lockstep::surface {

using lockstep::util::Logger;

SurfaceApiReadiness::SurfaceApiReadiness()
    : future_(promise_.get_future().share()) {}

SurfaceApiReadiness& SurfaceApiReadiness::Instance() {
  static SurfaceApiReadiness instance;
  return instance;
}

bool SurfaceApiReadiness::Resolve() {
  std::lock_guard<std::mutex> lock(resolve_mutex_);
  if (IsResolved()) return false;
  promise_.set_value();
  Logger::Info("[SurfaceApiReadiness] SURFACE_API_READY");
  return true;
}

bool SurfaceApiReadiness::IsResolved() const {
  return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool SurfaceApiReadiness::WaitFor(std::chrono::milliseconds timeout) const {
  return future_.wait_for(timeout) == std::future_status::ready;
}

}  // namespace lockstep::surface
