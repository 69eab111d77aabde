// Repository: Lockstep
// Component: Playback Surface Interface
// Purpose: Names for the media library's player-state codes.
// Copyright (c) 2026 Lockstep

#include "lockstep/surface/IPlaybackSurface.hpp"

namespace lockstep::surface {

const char* SurfaceStateName(SurfaceState state) {
  switch (state) {
    case SurfaceState::kUnstarted: return "UNSTARTED";
    case SurfaceState::kEnded: return "ENDED";
    case SurfaceState::kPlaying: return "PLAYING";
    case SurfaceState::kPaused: return "PAUSED";
    case SurfaceState::kBuffering: return "BUFFERING";
    case SurfaceState::kCued: return "CUED";
  }
  return "UNKNOWN";
}

}  // namespace lockstep::surface
