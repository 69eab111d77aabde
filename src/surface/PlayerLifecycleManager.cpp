// Repository: Lockstep
// Component: Player Lifecycle Manager
// Purpose: One playback surface per media identity. Constructs it, waits for
//          readiness, retries while the container is missing.
// Copyright (c) 2026 Lockstep

#include "lockstep/surface/PlayerLifecycleManager.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "lockstep/util/Logger.hpp"

namespace lockstep::surface {

using lockstep::util::Logger;

const char* PhaseName(PlayerLifecycleManager::Phase phase) {
  switch (phase) {
    case PlayerLifecycleManager::Phase::kUninitialized: return "UNINITIALIZED";
    case PlayerLifecycleManager::Phase::kConstructing: return "CONSTRUCTING";
    case PlayerLifecycleManager::Phase::kReady: return "READY";
    case PlayerLifecycleManager::Phase::kDestroyed: return "DESTROYED";
    case PlayerLifecycleManager::Phase::kFailed: return "FAILED";
  }
  return "UNKNOWN";
}

PlayerLifecycleManager::PlayerLifecycleManager(
    runtime::IScheduler& scheduler,
    IPlaybackSurfaceFactory& factory,
    ISurfaceHost& host,
    const SurfaceApiReadiness& api_readiness,
    sync::SyncConfig config)
    : scheduler_(scheduler),
      factory_(factory),
      host_(host),
      api_readiness_(api_readiness),
      config_(config),
      dispatcher_([](std::function<void()> fn) { fn(); }),
      self_token_(std::make_shared<PlayerLifecycleManager*>(this)) {}

PlayerLifecycleManager::~PlayerLifecycleManager() {
  Shutdown();
}

void PlayerLifecycleManager::SetDispatcher(Dispatcher dispatcher) {
  dispatcher_ = std::move(dispatcher);
}

void PlayerLifecycleManager::SetReadyHandler(ReadyHandler handler) {
  ready_handler_ = std::move(handler);
}

void PlayerLifecycleManager::SetConstructionFailedHandler(
    ConstructionFailedHandler handler) {
  construction_failed_handler_ = std::move(handler);
}

void PlayerLifecycleManager::SetStateChangeHandler(StateChangeHandler handler) {
  state_change_handler_ = std::move(handler);
}

void PlayerLifecycleManager::SetSurfaceErrorHandler(SurfaceErrorHandler handler) {
  surface_error_handler_ = std::move(handler);
}

std::optional<std::string> PlayerLifecycleManager::ActiveMediaId() const {
  if (!active_) return std::nullopt;
  return active_->media_id;
}

IPlaybackSurface* PlayerLifecycleManager::ReadySurface() const {
  if (phase_ != Phase::kReady || !active_ || !active_->ready) return nullptr;
  return active_->surface.get();
}

void PlayerLifecycleManager::BeginTransition(const std::string& media_id) {
  CancelRetry();

  {
    std::ostringstream oss;
    oss << "[PlayerLifecycleManager] TRANSITION"
        << " from=" << (active_ ? active_->media_id : "-")
        << " to=" << media_id
        << " phase=" << PhaseName(phase_);
    Logger::Info(oss.str());
  }

  if (active_) {
    TeardownActive();
    phase_ = Phase::kDestroyed;
  }

  ++generation_;
  attempts_ = 0;
  early_ready_ = false;
  active_.emplace();
  active_->media_id = media_id;
  phase_ = Phase::kConstructing;

  TryConstruct();
}

bool PlayerLifecycleManager::RetryFailed() {
  if (phase_ != Phase::kFailed || !active_) return false;
  Logger::Info("[PlayerLifecycleManager] RETRY_FAILED media=" + active_->media_id);
  ++generation_;
  attempts_ = 0;
  early_ready_ = false;
  phase_ = Phase::kConstructing;
  TryConstruct();
  return true;
}

void PlayerLifecycleManager::Shutdown() {
  CancelRetry();
  if (active_) {
    TeardownActive();
    phase_ = Phase::kDestroyed;
  }
  ++generation_;
}

void PlayerLifecycleManager::TryConstruct() {
  ++attempts_;
  const std::string media_id = active_->media_id;

  if (!api_readiness_.IsResolved()) {
    ScheduleRetry("surface_api_not_ready");
    return;
  }
  if (!host_.HasContainer()) {
    ScheduleRetry("container_missing");
    return;
  }

  std::unique_ptr<IPlaybackSurface> surface;
  try {
    surface = factory_.Construct(host_.ContainerId(), media_id, surface_config_,
                                 MakeCallbacks(generation_));
  } catch (const std::exception& e) {
    ScheduleRetry(std::string("constructor_threw: ") + e.what());
    return;
  }
  if (!surface) {
    ScheduleRetry("factory_returned_null");
    return;
  }

  active_->surface = std::move(surface);
  {
    std::ostringstream oss;
    oss << "[PlayerLifecycleManager] CONSTRUCTED media=" << media_id
        << " attempt=" << attempts_
        << " container=" << host_.ContainerId();
    Logger::Info(oss.str());
  }

  // A surface that signalled readiness from inside Construct().
  if (early_ready_) {
    early_ready_ = false;
    OnSurfaceReady(generation_);
  }
}

void PlayerLifecycleManager::ScheduleRetry(const std::string& reason) {
  const std::string media_id = active_ ? active_->media_id : "-";

  if (attempts_ >= config_.construct_max_attempts) {
    phase_ = Phase::kFailed;
    std::ostringstream oss;
    oss << "[PlayerLifecycleManager] CONSTRUCT_EXHAUSTED media=" << media_id
        << " attempts=" << attempts_
        << " reason=" << reason;
    Logger::Error(oss.str());
    if (construction_failed_handler_) {
      construction_failed_handler_(media_id, reason);
    }
    return;
  }

  {
    std::ostringstream oss;
    oss << "[PlayerLifecycleManager] CONSTRUCT_RETRY media=" << media_id
        << " attempt=" << attempts_
        << " reason=" << reason
        << " backoff_ms=" << config_.construct_retry_backoff_ms;
    Logger::Warn(oss.str());
  }

  const uint64_t generation = generation_;
  std::weak_ptr<PlayerLifecycleManager*> token = self_token_;
  retry_timer_ = scheduler_.ScheduleAfter(
      config_.construct_retry_backoff_ms, [token, generation] {
        auto self = token.lock();
        if (!self) return;
        PlayerLifecycleManager* manager = *self;
        manager->retry_timer_ = runtime::kInvalidTimerId;
        if (generation != manager->generation_ ||
            manager->phase_ != Phase::kConstructing) {
          return;
        }
        manager->TryConstruct();
      });
}

void PlayerLifecycleManager::CancelRetry() {
  if (retry_timer_ == runtime::kInvalidTimerId) return;
  scheduler_.Cancel(retry_timer_);
  retry_timer_ = runtime::kInvalidTimerId;
  Logger::Debug("[PlayerLifecycleManager] RETRY_CANCELLED");
}

void PlayerLifecycleManager::TeardownActive() {
  if (active_ && active_->surface) {
    try {
      active_->surface->Destroy();
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[PlayerLifecycleManager] DESTROY_FAILED media=" << active_->media_id
          << " what=" << e.what();
      Logger::Warn(oss.str());
    }
  }
  active_.reset();
}

SurfaceCallbacks PlayerLifecycleManager::MakeCallbacks(uint64_t generation) {
  std::weak_ptr<PlayerLifecycleManager*> token = self_token_;
  Dispatcher dispatch = dispatcher_;

  SurfaceCallbacks callbacks;
  callbacks.on_ready = [token, dispatch, generation] {
    dispatch([token, generation] {
      if (auto self = token.lock()) (*self)->OnSurfaceReady(generation);
    });
  };
  callbacks.on_state_change = [token, dispatch, generation](SurfaceState state) {
    dispatch([token, generation, state] {
      auto self = token.lock();
      if (!self) return;
      PlayerLifecycleManager* manager = *self;
      if (generation != manager->generation_) return;
      if (manager->state_change_handler_) manager->state_change_handler_(state);
    });
  };
  callbacks.on_error = [token, dispatch, generation](int error_code) {
    dispatch([token, generation, error_code] {
      auto self = token.lock();
      if (!self) return;
      PlayerLifecycleManager* manager = *self;
      if (generation != manager->generation_) return;
      std::ostringstream oss;
      oss << "[PlayerLifecycleManager] SURFACE_ERROR media="
          << (manager->active_ ? manager->active_->media_id : "-")
          << " code=" << error_code;
      Logger::Error(oss.str());
      if (manager->surface_error_handler_) manager->surface_error_handler_(error_code);
    });
  };
  return callbacks;
}

void PlayerLifecycleManager::OnSurfaceReady(uint64_t generation) {
  if (generation != generation_ || !active_) {
    Logger::Debug("[PlayerLifecycleManager] STALE_READY dropped");
    return;
  }
  if (phase_ != Phase::kConstructing) return;
  if (!active_->surface) {
    early_ready_ = true;
    return;
  }

  active_->ready = true;
  phase_ = Phase::kReady;
  Logger::Info("[PlayerLifecycleManager] READY media=" + active_->media_id);
  if (ready_handler_) ready_handler_();
}

}  // namespace lockstep::surface
