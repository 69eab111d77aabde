// Repository: Lockstep
// Component: Headless watch-party client
// Purpose: Joins a coordinator with a simulated playback surface and drives
//          the session from stdin commands.
// Copyright (c) 2026 Lockstep
//
// Intended for soak runs and coordinator diagnostics: every viewer-facing
// event is written to the log instead of a UI.

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "lockstep/runtime/EventLoop.hpp"
#include "lockstep/session/ClientConfig.hpp"
#include "lockstep/session/ISessionView.hpp"
#include "lockstep/session/SyncSession.hpp"
#include "lockstep/surface/SimulatedPlaybackSurface.hpp"
#include "lockstep/surface/SurfaceApiReadiness.hpp"
#include "lockstep/time/SystemTimeSource.hpp"
#include "lockstep/transport/GrpcTransportChannel.hpp"
#include "lockstep/util/Logger.hpp"

namespace {

using lockstep::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  lockstep::session::ClientConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Headless watch-party client. Joins a session coordinator and keeps a\n"
            << "simulated player in lock-step with the shared session.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --coordinator HOST:PORT  Coordinator address (default: $"
            << lockstep::session::kCoordinatorEnvVar << ", else "
            << lockstep::session::kDefaultCoordinator << ")\n"
            << "  --client-id ID           Identifier sent with every intent\n"
            << "  --container NAME         Player container name (default: player)\n"
            << "  --duration SECONDS       Simulated media duration (default: unknown)\n"
            << "  --help                   Show this help message\n"
            << "\n"
            << "COMMANDS (stdin):\n"
            << "  play | pause             Play or pause for everyone\n"
            << "  fwd | back               Skip 10 seconds forward or back\n"
            << "  seek SECONDS             Skip by SECONDS (negative skips back)\n"
            << "  load URL                 Change the shared media\n"
            << "  sync                     Sync to the session now\n"
            << "  status                   Print session status\n"
            << "  quit                     Leave the session\n"
            << "\n"
            << "Set LOCKSTEP_DEBUG=1 for per-snapshot tracing.\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  args.config.coordinator = lockstep::session::CoordinatorFromEnvironment();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--coordinator" && i + 1 < argc) {
      args.config.coordinator = argv[++i];
    } else if (arg == "--client-id" && i + 1 < argc) {
      args.config.client_id = argv[++i];
    } else if (arg == "--container" && i + 1 < argc) {
      args.config.container = argv[++i];
    } else if (arg == "--duration" && i + 1 < argc) {
      try {
        args.config.surface_duration_s = std::stod(argv[++i]);
      } catch (const std::exception&) {
        args.error = "--duration expects a number of seconds";
        return args;
      }
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.config.coordinator.empty()) {
    args.error = "--coordinator must not be empty";
    return args;
  }
  if (args.config.container.empty()) {
    args.error = "--container must not be empty";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Log-backed session view
// =============================================================================
class LoggingSessionView : public lockstep::session::ISessionView {
 public:
  void OnConnectionStatus(lockstep::session::ConnectionStatus status) override {
    Logger::Info(std::string("[Client] CONNECTION ") +
                 lockstep::session::ConnectionStatusName(status));
  }
  void OnViewerCount(int count) override {
    Logger::Info("[Client] VIEWERS " + std::to_string(count));
  }
  void OnPendingSync(bool visible) override {
    if (visible) Logger::Info("[Client] Session is playing. Type 'sync' to join in.");
  }
  void OnControlsReady(bool ready) override {
    Logger::Info(std::string("[Client] CONTROLS ") + (ready ? "READY" : "DISABLED"));
  }
  void OnMediaChanged(const std::string& media_id) override {
    Logger::Info("[Client] MEDIA " + media_id);
  }
  void OnNotice(lockstep::session::NoticeLevel level, const std::string& message) override {
    std::ostringstream oss;
    oss << "[Client] " << lockstep::session::NoticeLevelName(level) << ": " << message;
    Logger::Info(oss.str());
  }
};

// =============================================================================
// Command loop
// =============================================================================

// True when a full line is available on stdin within timeout_ms.
bool WaitForInput(int timeout_ms) {
  if (std::cin.rdbuf()->in_avail() > 0) return true;
  pollfd fd{STDIN_FILENO, POLLIN, 0};
  return ::poll(&fd, 1, timeout_ms) > 0;
}

// Returns false when the command asks to quit.
bool RunCommand(const std::string& line, lockstep::session::SyncSession& session) {
  std::istringstream in(line);
  std::string command;
  in >> command;

  if (command.empty()) return true;
  if (command == "quit" || command == "exit") return false;

  if (command == "play") {
    session.Play();
  } else if (command == "pause") {
    session.Pause();
  } else if (command == "fwd") {
    session.SkipForward();
  } else if (command == "back") {
    session.SkipBack();
  } else if (command == "seek") {
    double delta = 0.0;
    if (!(in >> delta)) {
      std::cerr << "seek expects a number of seconds\n";
      return true;
    }
    session.SeekBy(delta);
  } else if (command == "load") {
    std::string url;
    in >> url;
    session.ChangeMedia(url);
  } else if (command == "sync") {
    session.SyncToSession();
  } else if (command == "status") {
    session.LogStatus();
  } else {
    std::cerr << "Unknown command: " << command << "\n";
  }
  return true;
}

int Run(const lockstep::session::ClientConfig& config) {
  lockstep::time::SystemTimeSource clock;
  lockstep::runtime::EventLoop loop("SessionLoop");

  lockstep::transport::GrpcTransportConfig transport_config;
  transport_config.target_address = config.coordinator;
  transport_config.client_id = config.client_id;
  transport_config.connect_timeout_ms = config.connect_timeout_ms;
  transport_config.reconnect_delay_ms = config.reconnect_delay_ms;
  transport_config.reconnect_delay_max_ms = config.reconnect_delay_max_ms;
  transport_config.randomization_factor = config.reconnect_randomization;
  transport_config.max_reconnect_attempts = config.max_reconnect_attempts;
  lockstep::transport::GrpcTransportChannel transport(transport_config);

  lockstep::surface::SimulatedSurfaceFactory factory(
      loop, clock, config.surface_load_delay_ms, config.surface_duration_s);
  lockstep::surface::NamedSurfaceHost host(config.container);

  // The simulated media library is loaded as soon as the process starts.
  lockstep::surface::SurfaceApiReadiness& readiness =
      lockstep::surface::SurfaceApiReadiness::Instance();
  readiness.Resolve();

  LoggingSessionView view;
  lockstep::session::SyncSession session(loop, transport, factory, host, readiness,
                                         config.sync, &view);

  Logger::Info("[Client] JOIN coordinator=" + config.coordinator +
               " container=" + config.container);
  session.Start();

  // With stdin closed the client keeps following the session until a signal.
  std::string line;
  bool stdin_open = true;
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    if (!stdin_open) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      continue;
    }
    if (!WaitForInput(200)) continue;
    if (!std::getline(std::cin, line)) {
      stdin_open = false;
      continue;
    }
    if (!RunCommand(line, session)) break;
  }

  Logger::Info("[Client] LEAVE");
  session.Stop();
  // Stop() posts the surface teardown; let it run before the loop goes.
  if (!loop.Drain(std::chrono::seconds(2))) {
    Logger::Warn("[Client] SHUTDOWN_DRAIN_TIMEOUT");
  }
  loop.Stop();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  return Run(args.config);
}
