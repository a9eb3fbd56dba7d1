// rs485_bridge: native side of the RS-485 desktop bridge.
//
// Starts the telemetry server and the supervised backend, optionally feeds
// simulated samples, and serves UI commands as JSON lines on stdin/stdout.
// Supervisor notifications are written to stdout as {"event": ...} lines.
//
// Usage: rs485_bridge [config.{ini,json,yaml}]

#include "rsb/bridge_config.hpp"
#include "rsb/commands.hpp"
#include "rsb/log.hpp"
#include "rsb/serial_device.hpp"
#include "rsb/serial_session.hpp"
#include "rsb/shutdown.hpp"
#include "rsb/simulator.hpp"
#include "rsb/supervisor.hpp"
#include "rsb/telemetry_server.hpp"
#include "rsb/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

static constexpr int kStdinPollMs = 200;

// ============================================================================
// Stdout line sink shared by command replies and supervisor events
// ============================================================================

class LineWriter {
 public:
  void Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
  }

 private:
  std::mutex mtx_;
};

static void OnSupervisorEvent(rsb::SupervisorEvent event, uint32_t detail,
                              const char* message, void* ctx) {
  nlohmann::json j = {{"event", rsb::SupervisorEventName(event)}};
  if (message != nullptr && *message != '\0') {
    j["payload"] = message;
  } else if (event == rsb::SupervisorEvent::kHealthFailed ||
             event == rsb::SupervisorEvent::kRestarting) {
    j["payload"] = detail;
  }
  static_cast<LineWriter*>(ctx)->Write(
      j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

// ============================================================================
// Simulator sink
// ============================================================================

struct SimulatorSink {
  rsb::TelemetryServer* server;
  bool record;
};

static void PublishSample(const rsb::TelemetryEvent& event, void* ctx) {
  auto* sink = static_cast<SimulatorSink*>(ctx);
  if (sink->record && event.device_id.has_value()) {
    auto ts = rsb::ParseRfc3339(event.ts);
    if (ts.has_value()) {
      auto r = sink->server->Store().Append(*event.device_id, *ts,
                                            event.metrics, event.quality,
                                            "simulator");
      if (!r.has_value()) {
        RSB_LOG_WARN("Simulator", "history append failed: %s",
                     r.get_error().message.c_str());
      }
    }
  }
  sink->server->Publish(event);
}

// ============================================================================
// Stdin command loop
// ============================================================================

class CommandLoop {
 public:
  CommandLoop(rsb::CommandRouter& router, LineWriter& out,
              rsb::ShutdownManager& shutdown)
      : router_(router), out_(out), shutdown_(shutdown) {}

  void Start() {
    thread_ = std::thread([this]() { Run(); });
  }

  void Stop() {
    stop_.store(true, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
  }

 private:
  void Run() {
    std::string pending;
    char buf[4096];
    while (!stop_.load(std::memory_order_acquire)) {
      struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
      const int pr = ::poll(&pfd, 1, kStdinPollMs);
      if (pr < 0) {
        if (errno == EINTR) continue;
        RSB_LOG_ERROR("Command", "poll(stdin) failed: errno=%d", errno);
        break;
      }
      if (pr == 0) continue;

      const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        RSB_LOG_ERROR("Command", "read(stdin) failed: errno=%d", errno);
        break;
      }
      if (n == 0) {
        RSB_LOG_INFO("Command", "stdin closed");
        break;
      }
      pending.append(buf, static_cast<size_t>(n));

      size_t nl;
      while ((nl = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, nl);
        pending.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        out_.Write(router_.HandleLine(line));
      }
    }
    shutdown_.Quit();
  }

  rsb::CommandRouter& router_;
  LineWriter& out_;
  rsb::ShutdownManager& shutdown_;
  std::thread thread_;
  std::atomic<bool> stop_{false};
};

// ============================================================================
// Shutdown callbacks (run LIFO)
// ============================================================================

static void StopServer(int /*signo*/, void* ctx) {
  static_cast<rsb::TelemetryServer*>(ctx)->Stop();
}

static void StopSupervisor(int /*signo*/, void* ctx) {
  auto* sup = static_cast<rsb::ProcessSupervisor*>(ctx);
  sup->StopWatchdog();
  sup->Kill();
}

static void StopSimulator(int /*signo*/, void* ctx) {
  static_cast<rsb::TelemetrySimulator*>(ctx)->Stop();
}

static void CloseSerial(int /*signo*/, void* ctx) {
  static_cast<rsb::SerialSession*>(ctx)->Close();
}

static void StopCommands(int /*signo*/, void* ctx) {
  static_cast<CommandLoop*>(ctx)->Stop();
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  rsb::log::Init();

  const char* config_path = (argc > 1) ? argv[1] : nullptr;
  auto loaded = rsb::LoadBridgeConfig(config_path);
  if (!loaded.has_value()) {
    RSB_LOG_FATAL("Bridge", "cannot load config %s (error %d)",
                  config_path != nullptr ? config_path : "",
                  static_cast<int>(loaded.get_error()));
    return 1;
  }
  const rsb::BridgeConfig cfg = loaded.value();
  rsb::log::SetLevel(
      rsb::log::LevelFromString(cfg.log.level.c_str(), rsb::log::Level::kInfo));

  rsb::ShutdownManager shutdown;
  if (!shutdown.IsValid()) {
    RSB_LOG_FATAL("Bridge", "shutdown manager unavailable");
    return 1;
  }

  // ---- Telemetry server ----
  rsb::TelemetryServer server(rsb::ToServerConfig(cfg));
  auto schema = server.Store().EnsureSchema();
  if (!schema.has_value()) {
    RSB_LOG_FATAL("Bridge", "database %s: %s", cfg.server.database.c_str(),
                  schema.get_error().message.c_str());
    return 1;
  }
  auto started = server.Start();
  if (!started.has_value()) {
    RSB_LOG_FATAL("Bridge", "telemetry server failed to start: %s",
                  rsb::net::NetErrorName(started.get_error()));
    return 1;
  }
  (void)shutdown.Register(&StopServer, &server);

  // ---- Backend supervisor ----
  LineWriter out;
  rsb::ProcessSupervisor supervisor(rsb::ToSupervisorConfig(cfg));
  supervisor.SetEventCallback(&OnSupervisorEvent, &out);
  if (cfg.backend.autostart) {
    auto spawned = supervisor.Spawn();
    if (!spawned.has_value()) {
      RSB_LOG_ERROR("Bridge", "backend spawn failed: %s",
                    spawned.get_error().message.c_str());
    }
    supervisor.StartWatchdog();
  }
  (void)shutdown.Register(&StopSupervisor, &supervisor);

  // ---- Simulator ----
  rsb::TelemetrySimulator simulator(rsb::ToSimulatorConfig(cfg));
  SimulatorSink sink{&server, cfg.simulator.record};
  if (cfg.simulator.enabled) {
    simulator.Start(&PublishSample, &sink);
    (void)shutdown.Register(&StopSimulator, &simulator);
  }

  // ---- Serial + commands ----
  rsb::SerialSession serial(
      std::make_unique<rsb::PosixSerialOpener>(),
      rsb::ToScanRoots(cfg));
  (void)shutdown.Register(&CloseSerial, &serial);

  rsb::CommandRouter router(serial, &supervisor, rsb::ToSessionLogPaths(cfg));
  CommandLoop commands(router, out, shutdown);
  commands.Start();
  (void)shutdown.Register(&StopCommands, &commands);

  auto sig = shutdown.InstallSignalHandlers();
  if (!sig.has_value()) {
    RSB_LOG_WARN("Bridge", "signal handlers not installed");
  }

  RSB_LOG_INFO("Bridge", "ready: server %s:%u backend %s:%u simulator=%s",
               cfg.server.host.c_str(), static_cast<unsigned>(server.Port()),
               cfg.backend.host.c_str(),
               static_cast<unsigned>(cfg.backend.port),
               cfg.simulator.enabled ? "on" : "off");

  shutdown.WaitForShutdown();

  RSB_LOG_INFO("Bridge", "shutdown complete (signal %d)", shutdown.Signal());
  rsb::log::Shutdown();
  return 0;
}
