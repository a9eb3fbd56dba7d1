/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file supervisor.hpp
 * @brief Supervisor for one long-running backend process with a TCP
 *        health-probe watchdog.
 *
 * State machine:
 *
 *   kStopped -> kStarting -> kRunning
 *                  ^            |  probe failed
 *                  |            v
 *                  |        kUnhealthy (x1, x2) -- probe ok --> kRunning
 *                  |            |  x3
 *                  |            v
 *                  +------- kRestarting
 *
 * Concurrency:
 *   - All supervisor state (child handle, failure counter, state) lives
 *     behind one mutex. Critical sections never include the health probe.
 *   - Notifications are collected under the lock and delivered after it
 *     is released, so a callback may call back into the supervisor.
 *   - The watchdog thread waits on a condition variable between probes;
 *     StopWatchdog() wakes it and joins.
 */

#ifndef RSB_SUPERVISOR_HPP_
#define RSB_SUPERVISOR_HPP_

#include "rsb/health_probe.hpp"
#include "rsb/log.hpp"
#include "rsb/platform.hpp"
#include "rsb/process.hpp"
#include "rsb/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace rsb {

// ============================================================================
// Types
// ============================================================================

enum class SupervisorState : uint8_t {
  kStopped = 0,
  kStarting,
  kRunning,
  kUnhealthy,
  kRestarting,
};

inline const char* SupervisorStateName(SupervisorState s) noexcept {
  switch (s) {
    case SupervisorState::kStarting:
      return "starting";
    case SupervisorState::kRunning:
      return "running";
    case SupervisorState::kUnhealthy:
      return "unhealthy";
    case SupervisorState::kRestarting:
      return "restarting";
    default:
      return "stopped";
  }
}

/// @brief Lifecycle notification emitted by the supervisor.
enum class SupervisorEvent : uint8_t {
  kSpawned = 0,
  kAlreadyRunning,
  kSpawnFailed,
  kHealthFailed,   ///< detail = consecutive failure count
  kRestarting,
};

/// @brief Wire name of an event ("backend:spawned", ...).
inline const char* SupervisorEventName(SupervisorEvent e) noexcept {
  switch (e) {
    case SupervisorEvent::kSpawned:
      return "backend:spawned";
    case SupervisorEvent::kAlreadyRunning:
      return "backend:already_running";
    case SupervisorEvent::kSpawnFailed:
      return "backend:spawn_failed";
    case SupervisorEvent::kHealthFailed:
      return "backend:health_failed";
    default:
      return "backend:watchdog_restart";
  }
}

enum class SpawnOutcome : uint8_t {
  kSpawned = 0,
  kAlreadyRunning,
};

struct SpawnFailure {
  SpawnStage stage = SpawnStage::kNone;
  int sys_errno = 0;
  std::string message;  ///< "<stage>: <strerror>"
};

struct SupervisorConfig {
  std::vector<std::string> argv;  ///< Program and arguments
  std::string working_dir;        ///< Empty = inherit
  std::vector<std::pair<std::string, std::string>> env;  ///< HOST, PORT, ...
  std::string probe_host = "127.0.0.1";
  uint16_t probe_port = 8000;
  uint32_t probe_interval_ms = 2000;
  uint32_t probe_timeout_ms = kDefaultProbeTimeoutMs;
  uint32_t failure_threshold = 3;
  bool capture_output = true;
};

/// @brief Notification sink. @p message is only set for kSpawnFailed.
using SupervisorEventFn = void (*)(SupervisorEvent event, uint32_t detail,
                                   const char* message, void* ctx);

/// @brief Liveness probe. Returns true when the backend is reachable.
using HealthProbeFn = bool (*)(const char* host, uint16_t port,
                               uint32_t timeout_ms, void* ctx);

// ============================================================================
// ProcessSupervisor
// ============================================================================

class ProcessSupervisor final {
 public:
  explicit ProcessSupervisor(SupervisorConfig cfg) : cfg_(std::move(cfg)) {}

  ~ProcessSupervisor() {
    StopWatchdog();
    Kill();
  }

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  /// @pre Must be called before StartWatchdog().
  void SetEventCallback(SupervisorEventFn fn, void* ctx = nullptr) noexcept {
    event_fn_ = fn;
    event_ctx_ = ctx;
  }

  /// @pre Must be called before StartWatchdog(). nullptr restores TCP probing.
  void SetHealthProbe(HealthProbeFn fn, void* ctx = nullptr) noexcept {
    probe_fn_ = fn;
    probe_ctx_ = ctx;
  }

  // --------------------------------------------------------------------------
  // Commands
  // --------------------------------------------------------------------------

  /**
   * @brief Start the backend unless a live one is already supervised.
   *
   * A stored handle whose process has exited is cleared first.
   */
  expected<SpawnOutcome, SpawnFailure> Spawn() {
    Pending pending;
    expected<SpawnOutcome, SpawnFailure> r =
        expected<SpawnOutcome, SpawnFailure>::success(SpawnOutcome::kSpawned);
    {
      std::lock_guard<std::mutex> lock(mtx_);
      r = SpawnLocked(pending);
    }
    Deliver(pending);
    return r;
  }

  /// @brief SIGKILL and reap the backend; always drops the handle.
  void Kill() {
    std::lock_guard<std::mutex> lock(mtx_);
    KillLocked();
  }

  /**
   * @brief Non-blocking liveness check of the stored handle.
   *
   * An inconclusive waitpid(2) is reported as running; the next health
   * probe settles it.
   */
  bool IsRunning() {
    std::lock_guard<std::mutex> lock(mtx_);
    return IsRunningLocked();
  }

  // --------------------------------------------------------------------------
  // Watchdog
  // --------------------------------------------------------------------------

  /**
   * @brief One watchdog iteration: drain output, probe, apply policy.
   * @return true when the probe succeeded.
   */
  bool WatchdogTick() {
    DrainOutput();

    const bool healthy = Probe();
    Pending pending;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (healthy) {
        failures_ = 0;
        if (child_.GetPid() > 0) state_ = SupervisorState::kRunning;
      } else {
        if (failures_ < UINT32_MAX) ++failures_;
        RSB_LOG_WARN("Supervisor", "health probe %s:%u failed (%u/%u)",
                     cfg_.probe_host.c_str(), cfg_.probe_port, failures_,
                     cfg_.failure_threshold);
        pending.Push(SupervisorEvent::kHealthFailed, failures_);
        if (failures_ >= cfg_.failure_threshold) {
          KillLocked();
          state_ = SupervisorState::kRestarting;
          pending.Push(SupervisorEvent::kRestarting, failures_);
          RSB_LOG_WARN("Supervisor", "restarting backend after %u failures",
                       failures_);
          (void)SpawnLocked(pending);
          failures_ = 0;
        } else if (child_.GetPid() > 0) {
          state_ = SupervisorState::kUnhealthy;
        }
      }
    }
    Deliver(pending);
    return healthy;
  }

  /// @brief Run WatchdogTick() every probe interval on a background thread.
  void StartWatchdog() {
    bool expected_val = false;
    if (!watchdog_running_.compare_exchange_strong(expected_val, true)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(stop_mtx_);
      stop_requested_ = false;
    }
    watchdog_thread_ = std::thread([this]() { WatchdogLoop(); });
  }

  /// @brief Wake and join the watchdog thread. Safe if never started.
  void StopWatchdog() {
    bool expected_val = true;
    if (!watchdog_running_.compare_exchange_strong(expected_val, false)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(stop_mtx_);
      stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (watchdog_thread_.joinable()) watchdog_thread_.join();
  }

  bool IsWatchdogRunning() const noexcept {
    return watchdog_running_.load(std::memory_order_acquire);
  }

  // --------------------------------------------------------------------------
  // Introspection
  // --------------------------------------------------------------------------

  uint32_t ConsecutiveFailures() {
    std::lock_guard<std::mutex> lock(mtx_);
    return failures_;
  }

  SupervisorState State() {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
  }

  pid_t Pid() {
    std::lock_guard<std::mutex> lock(mtx_);
    return child_.GetPid();
  }

  const SupervisorConfig& GetConfig() const noexcept { return cfg_; }

  /**
   * @brief Forward pending child stdout/stderr to the debug log.
   *
   * Keeps the pipes from filling up; the content is not interpreted.
   */
  void DrainOutput() {
    char buf[512];
    std::lock_guard<std::mutex> lock(mtx_);
    if (child_.GetPid() <= 0) return;
    for (int i = 0; i < 16; ++i) {
      int n = child_.ReadStdout(buf, sizeof(buf) - 1);
      if (n <= 0) break;
      buf[n] = '\0';
      RSB_LOG_DEBUG("Backend", "%s", TrimNewline(buf, n));
    }
    for (int i = 0; i < 16; ++i) {
      int n = child_.ReadStderr(buf, sizeof(buf) - 1);
      if (n <= 0) break;
      buf[n] = '\0';
      RSB_LOG_DEBUG("Backend", "%s", TrimNewline(buf, n));
    }
  }

 private:
  struct Pending {
    struct Item {
      SupervisorEvent event;
      uint32_t detail;
      std::string message;
    };
    std::vector<Item> items;

    void Push(SupervisorEvent e, uint32_t detail, std::string msg = {}) {
      items.push_back(Item{e, detail, std::move(msg)});
    }
  };

  expected<SpawnOutcome, SpawnFailure> SpawnLocked(Pending& pending) {
    if (IsRunningLocked()) {
      RSB_LOG_INFO("Supervisor", "backend already running pid=%d",
                   static_cast<int>(child_.GetPid()));
      pending.Push(SupervisorEvent::kAlreadyRunning, 0);
      return expected<SpawnOutcome, SpawnFailure>::success(
          SpawnOutcome::kAlreadyRunning);
    }

    SubprocessConfig sp;
    sp.argv = cfg_.argv;
    sp.working_dir = cfg_.working_dir;
    sp.env = cfg_.env;
    sp.capture_stdout = cfg_.capture_output;
    sp.capture_stderr = cfg_.capture_output;

    state_ = SupervisorState::kStarting;
    Subprocess proc;
    if (proc.Start(sp) != ProcessResult::kSuccess) {
      SpawnFailure f;
      f.stage = proc.FailedStage();
      f.sys_errno = proc.LastErrno();
      f.message = std::string(SpawnStageName(f.stage)) + ": " +
                  std::strerror(f.sys_errno);
      state_ = SupervisorState::kStopped;
      RSB_LOG_ERROR("Supervisor", "spawn %s failed: %s",
                    cfg_.argv.empty() ? "<empty>" : cfg_.argv[0].c_str(),
                    f.message.c_str());
      pending.Push(SupervisorEvent::kSpawnFailed, 0, f.message);
      return expected<SpawnOutcome, SpawnFailure>::error(std::move(f));
    }

    child_ = std::move(proc);
    RSB_LOG_INFO("Supervisor", "backend spawned pid=%d",
                 static_cast<int>(child_.GetPid()));
    pending.Push(SupervisorEvent::kSpawned, 0);
    return expected<SpawnOutcome, SpawnFailure>::success(
        SpawnOutcome::kSpawned);
  }

  void KillLocked() {
    if (child_.GetPid() <= 0) return;
    const pid_t pid = child_.GetPid();
    ProcessResult r = child_.Kill();
    if (r != ProcessResult::kSuccess) {
      RSB_LOG_WARN("Supervisor", "kill pid=%d returned %d",
                   static_cast<int>(pid), static_cast<int>(r));
    } else {
      RSB_LOG_INFO("Supervisor", "backend pid=%d killed",
                   static_cast<int>(pid));
    }
    child_ = Subprocess();
    state_ = SupervisorState::kStopped;
  }

  bool IsRunningLocked() {
    if (child_.GetPid() <= 0) return false;
    switch (child_.Poll()) {
      case ExitPoll::kRunning:
        return true;
      case ExitPoll::kExited: {
        WaitResult wr = child_.Wait();
        RSB_LOG_WARN("Supervisor", "backend exited (code=%d signal=%d)",
                     wr.exit_code, wr.term_signal);
        child_ = Subprocess();
        state_ = SupervisorState::kStopped;
        return false;
      }
      default:
        return true;
    }
  }

  bool Probe() {
    if (probe_fn_ != nullptr) {
      return probe_fn_(cfg_.probe_host.c_str(), cfg_.probe_port,
                       cfg_.probe_timeout_ms, probe_ctx_);
    }
    return IsPortOpen(cfg_.probe_host.c_str(), cfg_.probe_port,
                      cfg_.probe_timeout_ms);
  }

  void Deliver(const Pending& pending) {
    if (event_fn_ == nullptr) return;
    for (const auto& item : pending.items) {
      event_fn_(item.event, item.detail,
                item.message.empty() ? nullptr : item.message.c_str(),
                event_ctx_);
    }
  }

  void WatchdogLoop() {
    RSB_LOG_DEBUG("Supervisor", "watchdog started interval=%ums",
                  cfg_.probe_interval_ms);
    for (;;) {
      {
        std::unique_lock<std::mutex> lock(stop_mtx_);
        if (stop_cv_.wait_for(lock,
                              std::chrono::milliseconds(cfg_.probe_interval_ms),
                              [this]() { return stop_requested_; })) {
          break;
        }
      }
      WatchdogTick();
    }
    RSB_LOG_DEBUG("Supervisor", "watchdog stopped");
  }

  static const char* TrimNewline(char* buf, int n) {
    while (n > 0 && (buf[n - 1] == '\n' || buf[n - 1] == '\r')) {
      buf[--n] = '\0';
    }
    return buf;
  }

  // --------------------------------------------------------------------------
  // Data members
  // --------------------------------------------------------------------------

  SupervisorConfig cfg_;

  std::mutex mtx_;
  Subprocess child_;
  uint32_t failures_ = 0;
  SupervisorState state_ = SupervisorState::kStopped;

  SupervisorEventFn event_fn_ = nullptr;
  void* event_ctx_ = nullptr;
  HealthProbeFn probe_fn_ = nullptr;
  void* probe_ctx_ = nullptr;

  std::atomic<bool> watchdog_running_{false};
  std::thread watchdog_thread_;
  std::mutex stop_mtx_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;
};

}  // namespace rsb

#endif  // RSB_SUPERVISOR_HPP_
