/**
 * @file simulator.hpp
 * @brief Synthetic telemetry source for running without hardware.
 */

#ifndef RSB_SIMULATOR_HPP_
#define RSB_SIMULATOR_HPP_

#include "rsb/log.hpp"
#include "rsb/telemetry.hpp"
#include "rsb/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace rsb {

struct SimulatorConfig {
  std::string device_id = "board-01";
  uint32_t interval_ms = 300U;
};

/// Receives every generated event on the simulator thread.
using SimulatorPublishFn = void (*)(const TelemetryEvent& event, void* ctx);

/**
 * @brief Emits smooth sine-wave metrics with small uniform noise.
 *
 * The phase advances by kPhaseStep per sample. Metrics are rounded like a
 * real board reports them (3 decimals, rpm 1 decimal).
 */
class TelemetrySimulator final {
 public:
  static constexpr double kPhaseStep = 0.08;

  explicit TelemetrySimulator(const SimulatorConfig& cfg)
      : cfg_(cfg), rng_(std::random_device{}()) {}

  ~TelemetrySimulator() { Stop(); }

  TelemetrySimulator(const TelemetrySimulator&) = delete;
  TelemetrySimulator& operator=(const TelemetrySimulator&) = delete;

  /// @brief Produce the next sample (advances the phase).
  TelemetryEvent NextSample() {
    t_ += kPhaseStep;
    const double voltage = 12.0 + 0.6 * std::sin(t_) + Noise(0.08);
    const double current = 1.5 + 0.4 * std::sin(t_ * 0.7) + Noise(0.05);
    const double temp_c = 35.0 + 2.0 * std::sin(t_ * 0.3) + Noise(0.2);
    const double rpm = 1400.0 + 120.0 * std::sin(t_ * 0.9) + Noise(10.0);

    TelemetryEvent ev;
    ev.ts = FormatRfc3339(NowUtcMicros());
    ev.device_id = cfg_.device_id;
    ev.metrics = {{"voltage", Round(voltage, 3)},
                  {"current", Round(current, 3)},
                  {"temp_c", Round(temp_c, 3)},
                  {"rpm", Round(rpm, 1)}};
    ev.quality = nlohmann::json{
        {"crc_ok", true}, {"frame_seq", static_cast<int64_t>(t_ * 1000.0)}};
    return ev;
  }

  /**
   * @brief Start emitting every interval_ms on a background thread.
   * @return false if already running or @p fn is null.
   */
  bool Start(SimulatorPublishFn fn, void* ctx) {
    if (fn == nullptr || running_.load(std::memory_order_acquire)) {
      return false;
    }
    publish_ = fn;
    publish_ctx_ = ctx;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = false;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this]() { Run(); });
    RSB_LOG_INFO("Simulator", "started device_id=%s interval_ms=%u",
                 cfg_.device_id.c_str(), cfg_.interval_ms);
    return true;
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
      RSB_LOG_INFO("Simulator", "stopped device_id=%s", cfg_.device_id.c_str());
    }
    running_.store(false, std::memory_order_release);
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  const SimulatorConfig& GetConfig() const noexcept { return cfg_; }

 private:
  void Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
      lock.unlock();
      publish_(NextSample(), publish_ctx_);
      lock.lock();
      cv_.wait_for(lock, std::chrono::milliseconds(cfg_.interval_ms),
                   [this] { return stop_requested_; });
    }
  }

  double Noise(double amplitude) {
    std::uniform_real_distribution<double> dist(-amplitude, amplitude);
    return dist(rng_);
  }

  static double Round(double v, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(v * scale) / scale;
  }

  SimulatorConfig cfg_;
  std::mt19937 rng_;
  double t_ = 0.0;

  SimulatorPublishFn publish_ = nullptr;
  void* publish_ctx_ = nullptr;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::atomic<bool> running_{false};
};

}  // namespace rsb

#endif  // RSB_SIMULATOR_HPP_
