/**
 * @file test_simulator.cpp
 * @brief Tests for simulator.hpp sample generation and the emit thread.
 */

#include "rsb/simulator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>

namespace {

bool HasDecimals(double v, int digits) {
  const double scale = std::pow(10.0, digits);
  return std::fabs(v * scale - std::round(v * scale)) < 1e-6;
}

struct Counter {
  std::atomic<int> events{0};
  std::atomic<bool> wrong_device{false};
};

void CountEvent(const rsb::TelemetryEvent& ev, void* ctx) {
  auto* c = static_cast<Counter*>(ctx);
  if (!ev.device_id.has_value() || *ev.device_id != "sim-7") {
    c->wrong_device.store(true);
  }
  c->events.fetch_add(1);
}

}  // namespace

TEST_CASE("NextSample stays within the waveform envelope", "[simulator]") {
  rsb::TelemetrySimulator sim(rsb::SimulatorConfig{});
  for (int i = 0; i < 500; ++i) {
    const rsb::TelemetryEvent ev = sim.NextSample();
    const double voltage = ev.metrics["voltage"].get<double>();
    const double current = ev.metrics["current"].get<double>();
    const double temp_c = ev.metrics["temp_c"].get<double>();
    const double rpm = ev.metrics["rpm"].get<double>();
    REQUIRE(voltage >= 11.32);
    REQUIRE(voltage <= 12.68);
    REQUIRE(current >= 1.05);
    REQUIRE(current <= 1.95);
    REQUIRE(temp_c >= 32.8);
    REQUIRE(temp_c <= 37.2);
    REQUIRE(rpm >= 1270.0);
    REQUIRE(rpm <= 1530.0);
    REQUIRE(HasDecimals(voltage, 3));
    REQUIRE(HasDecimals(rpm, 1));
  }
}

TEST_CASE("NextSample fills identity, timestamp and quality", "[simulator]") {
  rsb::SimulatorConfig cfg;
  cfg.device_id = "board-42";
  rsb::TelemetrySimulator sim(cfg);

  const rsb::TelemetryEvent first = sim.NextSample();
  const rsb::TelemetryEvent second = sim.NextSample();
  REQUIRE(first.device_id.has_value());
  REQUIRE(*first.device_id == "board-42");
  REQUIRE(!first.device_uid.has_value());
  REQUIRE(rsb::ParseRfc3339(first.ts).has_value());
  REQUIRE(first.quality.has_value());
  REQUIRE((*first.quality)["crc_ok"] == true);
  REQUIRE((*first.quality)["frame_seq"] == 80);
  REQUIRE((*second.quality)["frame_seq"] == 160);
}

TEST_CASE("Start emits on a thread until Stop", "[simulator]") {
  rsb::SimulatorConfig cfg;
  cfg.device_id = "sim-7";
  cfg.interval_ms = 10;
  rsb::TelemetrySimulator sim(cfg);
  Counter counter;

  REQUIRE(!sim.Start(nullptr, &counter));
  REQUIRE(sim.Start(&CountEvent, &counter));
  REQUIRE(sim.IsRunning());
  REQUIRE(!sim.Start(&CountEvent, &counter));

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (counter.events.load() < 3 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  sim.Stop();
  REQUIRE(!sim.IsRunning());
  REQUIRE(counter.events.load() >= 3);
  REQUIRE(!counter.wrong_device.load());

  const int after_stop = counter.events.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(counter.events.load() == after_stop);
}

TEST_CASE("Stop is prompt with a long interval", "[simulator]") {
  rsb::SimulatorConfig cfg;
  cfg.device_id = "sim-7";
  cfg.interval_ms = 60000;
  rsb::TelemetrySimulator sim(cfg);
  Counter counter;
  REQUIRE(sim.Start(&CountEvent, &counter));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  const auto t0 = std::chrono::steady_clock::now();
  sim.Stop();
  REQUIRE(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(1));
  REQUIRE(counter.events.load() == 1);

  // Restartable after a stop.
  REQUIRE(sim.Start(&CountEvent, &counter));
  sim.Stop();
}
