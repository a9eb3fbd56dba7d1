/**
 * @file telemetry.hpp
 * @brief Telemetry event and history sample records.
 */

#ifndef RSB_TELEMETRY_HPP_
#define RSB_TELEMETRY_HPP_

#include "rsb/timestamp.hpp"
#include "rsb/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rsb {

/// @brief One live sample as pushed to realtime subscribers.
struct TelemetryEvent {
  std::string ts;  ///< ISO-8601 text as produced by the source
  optional<std::string> device_id;
  optional<std::string> device_uid;
  nlohmann::json metrics;
  optional<nlohmann::json> quality;
};

/// @brief One persisted row returned by a history query.
struct HistorySample {
  UtcMicros ts = 0;
  nlohmann::json metrics;
  optional<nlohmann::json> quality;
};

// Absent optionals are omitted, not written as null.

inline void to_json(nlohmann::json& j, const TelemetryEvent& e) {
  j = nlohmann::json::object();
  j["ts"] = e.ts;
  if (e.device_id.has_value()) j["device_id"] = *e.device_id;
  if (e.device_uid.has_value()) j["device_uid"] = *e.device_uid;
  j["metrics"] = e.metrics;
  if (e.quality.has_value()) j["quality"] = *e.quality;
}

inline void to_json(nlohmann::json& j, const HistorySample& s) {
  j = nlohmann::json::object();
  j["ts"] = FormatRfc3339(s.ts);
  j["metrics"] = s.metrics;
  if (s.quality.has_value()) j["quality"] = *s.quality;
}

/**
 * @brief Build an event from a JSON object.
 * @return nullopt when "ts" is missing or not a string.
 */
inline optional<TelemetryEvent> TelemetryEventFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  auto ts = j.find("ts");
  if (ts == j.end() || !ts->is_string()) return std::nullopt;

  TelemetryEvent e;
  e.ts = ts->get<std::string>();
  auto id = j.find("device_id");
  if (id != j.end() && id->is_string()) e.device_id = id->get<std::string>();
  auto uid = j.find("device_uid");
  if (uid != j.end() && uid->is_string()) e.device_uid = uid->get<std::string>();
  auto metrics = j.find("metrics");
  e.metrics = (metrics != j.end()) ? *metrics : nlohmann::json(nullptr);
  auto quality = j.find("quality");
  if (quality != j.end() && !quality->is_null()) e.quality = *quality;
  return e;
}

}  // namespace rsb

#endif  // RSB_TELEMETRY_HPP_
