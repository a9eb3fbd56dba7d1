/**
 * @file test_timestamp.cpp
 * @brief Tests for timestamp.hpp and telemetry.hpp records.
 */

#include "rsb/telemetry.hpp"
#include "rsb/timestamp.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

// 2024-01-01T00:00:00Z
static constexpr rsb::UtcMicros kNewYear2024 = 1704067200LL * 1000000LL;

TEST_CASE("ParseRfc3339 UTC forms", "[timestamp]") {
  REQUIRE(rsb::ParseRfc3339("2024-01-01T00:00:00Z").value() == kNewYear2024);
  REQUIRE(rsb::ParseRfc3339("2024-01-01t00:00:00z").value() == kNewYear2024);
  REQUIRE(rsb::ParseRfc3339("2024-01-01 00:00:00+00:00").value() ==
          kNewYear2024);
  REQUIRE(rsb::ParseRfc3339("1970-01-01T00:00:00Z").value() == 0);
}

TEST_CASE("ParseRfc3339 applies offsets", "[timestamp]") {
  REQUIRE(rsb::ParseRfc3339("2024-01-01T02:00:00+02:00").value() ==
          kNewYear2024);
  REQUIRE(rsb::ParseRfc3339("2023-12-31T19:30:00-04:30").value() ==
          kNewYear2024);
}

TEST_CASE("ParseRfc3339 fractions truncate to microseconds", "[timestamp]") {
  REQUIRE(rsb::ParseRfc3339("2024-01-01T00:00:00.5Z").value() ==
          kNewYear2024 + 500000);
  REQUIRE(rsb::ParseRfc3339("2024-01-01T00:00:00.123456789Z").value() ==
          kNewYear2024 + 123456);
}

TEST_CASE("ParseRfc3339 rejects malformed input", "[timestamp]") {
  const char* bad[] = {
      "",
      "not-a-date",
      "2024-01-01",
      "2024-01-01T00:00:00",        // no offset
      "2024-13-01T00:00:00Z",       // month
      "2023-02-29T00:00:00Z",       // not a leap year
      "2024-01-01T24:00:00Z",       // hour
      "2024-01-01T00:00:60Z",       // leap second
      "2024-01-01T00:00:00.Z",      // empty fraction
      "2024-01-01T00:00:00+0200",   // offset without colon
      "2024-01-01T00:00:00Z trailing",
  };
  for (const char* s : bad) {
    INFO(s);
    REQUIRE(!rsb::ParseRfc3339(s).has_value());
  }
  REQUIRE(rsb::ParseRfc3339("2024-02-29T00:00:00Z").has_value());
}

TEST_CASE("FormatStorage is fixed width naive UTC", "[timestamp]") {
  REQUIRE(rsb::FormatStorage(kNewYear2024) == "2024-01-01 00:00:00.000000");
  REQUIRE(rsb::FormatStorage(kNewYear2024 + 1234567) ==
          "2024-01-01 00:00:01.234567");
  REQUIRE(rsb::FormatStorage(0) == "1970-01-01 00:00:00.000000");
}

TEST_CASE("Storage text orders chronologically", "[timestamp]") {
  const std::string a = rsb::FormatStorage(kNewYear2024 - 1);
  const std::string b = rsb::FormatStorage(kNewYear2024);
  const std::string c = rsb::FormatStorage(kNewYear2024 + 86400LL * 1000000LL);
  REQUIRE(a < b);
  REQUIRE(b < c);
  REQUIRE(rsb::ParseStorage(b).value() == kNewYear2024);
  REQUIRE(rsb::ParseStorage("2024-01-01 00:00:00").value() == kNewYear2024);
}

TEST_CASE("FormatStorage clamps instants outside four-digit years",
          "[timestamp]") {
  auto late = rsb::ParseRfc3339("9999-12-31T23:30:00-01:00");
  REQUIRE(late.has_value());
  REQUIRE(*late > rsb::kMaxStorableMicros);
  REQUIRE(rsb::FormatStorage(*late) == "9999-12-31 23:59:59.999999");
  REQUIRE(rsb::FormatStorage(rsb::kMaxStorableMicros) ==
          "9999-12-31 23:59:59.999999");
  REQUIRE(rsb::FormatStorage(kNewYear2024) < rsb::FormatStorage(*late));

  auto early = rsb::ParseRfc3339("0000-01-01T00:30:00+01:00");
  REQUIRE(early.has_value());
  REQUIRE(*early < rsb::kMinStorableMicros);
  REQUIRE(rsb::FormatStorage(*early) == "0000-01-01 00:00:00.000000");
}

TEST_CASE("ParseStorage requires no offset but rejects junk", "[timestamp]") {
  REQUIRE(rsb::ParseStorage("2024-01-01 00:00:00.000000").value() ==
          kNewYear2024);
  REQUIRE(rsb::ParseStorage("2024-01-01T00:00:00Z").value() == kNewYear2024);
  REQUIRE(!rsb::ParseStorage("2024-01-01 00:00:00x").has_value());
  REQUIRE(!rsb::ParseStorage("").has_value());
  REQUIRE(!rsb::ParseRfc3339("2024-01-01 00:00:00").has_value());
}

TEST_CASE("FormatRfc3339 picks fraction precision", "[timestamp]") {
  REQUIRE(rsb::FormatRfc3339(kNewYear2024) == "2024-01-01T00:00:00+00:00");
  REQUIRE(rsb::FormatRfc3339(kNewYear2024 + 250000) ==
          "2024-01-01T00:00:00.250+00:00");
  REQUIRE(rsb::FormatRfc3339(kNewYear2024 + 1) ==
          "2024-01-01T00:00:00.000001+00:00");
}

TEST_CASE("FormatRfc3339 handles times before the epoch", "[timestamp]") {
  REQUIRE(rsb::FormatRfc3339(-1000000) == "1969-12-31T23:59:59+00:00");
  REQUIRE(rsb::FormatRfc3339(-1) == "1969-12-31T23:59:59.999999+00:00");
}

TEST_CASE("NowUtcMicros is after 2024", "[timestamp]") {
  REQUIRE(rsb::NowUtcMicros() > kNewYear2024);
}

// ============================================================================
// Telemetry records
// ============================================================================

TEST_CASE("TelemetryEvent JSON omits absent optionals", "[telemetry]") {
  rsb::TelemetryEvent e;
  e.ts = "2024-01-01T00:00:00Z";
  e.metrics = {{"voltage", 12.1}};
  nlohmann::json j = e;
  REQUIRE(j["ts"] == "2024-01-01T00:00:00Z");
  REQUIRE(j["metrics"]["voltage"] == 12.1);
  REQUIRE(!j.contains("device_id"));
  REQUIRE(!j.contains("device_uid"));
  REQUIRE(!j.contains("quality"));

  e.device_id = "board-01";
  e.quality = nlohmann::json{{"crc_ok", true}};
  j = e;
  REQUIRE(j["device_id"] == "board-01");
  REQUIRE(j["quality"]["crc_ok"] == true);
}

TEST_CASE("HistorySample JSON formats ts as RFC 3339", "[telemetry]") {
  rsb::HistorySample s;
  s.ts = kNewYear2024 + 500000;
  s.metrics = {{"rpm", 1400.5}};
  nlohmann::json j = s;
  REQUIRE(j["ts"] == "2024-01-01T00:00:00.500+00:00");
  REQUIRE(j["metrics"]["rpm"] == 1400.5);
  REQUIRE(!j.contains("quality"));
}

TEST_CASE("TelemetryEventFromJson", "[telemetry]") {
  auto j = nlohmann::json::parse(
      R"({"ts":"2024-01-01T00:00:00Z","device_uid":"u1","metrics":{"a":1},"quality":null})");
  auto e = rsb::TelemetryEventFromJson(j);
  REQUIRE(e.has_value());
  REQUIRE(e->device_uid.value() == "u1");
  REQUIRE(!e->device_id.has_value());
  REQUIRE(!e->quality.has_value());
  REQUIRE(e->metrics["a"] == 1);

  REQUIRE(!rsb::TelemetryEventFromJson(nlohmann::json{{"metrics", 1}}).has_value());
  REQUIRE(!rsb::TelemetryEventFromJson(nlohmann::json::array()).has_value());
}
