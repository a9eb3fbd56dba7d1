/**
 * @file test_history_store.cpp
 * @brief Tests for history_store.hpp against a temporary SQLite file.
 */

#include "rsb/history_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

static constexpr rsb::UtcMicros kBase = 1704067200LL * 1000000LL;
static constexpr rsb::UtcMicros kSecond = 1000000LL;

/// Temp database path removed on scope exit.
struct TempDb {
  std::string path;

  TempDb() {
    char tmpl[] = "/tmp/rsb_history_XXXXXX";
    int fd = ::mkstemp(tmpl);
    REQUIRE(fd >= 0);
    ::close(fd);
    std::remove(tmpl);
    path = std::string(tmpl) + ".db";
  }
  ~TempDb() {
    std::remove(path.c_str());
    std::remove((path + "-journal").c_str());
  }
};

void Seed(rsb::HistoryStore& store, const std::string& uid,
          const std::vector<int>& offsets_s) {
  for (int off : offsets_s) {
    nlohmann::json metrics = {{"seq", off}};
    auto r = store.Append(uid, kBase + off * kSecond, metrics,
                          nlohmann::json{{"crc_ok", true}, {"frame_seq", off}},
                          "test");
    REQUIRE(r.has_value());
  }
}

}  // namespace

TEST_CASE("ClampHistoryLimit bounds", "[history]") {
  REQUIRE(rsb::ClampHistoryLimit(-5) == 1);
  REQUIRE(rsb::ClampHistoryLimit(0) == 1);
  REQUIRE(rsb::ClampHistoryLimit(250) == 250);
  REQUIRE(rsb::ClampHistoryLimit(10000) == 10000);
  REQUIRE(rsb::ClampHistoryLimit(50000) == 10000);
}

TEST_CASE("Query before schema exists fails with a message", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  rsb::HistoryQuery q;
  q.device_uid = "dev-1";
  auto r = store.Query(q);
  REQUIRE(!r.has_value());
  REQUIRE(!r.get_error().message.empty());
}

TEST_CASE("EnsureSchema is idempotent", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  REQUIRE(store.EnsureSchema().has_value());
}

TEST_CASE("Query returns samples in ascending time order", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  Seed(store, "dev-1", {30, 10, 20, 0});
  Seed(store, "dev-2", {5});

  rsb::HistoryQuery q;
  q.device_uid = "dev-1";
  auto r = store.Query(q);
  REQUIRE(r.has_value());
  const auto& rows = r.value();
  REQUIRE(rows.size() == 4);
  for (size_t i = 0; i < rows.size(); ++i) {
    REQUIRE(rows[i].ts == kBase + static_cast<int64_t>(i) * 10 * kSecond);
    REQUIRE(rows[i].metrics["seq"] == static_cast<int>(i) * 10);
    REQUIRE(rows[i].quality.has_value());
    REQUIRE((*rows[i].quality)["crc_ok"] == true);
  }
}

TEST_CASE("Query range bounds are inclusive", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  Seed(store, "dev-1", {0, 10, 20, 30});

  rsb::HistoryQuery q;
  q.device_uid = "dev-1";
  q.start = kBase + 10 * kSecond;
  q.end = kBase + 20 * kSecond;
  auto r = store.Query(q);
  REQUIRE(r.has_value());
  REQUIRE(r.value().size() == 2);
  REQUIRE(r.value().front().ts == kBase + 10 * kSecond);
  REQUIRE(r.value().back().ts == kBase + 20 * kSecond);

  q.start = kBase + 25 * kSecond;
  q.end.reset();
  r = store.Query(q);
  REQUIRE(r.value().size() == 1);
}

TEST_CASE("Query bound past year 9999 keeps every earlier row",
          "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  Seed(store, "dev-1", {0, 10});

  rsb::HistoryQuery q;
  q.device_uid = "dev-1";
  q.end = rsb::ParseRfc3339("9999-12-31T23:30:00-01:00");
  REQUIRE(q.end.has_value());
  auto r = store.Query(q);
  REQUIRE(r.has_value());
  REQUIRE(r.value().size() == 2);

  q.end.reset();
  q.start = rsb::ParseRfc3339("0000-01-01T00:30:00+01:00");
  REQUIRE(q.start.has_value());
  r = store.Query(q);
  REQUIRE(r.has_value());
  REQUIRE(r.value().size() == 2);
}

TEST_CASE("Query with start after end is empty", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  Seed(store, "dev-1", {0, 10});

  rsb::HistoryQuery q;
  q.device_uid = "dev-1";
  q.start = kBase + 10 * kSecond;
  q.end = kBase;
  auto r = store.Query(q);
  REQUIRE(r.has_value());
  REQUIRE(r.value().empty());
}

TEST_CASE("Query limit keeps the earliest rows", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  Seed(store, "dev-1", {4, 3, 2, 1, 0});

  rsb::HistoryQuery q;
  q.device_uid = "dev-1";
  q.limit = 2;
  auto r = store.Query(q);
  REQUIRE(r.has_value());
  REQUIRE(r.value().size() == 2);
  REQUIRE(r.value()[0].ts == kBase);
  REQUIRE(r.value()[1].ts == kBase + kSecond);
}

TEST_CASE("Unknown device yields no rows", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  Seed(store, "dev-1", {0});

  rsb::HistoryQuery q;
  q.device_uid = "dev-1' OR '1'='1";
  auto r = store.Query(q);
  REQUIRE(r.has_value());
  REQUIRE(r.value().empty());
}

TEST_CASE("Absent quality stays absent", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path);
  REQUIRE(store.EnsureSchema().has_value());
  REQUIRE(store.Append("dev-1", kBase, nlohmann::json{{"v", 1.5}},
                       rsb::optional<nlohmann::json>())
              .has_value());

  rsb::HistoryQuery q;
  q.device_uid = "dev-1";
  auto r = store.Query(q);
  REQUIRE(r.has_value());
  REQUIRE(r.value().size() == 1);
  REQUIRE(!r.value()[0].quality.has_value());
  REQUIRE(r.value()[0].metrics["v"] == 1.5);
}

TEST_CASE("Concurrent queries share a bounded pool", "[history]") {
  TempDb db;
  rsb::HistoryStore store(db.path, 2);
  REQUIRE(store.EnsureSchema().has_value());
  Seed(store, "dev-1", {0, 1, 2});

  std::atomic<int> ok{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 6; ++t) {
    workers.emplace_back([&]() {
      rsb::HistoryQuery q;
      q.device_uid = "dev-1";
      for (int i = 0; i < 20; ++i) {
        auto r = store.Query(q);
        if (r.has_value() && r.value().size() == 3) ok.fetch_add(1);
      }
    });
  }
  for (auto& w : workers) w.join();
  REQUIRE(ok.load() == 120);
  REQUIRE(store.OpenConnections() <= 2);
  REQUIRE(store.PoolSize() == 2);
}
