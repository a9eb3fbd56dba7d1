/**
 * @file test_telemetry_server.cpp
 * @brief Tests for telemetry_server.hpp routing, history and realtime push.
 */

#include "rsb/telemetry_server.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

static constexpr rsb::UtcMicros kNewYear2024 = 1704067200LL * 1000000LL;

struct TempDb {
  std::string path;

  TempDb() {
    char tmpl[] = "/tmp/rsb_server_XXXXXX";
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

rsb::TelemetryServerConfig TestConfig(const std::string& db) {
  rsb::TelemetryServerConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.database = db;
  cfg.pool_size = 2;
  cfg.channel_capacity = 16;
  cfg.max_connections = 4;
  return cfg;
}

rsb::HttpRequest Get(const std::string& target, const char* method = "GET") {
  rsb::HttpRequest req;
  size_t consumed = 0;
  const std::string raw =
      std::string(method) + " " + target + " HTTP/1.1\r\nHost: t\r\n\r\n";
  REQUIRE(rsb::ParseHttpRequest(raw, req, consumed) ==
          rsb::ParseStatus::kComplete);
  return req;
}

/// Read from @p c until @p done returns true or @p timeout_ms elapses.
template <typename Pred>
bool ReadUntil(rsb::net::TcpClient& c, std::string& buf, Pred done,
               uint32_t timeout_ms = 3000) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  char chunk[4096];
  while (!done(buf)) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    auto ready = c.WaitReadable(50);
    if (!ready.has_value()) return false;
    if (!ready.value()) continue;
    auto n = c.Recv(chunk, sizeof(chunk));
    if (!n.has_value() || n.value() == 0) return done(buf);
    buf.append(chunk, n.value());
  }
  return true;
}

bool HasHeaderBlock(const std::string& b) {
  return b.find("\r\n\r\n") != std::string::npos;
}

/// Next complete server frame from @p buf, consuming it.
bool NextFrame(rsb::net::TcpClient& c, std::string& buf, rsb::ws::Frame& out) {
  size_t consumed = 0;
  const bool ok = ReadUntil(c, buf, [&](const std::string& b) {
    rsb::ws::Frame f;
    size_t n = 0;
    return rsb::ws::TryParseFrame(b, f, n) == rsb::ws::FrameStatus::kComplete;
  });
  if (!ok) return false;
  if (rsb::ws::TryParseFrame(buf, out, consumed) !=
      rsb::ws::FrameStatus::kComplete) {
    return false;
  }
  buf.erase(0, consumed);
  return true;
}

rsb::TelemetryEvent SampleEvent(int seq) {
  rsb::TelemetryEvent ev;
  ev.ts = "2024-01-01T00:00:00Z";
  ev.device_id = std::string("board-01");
  ev.metrics = {{"seq", seq}};
  return ev;
}

}  // namespace

// ============================================================================
// Routing without sockets
// ============================================================================

TEST_CASE("Health endpoint", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  const rsb::HttpResponse r = server.Handle(Get("/api/health"));
  REQUIRE(r.status == 200);
  REQUIRE(r.content_type == "application/json");
  REQUIRE(nlohmann::json::parse(r.body) == nlohmann::json{{"status", "ok"}});
}

TEST_CASE("Unknown routes and methods", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));

  REQUIRE(server.Handle(Get("/api/nothing")).status == 404);
  REQUIRE(server.Handle(Get("/api/telemetry//history")).status == 404);
  REQUIRE(server.Handle(Get("/")).status == 404);

  const rsb::HttpResponse post = server.Handle(Get("/api/health", "POST"));
  REQUIRE(post.status == 405);
  bool has_allow = false;
  for (const auto& h : post.headers) {
    if (h.first == "Allow") has_allow = true;
  }
  REQUIRE(has_allow);

  const rsb::HttpResponse pre = server.Handle(Get("/api/health", "OPTIONS"));
  REQUIRE(pre.status == 204);
  REQUIRE(pre.Serialize().find("Access-Control-Allow-Methods: GET, OPTIONS") !=
          std::string::npos);
}

TEST_CASE("Realtime without upgrade is rejected", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  const rsb::HttpResponse r = server.Handle(Get("/ws/realtime"));
  REQUIRE(r.status == 400);
  REQUIRE(r.body == "WebSocket upgrade required");
}

TEST_CASE("History returns stored points in order", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Store().EnsureSchema().has_value());
  for (int i = 3; i >= 0; --i) {
    REQUIRE(server.Store()
                .Append("dev 1", kNewYear2024 + i * 1000000LL,
                        nlohmann::json{{"seq", i}}, rsb::optional<nlohmann::json>())
                .has_value());
  }

  const rsb::HttpResponse r =
      server.Handle(Get("/api/telemetry/dev%201/history?limit=3"));
  REQUIRE(r.status == 200);
  const nlohmann::json body = nlohmann::json::parse(r.body);
  REQUIRE(body["device_uid"] == "dev 1");
  REQUIRE(body["points"].size() == 3);
  REQUIRE(body["points"][0]["ts"] == "2024-01-01T00:00:00+00:00");
  REQUIRE(body["points"][0]["metrics"]["seq"] == 0);
  REQUIRE(body["points"][2]["metrics"]["seq"] == 2);
  REQUIRE(!body["points"][0].contains("quality"));
}

TEST_CASE("History applies time bounds", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Store().EnsureSchema().has_value());
  for (int i = 0; i < 5; ++i) {
    REQUIRE(server.Store()
                .Append("dev-1", kNewYear2024 + i * 1000000LL,
                        nlohmann::json{{"seq", i}}, rsb::optional<nlohmann::json>())
                .has_value());
  }

  rsb::HttpResponse r = server.Handle(
      Get("/api/telemetry/dev-1/history?start=2024-01-01T00:00:01Z"
          "&end=2024-01-01T00:00:03%2B00:00"));
  REQUIRE(r.status == 200);
  nlohmann::json body = nlohmann::json::parse(r.body);
  REQUIRE(body["points"].size() == 3);
  REQUIRE(body["points"][0]["metrics"]["seq"] == 1);

  r = server.Handle(Get(
      "/api/telemetry/dev-1/history?start=2024-01-01T00:00:04Z"
      "&end=2024-01-01T00:00:01Z"));
  REQUIRE(r.status == 200);
  REQUIRE(nlohmann::json::parse(r.body)["points"].empty());

  r = server.Handle(Get("/api/telemetry/unknown/history"));
  REQUIRE(r.status == 200);
  REQUIRE(nlohmann::json::parse(r.body)["points"].empty());
}

TEST_CASE("History end bound past year 9999 keeps stored points", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Store().EnsureSchema().has_value());
  for (int i = 0; i < 2; ++i) {
    REQUIRE(server.Store()
                .Append("dev-1", kNewYear2024 + i * 1000000LL,
                        nlohmann::json{{"seq", i}}, rsb::optional<nlohmann::json>())
                .has_value());
  }
  const rsb::HttpResponse r = server.Handle(
      Get("/api/telemetry/dev-1/history?end=9999-12-31T23:30:00-01:00"));
  REQUIRE(r.status == 200);
  REQUIRE(nlohmann::json::parse(r.body)["points"].size() == 2);
}

TEST_CASE("History limit is clamped", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Store().EnsureSchema().has_value());
  for (int i = 0; i < 3; ++i) {
    REQUIRE(server.Store()
                .Append("dev-1", kNewYear2024 + i * 1000000LL,
                        nlohmann::json{{"seq", i}}, rsb::optional<nlohmann::json>())
                .has_value());
  }
  rsb::HttpResponse r =
      server.Handle(Get("/api/telemetry/dev-1/history?limit=0"));
  REQUIRE(r.status == 200);
  REQUIRE(nlohmann::json::parse(r.body)["points"].size() == 1);

  r = server.Handle(Get("/api/telemetry/dev-1/history?limit=-7"));
  REQUIRE(nlohmann::json::parse(r.body)["points"].size() == 1);

  r = server.Handle(
      Get("/api/telemetry/dev-1/history?limit=99999999999999999999999"));
  REQUIRE(r.status == 200);
  REQUIRE(nlohmann::json::parse(r.body)["points"].size() == 3);
}

TEST_CASE("History rejects bad parameters", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Store().EnsureSchema().has_value());

  rsb::HttpResponse r =
      server.Handle(Get("/api/telemetry/dev-1/history?limit=ten"));
  REQUIRE(r.status == 400);
  REQUIRE(r.body == "Invalid limit: ten");

  r = server.Handle(Get("/api/telemetry/dev-1/history?start=yesterday"));
  REQUIRE(r.status == 400);
  REQUIRE(r.body == "Invalid timestamp: yesterday");

  r = server.Handle(Get("/api/telemetry/dev-1/history?end=2024-13-01T00:00:00Z"));
  REQUIRE(r.status == 400);
  REQUIRE(r.body == "Invalid timestamp: 2024-13-01T00:00:00Z");
}

TEST_CASE("History without a schema is a server error", "[server]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  const rsb::HttpResponse r =
      server.Handle(Get("/api/telemetry/dev-1/history"));
  REQUIRE(r.status == 500);
  REQUIRE(!r.body.empty());
}

// ============================================================================
// Over sockets
// ============================================================================

TEST_CASE("Server answers HTTP on an ephemeral port", "[server][socket]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Start().has_value());
  REQUIRE(server.IsRunning());
  REQUIRE(server.Port() != 0);

  auto c = rsb::net::TcpClient::Connect("127.0.0.1", server.Port(), 1000);
  REQUIRE(c.has_value());
  REQUIRE(c.value()
              .SendAll(std::string("GET /api/health HTTP/1.1\r\nHost: t\r\n\r\n"))
              .has_value());
  std::string buf;
  REQUIRE(ReadUntil(c.value(), buf, [](const std::string& b) {
    return b.find(R"({"status":"ok"})") != std::string::npos;
  }));
  REQUIRE(buf.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
  REQUIRE(buf.find("Access-Control-Allow-Origin: *") != std::string::npos);

  // Keep-alive: a second request on the same connection.
  buf.clear();
  REQUIRE(c.value()
              .SendAll(std::string(
                  "GET /missing HTTP/1.1\r\nConnection: close\r\n\r\n"))
              .has_value());
  REQUIRE(ReadUntil(c.value(), buf, [](const std::string& b) {
    return b.find("Not Found", 12) != std::string::npos;
  }));
  REQUIRE(buf.rfind("HTTP/1.1 404", 0) == 0);

  server.Stop();
  REQUIRE(!server.IsRunning());
}

TEST_CASE("Malformed request gets 400 and the connection closes",
          "[server][socket]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Start().has_value());

  auto c = rsb::net::TcpClient::Connect("127.0.0.1", server.Port(), 1000);
  REQUIRE(c.has_value());
  REQUIRE(c.value().SendAll(std::string("NONSENSE\r\n\r\n")).has_value());
  std::string buf;
  ReadUntil(c.value(), buf, [](const std::string&) { return false; }, 1000);
  REQUIRE(buf.rfind("HTTP/1.1 400", 0) == 0);
  REQUIRE(buf.find("Connection: close") != std::string::npos);
  server.Stop();
}

TEST_CASE("Connections beyond the slot count get 503", "[server][socket]") {
  TempDb db;
  rsb::TelemetryServerConfig cfg = TestConfig(db.path);
  cfg.max_connections = 1;
  rsb::TelemetryServer server(cfg);
  REQUIRE(server.Start().has_value());

  auto first = rsb::net::TcpClient::Connect("127.0.0.1", server.Port(), 1000);
  REQUIRE(first.has_value());
  REQUIRE(first.value()
              .SendAll(std::string("GET /api/health HTTP/1.1\r\n\r\n"))
              .has_value());
  std::string buf;
  REQUIRE(ReadUntil(first.value(), buf, [](const std::string& b) {
    return b.find(R"({"status":"ok"})") != std::string::npos;
  }));

  auto second = rsb::net::TcpClient::Connect("127.0.0.1", server.Port(), 1000);
  REQUIRE(second.has_value());
  std::string busy;
  ReadUntil(second.value(), busy, [](const std::string&) { return false; },
            1000);
  REQUIRE(busy.rfind("HTTP/1.1 503", 0) == 0);
  server.Stop();
}

TEST_CASE("Realtime clients receive published events", "[server][socket]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Start().has_value());
  REQUIRE(server.Publish(SampleEvent(-1)) == 0);

  auto c = rsb::net::TcpClient::Connect("127.0.0.1", server.Port(), 1000);
  REQUIRE(c.has_value());
  rsb::net::TcpClient& client = c.value();
  REQUIRE(client
              .SendAll(std::string(
                  "GET /ws/realtime HTTP/1.1\r\n"
                  "Host: t\r\n"
                  "Upgrade: websocket\r\n"
                  "Connection: Upgrade\r\n"
                  "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                  "Sec-WebSocket-Version: 13\r\n\r\n"))
              .has_value());

  std::string buf;
  REQUIRE(ReadUntil(client, buf, HasHeaderBlock));
  REQUIRE(buf.rfind("HTTP/1.1 101", 0) == 0);
  REQUIRE(buf.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") !=
          std::string::npos);
  buf.erase(0, buf.find("\r\n\r\n") + 4);
  REQUIRE(server.Channel().SubscriberCount() == 1);

  server.Publish(SampleEvent(1));
  server.Publish(SampleEvent(2));

  for (int expect = 1; expect <= 2; ++expect) {
    rsb::ws::Frame frame;
    REQUIRE(NextFrame(client, buf, frame));
    REQUIRE(frame.opcode == rsb::ws::Opcode::kText);
    const nlohmann::json j = nlohmann::json::parse(frame.payload);
    REQUIRE(j["metrics"]["seq"] == expect);
    REQUIRE(j["device_id"] == "board-01");
    REQUIRE(!j.contains("quality"));
  }

  // Ping is answered with a pong carrying the same payload.
  const uint8_t mask[4] = {1, 2, 3, 4};
  REQUIRE(client.SendAll(rsb::ws::EncodeFrame(rsb::ws::Opcode::kPing, "hb", mask))
              .has_value());
  rsb::ws::Frame pong;
  REQUIRE(NextFrame(client, buf, pong));
  REQUIRE(pong.opcode == rsb::ws::Opcode::kPong);
  REQUIRE(pong.payload == "hb");

  // Close is echoed and the subscription goes away.
  REQUIRE(client.SendAll(rsb::ws::EncodeFrame(rsb::ws::Opcode::kClose, "", mask))
              .has_value());
  rsb::ws::Frame close;
  REQUIRE(NextFrame(client, buf, close));
  REQUIRE(close.opcode == rsb::ws::Opcode::kClose);

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (server.Channel().SubscriberCount() != 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(server.Channel().SubscriberCount() == 0);
  server.Stop();
}

TEST_CASE("Lagging realtime client skips samples and stays connected",
          "[server][socket]") {
  TempDb db;
  rsb::TelemetryServerConfig cfg = TestConfig(db.path);
  cfg.channel_capacity = 4;
  rsb::TelemetryServer server(cfg);
  REQUIRE(server.Start().has_value());

  auto c = rsb::net::TcpClient::Connect("127.0.0.1", server.Port(), 1000);
  REQUIRE(c.has_value());
  rsb::net::TcpClient& client = c.value();
  REQUIRE(client
              .SendAll(std::string(
                  "GET /ws/realtime HTTP/1.1\r\n"
                  "Host: t\r\n"
                  "Upgrade: websocket\r\n"
                  "Connection: Upgrade\r\n"
                  "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                  "Sec-WebSocket-Version: 13\r\n\r\n"))
              .has_value());
  std::string buf;
  REQUIRE(ReadUntil(client, buf, HasHeaderBlock));
  REQUIRE(buf.rfind("HTTP/1.1 101", 0) == 0);
  buf.erase(0, buf.find("\r\n\r\n") + 4);
  REQUIRE(server.Channel().SubscriberCount() == 1);

  // Large samples keep the sender busy encoding while the ring wraps.
  const std::string pad(256U * 1024U, 'p');
  const int total = static_cast<int>(cfg.channel_capacity) * 3;
  for (int i = 0; i < total; ++i) {
    rsb::TelemetryEvent ev = SampleEvent(i);
    ev.metrics["pad"] = pad;
    server.Publish(ev);
  }

  std::vector<int> seen;
  while (seen.empty() || seen.back() != total - 1) {
    rsb::ws::Frame frame;
    REQUIRE(NextFrame(client, buf, frame));
    REQUIRE(frame.opcode == rsb::ws::Opcode::kText);
    const nlohmann::json j = nlohmann::json::parse(frame.payload);
    const int seq = j["metrics"]["seq"].get<int>();
    if (!seen.empty()) REQUIRE(seq > seen.back());
    seen.push_back(seq);
  }
  INFO("frames received: " << seen.size());
  REQUIRE(seen.size() < static_cast<size_t>(total));

  server.Publish(SampleEvent(total));
  rsb::ws::Frame next;
  REQUIRE(NextFrame(client, buf, next));
  REQUIRE(nlohmann::json::parse(next.payload)["metrics"]["seq"] == total);
  REQUIRE(server.Channel().SubscriberCount() == 1);
  server.Stop();
}

TEST_CASE("Stop disconnects realtime clients", "[server][socket]") {
  TempDb db;
  rsb::TelemetryServer server(TestConfig(db.path));
  REQUIRE(server.Start().has_value());

  auto c = rsb::net::TcpClient::Connect("127.0.0.1", server.Port(), 1000);
  REQUIRE(c.has_value());
  REQUIRE(c.value()
              .SendAll(std::string(
                  "GET /ws/realtime HTTP/1.1\r\n"
                  "Upgrade: websocket\r\n"
                  "Connection: Upgrade\r\n"
                  "Sec-WebSocket-Key: x3JJHMbDL1EzLkh9GBhXDw==\r\n\r\n"))
              .has_value());
  std::string buf;
  REQUIRE(ReadUntil(c.value(), buf, HasHeaderBlock));

  const auto t0 = std::chrono::steady_clock::now();
  server.Stop();
  REQUIRE(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(2));
  REQUIRE(server.Channel().SubscriberCount() == 0);
}
