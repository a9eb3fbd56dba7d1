/**
 * @file telemetry_server.hpp
 * @brief Embedded HTTP/WebSocket telemetry server.
 *
 * Endpoints:
 *   GET /api/health                              -> {"status":"ok"}
 *   GET /api/telemetry/{device_uid}/history      -> stored samples
 *   GET /ws/realtime (WebSocket upgrade)         -> live events as text frames
 *
 * Threading follows a fixed-slot model: one accept thread plus at most
 * `max_connections` session threads. A connection arriving while every
 * slot is busy is answered with 503 and closed.
 *
 * Usage:
 * @code
 *   rsb::TelemetryServer server(cfg);
 *   if (server.Start()) {
 *     server.Publish(event);
 *   }
 *   server.Stop();
 * @endcode
 */

#ifndef RSB_TELEMETRY_SERVER_HPP_
#define RSB_TELEMETRY_SERVER_HPP_

#include "rsb/broadcast.hpp"
#include "rsb/history_store.hpp"
#include "rsb/http.hpp"
#include "rsb/log.hpp"
#include "rsb/net.hpp"
#include "rsb/telemetry.hpp"
#include "rsb/timestamp.hpp"
#include "rsb/vocabulary.hpp"
#include "rsb/websocket.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace rsb {

struct TelemetryServerConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 8001U;        ///< 0 picks an ephemeral port
  std::string database = "rs485.db";
  uint32_t pool_size = kDefaultPoolSize;
  size_t channel_capacity = kDefaultBroadcastCapacity;
  uint32_t max_connections = 32U;
};

class TelemetryServer final {
 public:
  static constexpr uint32_t kPollIntervalMs = 100U;
  static constexpr uint32_t kIdleTimeoutMs = 30000U;

  explicit TelemetryServer(const TelemetryServerConfig& cfg)
      : cfg_(cfg),
        store_(cfg.database, cfg.pool_size),
        channel_(cfg.channel_capacity) {}

  ~TelemetryServer() { Stop(); }

  TelemetryServer(const TelemetryServer&) = delete;
  TelemetryServer& operator=(const TelemetryServer&) = delete;

  /**
   * @brief Bind the listener and spawn the accept thread.
   * @return kListenFailed / kInvalidAddress when the address cannot be bound.
   */
  expected<void, net::NetError> Start() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, net::NetError>::success();
    }
    sockpp::initialize();

    const uint32_t slots = (cfg_.max_connections == 0U) ? 1U : cfg_.max_connections;
    auto listener = net::TcpServer::Listen(cfg_.host.c_str(), cfg_.port,
                                           static_cast<int32_t>(slots));
    if (!listener.has_value()) {
      RSB_LOG_ERROR("Http", "listen %s:%u failed: %s", cfg_.host.c_str(),
                    static_cast<unsigned>(cfg_.port),
                    net::NetErrorName(listener.get_error()));
      return expected<void, net::NetError>::error(listener.get_error());
    }
    listener_ = std::move(listener.value());

    sessions_.clear();
    for (uint32_t i = 0; i < slots; ++i) {
      sessions_.push_back(std::make_unique<Session>());
    }

    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });
    RSB_LOG_INFO("Http", "telemetry server listening on %s:%u",
                 cfg_.host.c_str(),
                 static_cast<unsigned>(listener_.LocalPort()));
    return expected<void, net::NetError>::success();
  }

  /// @brief Stop accepting, close every session and join all threads.
  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    listener_.Shutdown();
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    listener_.Close();

    for (auto& s : sessions_) {
      if (s->active.load(std::memory_order_acquire)) {
        s->client.Shutdown();
      }
    }
    for (auto& s : sessions_) {
      if (s->thread.joinable()) {
        s->thread.join();
      }
      s->client.Close();
    }
    sessions_.clear();
    RSB_LOG_INFO("Http", "telemetry server stopped");
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_relaxed);
  }

  /// @brief Bound port (useful when configured with port 0).
  uint16_t Port() const noexcept { return listener_.LocalPort(); }

  /**
   * @brief Fan @p event out to realtime subscribers. Never blocks.
   * @return Number of subscribers at publish time.
   */
  size_t Publish(const TelemetryEvent& event) { return channel_.Publish(event); }

  HistoryStore& Store() noexcept { return store_; }

  BroadcastChannel<TelemetryEvent>& Channel() noexcept { return channel_; }

  const TelemetryServerConfig& GetConfig() const noexcept { return cfg_; }

  /**
   * @brief Route a plain (non-upgrade) HTTP request.
   *
   * Exposed so routing can be exercised without sockets.
   */
  HttpResponse Handle(const HttpRequest& req) {
    const std::vector<std::string> seg = SplitPath(req.path);

    const bool is_health = seg.size() == 2 && seg[0] == "api" && seg[1] == "health";
    const bool is_history = seg.size() == 4 && seg[0] == "api" &&
                            seg[1] == "telemetry" && !seg[2].empty() &&
                            seg[3] == "history";
    const bool is_realtime = seg.size() == 2 && seg[0] == "ws" && seg[1] == "realtime";

    if (!is_health && !is_history && !is_realtime) {
      return HttpResponse::Text(404, "Not Found");
    }
    if (req.method == "OPTIONS") {
      return Preflight(req);
    }
    if (req.method != "GET") {
      HttpResponse r = HttpResponse::Text(405, "Method Not Allowed");
      r.headers.emplace_back("Allow", "GET, OPTIONS");
      return r;
    }
    if (is_health) {
      return HttpResponse::Json(200, R"({"status":"ok"})");
    }
    if (is_history) {
      return History(PercentDecode(seg[2]), req.query);
    }
    return HttpResponse::Text(400, "WebSocket upgrade required");
  }

 private:
  struct Session {
    net::TcpClient client;
    std::thread thread;
    std::atomic<bool> active{false};
  };

  // ------------------------------------------------------------------
  // Accept / session loops
  // ------------------------------------------------------------------

  void AcceptLoop() {
    while (running_.load(std::memory_order_relaxed)) {
      auto accepted = listener_.Accept();
      if (!accepted.has_value()) {
        if (!running_.load(std::memory_order_relaxed)) break;
        RSB_LOG_WARN("Http", "accept failed");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      if (!running_.load(std::memory_order_relaxed)) {
        accepted.value().Close();
        break;
      }

      bool placed = false;
      for (auto& slot : sessions_) {
        Session& s = *slot;
        if (!s.active.load(std::memory_order_acquire)) {
          if (s.thread.joinable()) {
            s.thread.join();
          }
          s.client = std::move(accepted.value());
          s.active.store(true, std::memory_order_release);
          s.thread = std::thread([this, &s]() { SessionLoop(s); });
          placed = true;
          break;
        }
      }

      if (!placed) {
        net::TcpClient& c = accepted.value();
        HttpResponse busy = HttpResponse::Text(503, "Too many connections");
        busy.keep_alive = false;
        (void)c.SendAll(busy.Serialize());
        c.Close();
        RSB_LOG_WARN("Http", "connection rejected: all %zu slots busy",
                     sessions_.size());
      }
    }
  }

  void SessionLoop(Session& s) {
    std::string buf;
    uint32_t idle_ms = 0U;
    char chunk[4096];

    while (running_.load(std::memory_order_relaxed)) {
      HttpRequest req;
      size_t consumed = 0U;
      const ParseStatus st = ParseHttpRequest(buf, req, consumed);

      if (st == ParseStatus::kIncomplete) {
        auto ready = s.client.WaitReadable(kPollIntervalMs);
        if (!ready.has_value()) break;
        if (!ready.value()) {
          idle_ms += kPollIntervalMs;
          if (idle_ms >= kIdleTimeoutMs) break;
          continue;
        }
        auto n = s.client.Recv(chunk, sizeof(chunk));
        if (!n.has_value() || n.value() == 0U) break;
        buf.append(chunk, n.value());
        idle_ms = 0U;
        continue;
      }

      if (st != ParseStatus::kComplete) {
        HttpResponse err = (st == ParseStatus::kTooLarge)
                               ? HttpResponse::Text(413, "Payload Too Large")
                               : HttpResponse::Text(400, "Bad Request");
        err.keep_alive = false;
        (void)s.client.SendAll(err.Serialize());
        RSB_LOG_WARN("Http", "malformed request -> %d", err.status);
        break;
      }

      buf.erase(0, consumed);
      const auto t0 = std::chrono::steady_clock::now();

      if (req.method == "GET" && ws::IsUpgradeRequest(req) &&
          SplitPath(req.path) == std::vector<std::string>{"ws", "realtime"}) {
        ServeRealtime(s.client, req, buf);
        break;
      }

      HttpResponse resp = Handle(req);
      resp.keep_alive = req.KeepAlive();
      const bool sent = s.client.SendAll(resp.Serialize()).has_value();
      const long long ms = static_cast<long long>(
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - t0)
              .count());
      RSB_LOG_INFO("Http", "%s %s %d %lldms", req.method.c_str(),
                   req.path.c_str(), resp.status, ms);
      if (!sent || !resp.keep_alive) break;
    }

    // The descriptor is released when the slot is reused or on Stop().
    s.client.Shutdown();
    s.active.store(false, std::memory_order_release);
  }

  // ------------------------------------------------------------------
  // Realtime
  // ------------------------------------------------------------------

  /**
   * @brief Push every event published after the handshake until the peer
   *        goes away. @p pending holds bytes already read past the request.
   */
  void ServeRealtime(net::TcpClient& client, const HttpRequest& req,
                     std::string pending) {
    auto sub = channel_.Subscribe();
    if (!client.SendAll(ws::HandshakeResponse(*req.Header("Sec-WebSocket-Key")))
             .has_value()) {
      return;
    }
    RSB_LOG_INFO("Realtime", "client connected fd=%d subscribers=%zu",
                 client.Fd(), channel_.SubscriberCount());

    uint64_t delivered = 0U;
    uint64_t dropped = 0U;
    const char* reason = "server stopping";
    char chunk[4096];
    TelemetryEvent ev;

    while (running_.load(std::memory_order_relaxed)) {
      const RecvResult rr = sub.Recv(ev, kPollIntervalMs);
      if (rr.status == RecvStatus::kOk) {
        const std::string text = nlohmann::json(ev).dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!client.SendAll(ws::EncodeFrame(ws::Opcode::kText, text)).has_value()) {
          reason = "send failed";
          break;
        }
        ++delivered;
      } else if (rr.status == RecvStatus::kLagged) {
        dropped += rr.skipped;
        RSB_LOG_DEBUG("Realtime", "subscriber lagged, skipped=%llu",
                      static_cast<unsigned long long>(rr.skipped));
      } else if (rr.status == RecvStatus::kClosed) {
        (void)client.SendAll(ws::EncodeFrame(ws::Opcode::kClose, std::string()));
        reason = "channel closed";
        break;
      }

      // Inbound: only close and ping matter.
      auto readable = client.WaitReadable(0U);
      if (!readable.has_value()) {
        reason = "poll failed";
        break;
      }
      if (readable.value()) {
        auto n = client.Recv(chunk, sizeof(chunk));
        if (!n.has_value() || n.value() == 0U) {
          reason = n.has_value() ? "peer eof" : "recv failed";
          break;
        }
        pending.append(chunk, n.value());
      }
      if (!DrainInbound(client, pending, reason)) break;
    }

    RSB_LOG_INFO("Realtime", "client disconnected (%s) delivered=%llu dropped=%llu",
                 reason, static_cast<unsigned long long>(delivered),
                 static_cast<unsigned long long>(dropped));
  }

  /// @return false when the connection must end.
  static bool DrainInbound(net::TcpClient& client, std::string& pending,
                           const char*& reason) {
    for (;;) {
      ws::Frame frame;
      size_t consumed = 0U;
      const ws::FrameStatus st = ws::TryParseFrame(pending, frame, consumed);
      if (st == ws::FrameStatus::kIncomplete) return true;
      if (st == ws::FrameStatus::kProtocolError) {
        // Cannot resynchronize inside a broken stream; drop what we have.
        pending.clear();
        return true;
      }
      pending.erase(0, consumed);
      if (frame.opcode == ws::Opcode::kClose) {
        (void)client.SendAll(ws::EncodeFrame(ws::Opcode::kClose, frame.payload));
        reason = "peer close";
        return false;
      }
      if (frame.opcode == ws::Opcode::kPing) {
        if (!client.SendAll(ws::EncodeFrame(ws::Opcode::kPong, frame.payload))
                 .has_value()) {
          reason = "send failed";
          return false;
        }
      }
    }
  }

  // ------------------------------------------------------------------
  // Handlers
  // ------------------------------------------------------------------

  static HttpResponse Preflight(const HttpRequest& req) {
    HttpResponse r;
    r.status = 204;
    r.headers.emplace_back("Access-Control-Allow-Methods", "GET, OPTIONS");
    const std::string* asked = req.Header("Access-Control-Request-Headers");
    r.headers.emplace_back("Access-Control-Allow-Headers",
                           (asked != nullptr) ? *asked : std::string("*"));
    r.headers.emplace_back("Access-Control-Max-Age", "86400");
    return r;
  }

  HttpResponse History(const std::string& device_uid, const std::string& query) {
    const auto params = ParseQueryString(query);

    HistoryQuery q;
    q.device_uid = device_uid;
    if (auto limit = FindQueryParam(params, "limit")) {
      auto parsed = ParseLimit(*limit);
      if (!parsed.has_value()) {
        return HttpResponse::Text(400, "Invalid limit: " + *limit);
      }
      q.limit = *parsed;
    }
    if (auto start = FindQueryParam(params, "start")) {
      q.start = ParseRfc3339(*start);
      if (!q.start.has_value()) {
        return HttpResponse::Text(400, "Invalid timestamp: " + *start);
      }
    }
    if (auto end = FindQueryParam(params, "end")) {
      q.end = ParseRfc3339(*end);
      if (!q.end.has_value()) {
        return HttpResponse::Text(400, "Invalid timestamp: " + *end);
      }
    }

    auto rows = store_.Query(q);
    if (!rows.has_value()) {
      RSB_LOG_ERROR("Http", "history query failed: %s",
                    rows.get_error().message.c_str());
      return HttpResponse::Text(500, rows.get_error().message);
    }

    nlohmann::json body = nlohmann::json::object();
    body["device_uid"] = device_uid;
    body["points"] = nlohmann::json::array();
    for (const HistorySample& s : rows.value()) {
      body["points"].push_back(nlohmann::json(s));
    }
    return HttpResponse::Json(
        200, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  }

  /// Integer text clamped into [1, kMaxHistoryLimit]; nullopt if not a number.
  static optional<uint32_t> ParseLimit(const std::string& text) {
    if (text.empty()) return std::nullopt;
    size_t i = (text[0] == '-' || text[0] == '+') ? 1U : 0U;
    if (i == text.size()) return std::nullopt;
    for (size_t k = i; k < text.size(); ++k) {
      if (text[k] < '0' || text[k] > '9') return std::nullopt;
    }
    errno = 0;
    const long long v = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
      return (text[0] == '-') ? 1U : kMaxHistoryLimit;
    }
    return ClampHistoryLimit(v);
  }

  /// "/api/x/" -> {"api", "x"}; empty segments other than interior ones dropped.
  static std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> out;
    size_t start = (!path.empty() && path[0] == '/') ? 1U : 0U;
    while (start < path.size()) {
      size_t slash = path.find('/', start);
      if (slash == std::string::npos) slash = path.size();
      out.push_back(path.substr(start, slash - start));
      start = slash + 1;
    }
    return out;
  }

  TelemetryServerConfig cfg_;
  HistoryStore store_;
  BroadcastChannel<TelemetryEvent> channel_;
  net::TcpServer listener_;
  std::thread accept_thread_;
  std::vector<std::unique_ptr<Session>> sessions_;
  std::atomic<bool> running_{false};
};

}  // namespace rsb

#endif  // RSB_TELEMETRY_SERVER_HPP_
