/**
 * @file bridge_config.hpp
 * @brief Typed daemon configuration assembled from a config file plus
 *        environment overrides.
 *
 * File layout (INI shown; JSON and YAML use the same section/key names):
 * @code
 *   [backend]
 *   program = python
 *   args = -m uvicorn rs485_app.main:app --host 127.0.0.1 --port 8000
 *   working_dir = ../backend
 *   port = 8000
 *
 *   [server]
 *   port = 8001
 *   database = rs485.db
 *
 *   [simulator]
 *   enabled = true
 * @endcode
 *
 * Environment overrides applied after the file: HOST and PORT (server),
 * DATABASE_URL then RS485_DATABASE_URL (plain path or sqlite://path),
 * LOG_LEVEL and APP_ENV.
 */

#ifndef RSB_BRIDGE_CONFIG_HPP_
#define RSB_BRIDGE_CONFIG_HPP_

#include "rsb/config.hpp"
#include "rsb/health_probe.hpp"
#include "rsb/log.hpp"
#include "rsb/serial_session.hpp"
#include "rsb/session_log.hpp"
#include "rsb/simulator.hpp"
#include "rsb/supervisor.hpp"
#include "rsb/telemetry_server.hpp"
#include "rsb/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace rsb {

// ============================================================================
// Sections
// ============================================================================

struct BackendSection {
  std::string program = "python";
  std::vector<std::string> args = {"-m",     "uvicorn",   "rs485_app.main:app",
                                   "--host", "127.0.0.1", "--port",
                                   "8000"};
  std::string working_dir = "../backend";
  std::string host = "127.0.0.1";
  uint16_t port = 8000U;
  std::string log_level = "INFO";
  std::string app_env = "dev";
  uint32_t probe_interval_ms = 2000U;
  uint32_t probe_timeout_ms = kDefaultProbeTimeoutMs;
  uint32_t failure_threshold = 3U;
  bool autostart = true;
};

struct ServerSection {
  std::string host = "127.0.0.1";
  uint16_t port = 8001U;
  std::string database = "rs485.db";
  uint32_t pool_size = kDefaultPoolSize;
  uint32_t channel_capacity = static_cast<uint32_t>(kDefaultBroadcastCapacity);
  uint32_t max_connections = 32U;
};

struct SerialSection {
  std::string sysfs_root = "/sys/class/tty";
  std::string dev_root = "/dev";
  std::string by_id_dir = "/dev/serial/by-id";
};

struct SimulatorSection {
  bool enabled = false;
  std::string device_id = "board-01";
  uint32_t interval_ms = 300U;
  bool record = true;  ///< Also append samples to the history store
};

struct LogSection {
  std::string level = "INFO";
  std::string preferred_path = kPreferredSessionLogPath;
  std::string fallback_path;  ///< Empty: $HOME/logs/rs485.log
};

struct BridgeConfig {
  BackendSection backend;
  ServerSection server;
  SerialSection serial;
  SimulatorSection simulator;
  LogSection log;
};

/// Environment lookup; returns nullptr for an unset variable.
using EnvLookupFn = const char* (*)(const char* name, void* ctx);

namespace detail {

inline const char* ProcessEnv(const char* name, void* /*ctx*/) {
  return std::getenv(name);
}

inline std::vector<std::string> SplitWords(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && IsSpace(s[i])) ++i;
    const size_t begin = i;
    while (i < s.size() && !IsSpace(s[i])) ++i;
    if (i > begin) out.emplace_back(s, begin, i - begin);
  }
  return out;
}

inline void ReadStr(const ConfigStore& store, const char* sec, const char* key,
                    std::string& out) {
  if (store.HasKey(sec, key)) out = store.GetString(sec, key);
}

inline void ReadU32(const ConfigStore& store, const char* sec, const char* key,
                    uint32_t& out) {
  out = store.GetUint(sec, key, out);
}

inline void ReadPort(const ConfigStore& store, const char* sec,
                     const char* key, uint16_t& out) {
  out = store.GetPort(sec, key, out);
}

inline void ReadFlag(const ConfigStore& store, const char* sec,
                     const char* key, bool& out) {
  out = store.GetBool(sec, key, out);
}

}  // namespace detail

/**
 * @brief Map a database URL to an SQLite file path.
 *
 * Accepts a plain path or `sqlite://path` (so `sqlite:///abs/x.db` is the
 * absolute path `/abs/x.db`); a trailing `?query` is dropped.
 * @return Empty string for any other scheme.
 */
inline std::string SqlitePathFromUrl(const std::string& url) {
  static constexpr const char kScheme[] = "sqlite://";
  std::string path;
  if (detail::StartsWith(url, kScheme)) {
    path = url.substr(sizeof(kScheme) - 1U);
  } else if (url.find("://") != std::string::npos) {
    return std::string();
  } else {
    path = url;
  }
  const size_t q = path.find('?');
  if (q != std::string::npos) path.erase(q);
  return path;
}

/// @brief Overlay every key present in @p store onto @p cfg.
inline void ApplyConfigStore(const ConfigStore& store, BridgeConfig& cfg) {
  BackendSection& b = cfg.backend;
  detail::ReadStr(store, "backend", "program", b.program);
  if (store.HasKey("backend", "args")) {
    b.args = detail::SplitWords(store.GetString("backend", "args"));
  }
  detail::ReadStr(store, "backend", "working_dir", b.working_dir);
  detail::ReadStr(store, "backend", "host", b.host);
  detail::ReadPort(store, "backend", "port", b.port);
  detail::ReadStr(store, "backend", "log_level", b.log_level);
  detail::ReadStr(store, "backend", "app_env", b.app_env);
  detail::ReadU32(store, "backend", "probe_interval_ms", b.probe_interval_ms);
  detail::ReadU32(store, "backend", "probe_timeout_ms", b.probe_timeout_ms);
  detail::ReadU32(store, "backend", "failure_threshold", b.failure_threshold);
  detail::ReadFlag(store, "backend", "autostart", b.autostart);

  ServerSection& s = cfg.server;
  detail::ReadStr(store, "server", "host", s.host);
  detail::ReadPort(store, "server", "port", s.port);
  detail::ReadStr(store, "server", "database", s.database);
  detail::ReadU32(store, "server", "pool_size", s.pool_size);
  detail::ReadU32(store, "server", "channel_capacity", s.channel_capacity);
  detail::ReadU32(store, "server", "max_connections", s.max_connections);

  detail::ReadStr(store, "serial", "sysfs_root", cfg.serial.sysfs_root);
  detail::ReadStr(store, "serial", "dev_root", cfg.serial.dev_root);
  detail::ReadStr(store, "serial", "by_id_dir", cfg.serial.by_id_dir);

  detail::ReadFlag(store, "simulator", "enabled", cfg.simulator.enabled);
  detail::ReadStr(store, "simulator", "device_id", cfg.simulator.device_id);
  detail::ReadU32(store, "simulator", "interval_ms", cfg.simulator.interval_ms);
  detail::ReadFlag(store, "simulator", "record", cfg.simulator.record);

  detail::ReadStr(store, "log", "level", cfg.log.level);
  detail::ReadStr(store, "log", "preferred_path", cfg.log.preferred_path);
  detail::ReadStr(store, "log", "fallback_path", cfg.log.fallback_path);
}

/**
 * @brief Apply HOST, PORT, DATABASE_URL / RS485_DATABASE_URL, LOG_LEVEL and
 *        APP_ENV.
 *
 * LOG_LEVEL sets both the daemon level and the level passed to the backend.
 * An unparsable PORT or a non-SQLite database URL is ignored with a warning.
 */
inline void ApplyEnvironment(BridgeConfig& cfg,
                             EnvLookupFn lookup = &detail::ProcessEnv,
                             void* ctx = nullptr) {
  const char* v = lookup("HOST", ctx);
  if (v != nullptr && *v != '\0') cfg.server.host = v;

  v = lookup("PORT", ctx);
  if (v != nullptr && *v != '\0') {
    char* end = nullptr;
    const long port = std::strtol(v, &end, 10);
    if (end != v && *end == '\0' && port >= 0 && port <= 65535) {
      cfg.server.port = static_cast<uint16_t>(port);
    } else {
      RSB_LOG_WARN("Config", "ignoring invalid PORT '%s'", v);
    }
  }

  v = lookup("DATABASE_URL", ctx);
  if (v == nullptr || *v == '\0') v = lookup("RS485_DATABASE_URL", ctx);
  if (v != nullptr && *v != '\0') {
    const std::string path = SqlitePathFromUrl(v);
    if (!path.empty()) {
      cfg.server.database = path;
    } else {
      RSB_LOG_WARN("Config", "ignoring non-sqlite database url");
    }
  }

  v = lookup("LOG_LEVEL", ctx);
  if (v != nullptr && *v != '\0') {
    cfg.log.level = v;
    cfg.backend.log_level = v;
  }

  v = lookup("APP_ENV", ctx);
  if (v != nullptr && *v != '\0') cfg.backend.app_env = v;
}

/**
 * @brief Defaults, then @p path (if non-null), then the environment.
 * @return The loader's error when the file cannot be read or parsed.
 */
inline expected<BridgeConfig, ConfigError> LoadBridgeConfig(
    const char* path, EnvLookupFn lookup = &detail::ProcessEnv,
    void* ctx = nullptr) {
  BridgeConfig cfg;
  if (path != nullptr) {
    MultiConfig store;
    auto r = store.LoadFile(path);
    if (!r.has_value()) {
      return expected<BridgeConfig, ConfigError>::error(r.get_error());
    }
    ApplyConfigStore(store, cfg);
  }
  ApplyEnvironment(cfg, lookup, ctx);
  return expected<BridgeConfig, ConfigError>::success(std::move(cfg));
}

// ============================================================================
// Component views
// ============================================================================

inline SupervisorConfig ToSupervisorConfig(const BridgeConfig& cfg) {
  SupervisorConfig out;
  out.argv.push_back(cfg.backend.program);
  out.argv.insert(out.argv.end(), cfg.backend.args.begin(),
                  cfg.backend.args.end());
  out.working_dir = cfg.backend.working_dir;
  out.env = {{"HOST", cfg.backend.host},
             {"PORT", std::to_string(cfg.backend.port)},
             {"LOG_LEVEL", cfg.backend.log_level},
             {"APP_ENV", cfg.backend.app_env}};
  out.probe_host = cfg.backend.host;
  out.probe_port = cfg.backend.port;
  out.probe_interval_ms = cfg.backend.probe_interval_ms;
  out.probe_timeout_ms = cfg.backend.probe_timeout_ms;
  out.failure_threshold = cfg.backend.failure_threshold;
  return out;
}

inline TelemetryServerConfig ToServerConfig(const BridgeConfig& cfg) {
  TelemetryServerConfig out;
  out.host = cfg.server.host;
  out.port = cfg.server.port;
  out.database = cfg.server.database;
  out.pool_size = cfg.server.pool_size;
  out.channel_capacity = cfg.server.channel_capacity;
  out.max_connections = cfg.server.max_connections;
  return out;
}

inline SerialScanRoots ToScanRoots(const BridgeConfig& cfg) {
  SerialScanRoots out;
  out.sysfs_tty = cfg.serial.sysfs_root;
  out.dev = cfg.serial.dev_root;
  out.by_id = cfg.serial.by_id_dir;
  return out;
}

inline SimulatorConfig ToSimulatorConfig(const BridgeConfig& cfg) {
  SimulatorConfig out;
  out.device_id = cfg.simulator.device_id;
  out.interval_ms = cfg.simulator.interval_ms;
  return out;
}

inline SessionLogPaths ToSessionLogPaths(const BridgeConfig& cfg) {
  SessionLogPaths out;
  out.preferred = cfg.log.preferred_path;
  out.fallback = cfg.log.fallback_path.empty() ? DefaultFallbackLogPath()
                                               : cfg.log.fallback_path;
  return out;
}

}  // namespace rsb

#endif  // RSB_BRIDGE_CONFIG_HPP_
