/**
 * @file commands.hpp
 * @brief Named UI commands with JSON arguments and JSON-or-message results.
 *
 * Every command either succeeds with a JSON value or fails with a plain
 * error string for display. No command can terminate the process: an
 * exception escaping a handler becomes "Internal error: <what>".
 *
 * Line protocol (one JSON object per line):
 * @code
 *   -> {"id":1,"cmd":"read_serial_data","args":{"maxBytes":64}}
 *   <- {"id":1,"ok":true,"result":{"len":0,"text":"","hex":""}}
 *   <- {"id":2,"ok":false,"error":"Serial port not open"}
 * @endcode
 */

#ifndef RSB_COMMANDS_HPP_
#define RSB_COMMANDS_HPP_

#include "rsb/log.hpp"
#include "rsb/serial_session.hpp"
#include "rsb/session_log.hpp"
#include "rsb/supervisor.hpp"
#include "rsb/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <limits>
#include <string>
#include <vector>

namespace rsb {

using CommandResult = expected<nlohmann::json, std::string>;

namespace detail {

inline CommandResult InvalidArgument(const char* name) {
  return CommandResult::error(std::string("Invalid argument: ") + name);
}

/// Look up @p key in @p obj; nullptr when @p obj is not an object or lacks it.
inline const nlohmann::json* FindArg(const nlohmann::json& obj,
                                     const char* key) {
  if (!obj.is_object()) return nullptr;
  auto it = obj.find(key);
  return (it == obj.end()) ? nullptr : &*it;
}

/// Unsigned integer argument no larger than @p max.
inline bool ReadUnsigned(const nlohmann::json& obj, const char* key,
                         uint64_t max, uint64_t& out) {
  const nlohmann::json* v = FindArg(obj, key);
  if (v == nullptr) return false;
  uint64_t n;
  if (v->is_number_unsigned()) {
    n = v->get<uint64_t>();
  } else if (v->is_number_integer() && v->get<int64_t>() >= 0) {
    n = static_cast<uint64_t>(v->get<int64_t>());
  } else {
    return false;
  }
  if (n > max) return false;
  out = n;
  return true;
}

inline bool ReadString(const nlohmann::json& obj, const char* key,
                       std::string& out) {
  const nlohmann::json* v = FindArg(obj, key);
  if (v == nullptr || !v->is_string()) return false;
  out = v->get<std::string>();
  return true;
}

/// Absent or null counts as "not given".
inline bool IsAbsent(const nlohmann::json& obj, const char* key) {
  const nlohmann::json* v = FindArg(obj, key);
  return v == nullptr || v->is_null();
}

}  // namespace detail

// ============================================================================
// CommandRouter
// ============================================================================

class CommandRouter final {
 public:
  /**
   * @param serial Session used by the serial commands.
   * @param supervisor Backend supervisor for backend_status; may be null.
   */
  CommandRouter(SerialSession& serial, ProcessSupervisor* supervisor,
                SessionLogPaths log_paths = DefaultSessionLogPaths())
      : serial_(serial),
        supervisor_(supervisor),
        log_paths_(std::move(log_paths)) {}

  /// @brief Names accepted by Dispatch(), in table order.
  static std::vector<std::string> Names() {
    std::vector<std::string> out;
    for (const Entry& e : kTable) out.emplace_back(e.name);
    return out;
  }

  /**
   * @brief Run command @p name with @p args (an object, or null for none).
   */
  CommandResult Dispatch(const std::string& name, const nlohmann::json& args) {
    for (const Entry& e : kTable) {
      if (name == e.name) {
        try {
          return (this->*e.handler)(args);
        } catch (const std::exception& ex) {
          RSB_LOG_ERROR("Command", "%s raised: %s", e.name, ex.what());
          return CommandResult::error(std::string("Internal error: ") +
                                      ex.what());
        }
      }
    }
    RSB_LOG_WARN("Command", "unknown command '%s'", name.c_str());
    return CommandResult::error("Unknown command: " + name);
  }

  /**
   * @brief Decode one request line, dispatch it and encode the reply line
   *        (without trailing newline).
   */
  std::string HandleLine(const std::string& line) {
    nlohmann::json reply = nlohmann::json::object();
    nlohmann::json req = nlohmann::json::parse(line, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
      reply["id"] = nullptr;
      reply["ok"] = false;
      reply["error"] = "Invalid request";
      return Dump(reply);
    }

    auto id = req.find("id");
    reply["id"] = (id != req.end()) ? *id : nlohmann::json(nullptr);

    auto cmd = req.find("cmd");
    if (cmd == req.end() || !cmd->is_string()) {
      reply["ok"] = false;
      reply["error"] = "Invalid argument: cmd";
      return Dump(reply);
    }
    auto args = req.find("args");
    const nlohmann::json no_args = nlohmann::json::object();

    CommandResult r = Dispatch(cmd->get<std::string>(),
                               (args != req.end()) ? *args : no_args);
    if (r.has_value()) {
      reply["ok"] = true;
      reply["result"] = r.value();
    } else {
      reply["ok"] = false;
      reply["error"] = r.get_error();
    }
    return Dump(reply);
  }

 private:
  using Handler = CommandResult (CommandRouter::*)(const nlohmann::json&);

  struct Entry {
    const char* name;
    Handler handler;
  };

  static const Entry kTable[7];

  static std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }

  // ------------------------------------------------------------------
  // Serial
  // ------------------------------------------------------------------

  CommandResult ListSerialPorts(const nlohmann::json& /*args*/) {
    return CommandResult::success(nlohmann::json(serial_.ListPorts()));
  }

  CommandResult OpenSerialPort(const nlohmann::json& args) {
    const nlohmann::json* config = detail::FindArg(args, "config");
    if (config == nullptr || !config->is_object()) {
      return detail::InvalidArgument("config");
    }

    SerialPortConfig cfg;
    uint64_t n = 0;
    if (!detail::ReadString(*config, "port", cfg.port)) {
      return detail::InvalidArgument("config.port");
    }
    if (!detail::ReadUnsigned(*config, "baud",
                              std::numeric_limits<uint32_t>::max(), n)) {
      return detail::InvalidArgument("config.baud");
    }
    cfg.baud = static_cast<uint32_t>(n);
    if (!detail::ReadString(*config, "parity", cfg.parity)) {
      return detail::InvalidArgument("config.parity");
    }
    if (!detail::ReadString(*config, "stopBits", cfg.stop_bits)) {
      return detail::InvalidArgument("config.stopBits");
    }
    if (!detail::ReadUnsigned(*config, "dataBits", 255U, n)) {
      return detail::InvalidArgument("config.dataBits");
    }
    cfg.data_bits = static_cast<uint8_t>(n);
    if (!detail::ReadUnsigned(*config, "readTimeoutMs",
                              std::numeric_limits<uint32_t>::max(), n)) {
      return detail::InvalidArgument("config.readTimeoutMs");
    }
    cfg.read_timeout_ms = static_cast<uint32_t>(n);
    if (!detail::ReadUnsigned(*config, "writeTimeoutMs",
                              std::numeric_limits<uint32_t>::max(), n)) {
      return detail::InvalidArgument("config.writeTimeoutMs");
    }
    cfg.write_timeout_ms = static_cast<uint32_t>(n);

    auto status = serial_.Open(cfg);
    if (!status.has_value()) {
      return CommandResult::error(status.get_error().message);
    }
    return CommandResult::success(nlohmann::json(status.value()));
  }

  CommandResult CloseSerialPort(const nlohmann::json& /*args*/) {
    serial_.Close();
    return CommandResult::success(nlohmann::json(nullptr));
  }

  CommandResult WriteSerialData(const nlohmann::json& args) {
    std::string data;
    if (!detail::ReadString(args, "data", data)) {
      return detail::InvalidArgument("data");
    }
    std::string format;
    if (!detail::IsAbsent(args, "format") &&
        !detail::ReadString(args, "format", format)) {
      return detail::InvalidArgument("format");
    }

    auto written = serial_.Write(data, format);
    if (!written.has_value()) {
      return CommandResult::error(written.get_error().message);
    }
    return CommandResult::success(nlohmann::json(written.value()));
  }

  CommandResult ReadSerialData(const nlohmann::json& args) {
    uint64_t max_bytes = kDefaultReadMaxBytes;
    if (!detail::IsAbsent(args, "maxBytes") &&
        !detail::ReadUnsigned(args, "maxBytes", kMaxReadBytes, max_bytes)) {
      return detail::InvalidArgument("maxBytes");
    }

    auto rd = serial_.Read(static_cast<size_t>(max_bytes));
    if (!rd.has_value()) {
      return CommandResult::error(rd.get_error().message);
    }
    return CommandResult::success(nlohmann::json(rd.value()));
  }

  // ------------------------------------------------------------------
  // Misc
  // ------------------------------------------------------------------

  CommandResult SaveSessionLogCmd(const nlohmann::json& args) {
    std::string contents;
    if (!detail::ReadString(args, "contents", contents)) {
      return detail::InvalidArgument("contents");
    }
    auto saved = SaveSessionLog(contents, log_paths_);
    if (!saved.has_value()) {
      return CommandResult::error(saved.get_error());
    }
    return CommandResult::success(nlohmann::json(saved.value()));
  }

  CommandResult BackendStatus(const nlohmann::json& /*args*/) {
    nlohmann::json out = nlohmann::json::object();
    if (supervisor_ == nullptr) {
      out["running"] = false;
      out["state"] = SupervisorStateName(SupervisorState::kStopped);
      out["failures"] = 0;
      out["pid"] = nullptr;
      return CommandResult::success(std::move(out));
    }
    const bool running = supervisor_->IsRunning();
    out["running"] = running;
    out["state"] = SupervisorStateName(supervisor_->State());
    out["failures"] = supervisor_->ConsecutiveFailures();
    const pid_t pid = supervisor_->Pid();
    if (running && pid > 0) {
      out["pid"] = static_cast<int64_t>(pid);
    } else {
      out["pid"] = nullptr;
    }
    return CommandResult::success(std::move(out));
  }

  static constexpr uint64_t kMaxReadBytes = 1024U * 1024U;

  SerialSession& serial_;
  ProcessSupervisor* supervisor_;
  SessionLogPaths log_paths_;
};

inline const CommandRouter::Entry CommandRouter::kTable[7] = {
    {"list_serial_ports", &CommandRouter::ListSerialPorts},
    {"open_serial_port", &CommandRouter::OpenSerialPort},
    {"close_serial_port", &CommandRouter::CloseSerialPort},
    {"write_serial_data", &CommandRouter::WriteSerialData},
    {"read_serial_data", &CommandRouter::ReadSerialData},
    {"save_session_log", &CommandRouter::SaveSessionLogCmd},
    {"backend_status", &CommandRouter::BackendStatus},
};

}  // namespace rsb

#endif  // RSB_COMMANDS_HPP_
