/**
 * @file serial_session.hpp
 * @brief Exclusive session over one serial device: list, open, close,
 *        read and write with text/hex encoding.
 *
 * A SerialSession holds at most one open SerialDevice. All operations take
 * the session mutex; every I/O inside the lock is bounded by the device
 * timeout, so no caller can wedge the session indefinitely.
 */

#ifndef RSB_SERIAL_SESSION_HPP_
#define RSB_SERIAL_SESSION_HPP_

#include "rsb/byte_codec.hpp"
#include "rsb/log.hpp"
#include "rsb/serial_device.hpp"
#include "rsb/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace rsb {

static constexpr uint32_t kMinSerialTimeoutMs = 100U;
static constexpr size_t kDefaultReadMaxBytes = 1024U;

/// @brief Port settings as requested by the UI.
struct SerialPortConfig {
  std::string port;
  uint32_t baud = 115200U;
  std::string parity = "None";
  std::string stop_bits = "1";
  uint8_t data_bits = 8U;
  uint32_t read_timeout_ms = 100U;
  uint32_t write_timeout_ms = 100U;
};

/// @brief Effective settings of the open device.
struct SerialStatus {
  std::string port;
  uint32_t baud = 0U;
  std::string parity;
  std::string stop_bits;
  uint8_t data_bits = 0U;
  uint32_t timeout_ms = 0U;
  int64_t fd = -1;
  optional<int64_t> handle;  ///< Windows HANDLE; never set on POSIX
};

struct SerialReadResult {
  size_t len = 0U;
  std::string text;
  std::string hex;
};

/// @brief Directories scanned by ListPorts(); overridable for tests.
struct SerialScanRoots {
  std::string sysfs_tty = "/sys/class/tty";
  std::string dev = "/dev";
  std::string by_id = "/dev/serial/by-id";
};

// ============================================================================
// JSON shapes
// ============================================================================

inline void to_json(nlohmann::json& j, const SerialStatus& s) {
  j = nlohmann::json{{"port", s.port},          {"baud", s.baud},
                     {"parity", s.parity},      {"stopBits", s.stop_bits},
                     {"dataBits", s.data_bits}, {"timeoutMs", s.timeout_ms},
                     {"fd", s.fd}};
  if (s.handle.has_value()) {
    j["handle"] = *s.handle;
  } else {
    j["handle"] = nullptr;
  }
}

inline void to_json(nlohmann::json& j, const SerialReadResult& r) {
  j = nlohmann::json{{"len", r.len}, {"text", r.text}, {"hex", r.hex}};
}

namespace detail {

inline std::string TrimCopy(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && IsSpace(s[b])) ++b;
  while (e > b && IsSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

inline bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

}  // namespace detail

// ============================================================================
// SerialSession
// ============================================================================

class SerialSession {
 public:
  explicit SerialSession(std::unique_ptr<SerialDeviceOpener> opener,
                         SerialScanRoots roots = SerialScanRoots())
      : opener_(std::move(opener)), roots_(std::move(roots)) {}

  ~SerialSession() { Close(); }

  SerialSession(const SerialSession&) = delete;
  SerialSession& operator=(const SerialSession&) = delete;

  /**
   * @brief Enumerate candidate device paths. Never fails; unreadable
   *        directories contribute nothing.
   * @return Deduplicated, lexicographically sorted paths.
   */
  std::vector<std::string> ListPorts() const {
    namespace fs = std::filesystem;
    std::set<std::string> found;
    std::error_code ec;

    // sysfs: an entry backed by real hardware has a "device" link.
    for (fs::directory_iterator it(roots_.sysfs_tty, ec), end; !ec && it != end;
         it.increment(ec)) {
      std::error_code link_ec;
      if (fs::exists(it->path() / "device", link_ec)) {
        found.insert((fs::path(roots_.dev) / it->path().filename()).string());
      }
    }

    ec.clear();
    for (fs::directory_iterator it(roots_.dev, ec), end; !ec && it != end;
         it.increment(ec)) {
      const std::string name = it->path().filename().string();
      if (detail::StartsWith(name, "ttyUSB") ||
          detail::StartsWith(name, "ttyACM")) {
        found.insert(it->path().string());
      }
    }

    ec.clear();
    for (fs::directory_iterator it(roots_.by_id, ec), end; !ec && it != end;
         it.increment(ec)) {
      std::error_code sym_ec;
      if (!it->is_symlink(sym_ec)) continue;
      fs::path target = fs::read_symlink(it->path(), sym_ec);
      if (sym_ec) continue;
      if (target.is_relative()) {
        target = it->path().parent_path() / target;
      }
      std::error_code canon_ec;
      fs::path canonical = fs::canonical(target, canon_ec);
      found.insert(canon_ec ? target.lexically_normal().string()
                            : canonical.string());
    }

    RSB_LOG_DEBUG("Serial", "list ports found=%zu", found.size());
    return std::vector<std::string>(found.begin(), found.end());
  }

  /**
   * @brief Validate @p cfg, close any open device, then open the new one.
   *
   * Validation failures leave the current session untouched.
   */
  expected<SerialStatus, SerialFailure> Open(const SerialPortConfig& cfg) {
    using Result = expected<SerialStatus, SerialFailure>;

    SerialLineConfig line;
    line.path = detail::TrimCopy(cfg.port);
    if (line.path.empty()) {
      return Result::error(detail::MakeSerialFailure(SerialError::kInvalidConfig,
                                                     "Port is required"));
    }
    if (cfg.parity == "None") {
      line.parity = Parity::kNone;
    } else if (cfg.parity == "Even") {
      line.parity = Parity::kEven;
    } else if (cfg.parity == "Odd") {
      line.parity = Parity::kOdd;
    } else {
      return Result::error(detail::MakeSerialFailure(
          SerialError::kInvalidConfig, "Unsupported parity: " + cfg.parity));
    }
    if (cfg.stop_bits == "1") {
      line.stop_bits = 1U;
    } else if (cfg.stop_bits == "2") {
      line.stop_bits = 2U;
    } else {
      return Result::error(
          detail::MakeSerialFailure(SerialError::kInvalidConfig,
                                    "Unsupported stop bits: " + cfg.stop_bits));
    }
    if (cfg.data_bits < 5U || cfg.data_bits > 8U) {
      return Result::error(detail::MakeSerialFailure(
          SerialError::kInvalidConfig,
          "Unsupported data bits: " + std::to_string(cfg.data_bits)));
    }
    line.data_bits = cfg.data_bits;
    line.baud_rate = cfg.baud;
    line.timeout_ms = std::max(std::max(cfg.read_timeout_ms,
                                        cfg.write_timeout_ms),
                               kMinSerialTimeoutMs);

    RSB_LOG_INFO("Serial", "open requested port=%s baud=%u parity=%s",
                 line.path.c_str(), line.baud_rate, cfg.parity.c_str());

    std::lock_guard<std::mutex> lock(mutex_);
    if (device_) {
      RSB_LOG_INFO("Serial", "closing previous port=%s",
                   device_->Line().path.c_str());
      device_.reset();
    }

    auto opened = opener_->Open(line);
    if (!opened.has_value()) {
      RSB_LOG_ERROR("Serial", "open failed port=%s: %s", line.path.c_str(),
                    opened.get_error().message.c_str());
      return Result::error(opened.get_error());
    }
    device_ = std::move(opened.value());

    SerialStatus status;
    status.port = line.path;
    status.baud = line.baud_rate;
    status.parity = cfg.parity;
    status.stop_bits = cfg.stop_bits;
    status.data_bits = line.data_bits;
    status.timeout_ms = line.timeout_ms;
    status.fd = device_->RawHandle();
    RSB_LOG_INFO("Serial", "open ok port=%s fd=%lld", status.port.c_str(),
                 static_cast<long long>(status.fd));
    return Result::success(std::move(status));
  }

  /// @brief Release the device if any. Idempotent.
  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (device_) {
      RSB_LOG_INFO("Serial", "close ok port=%s", device_->Line().path.c_str());
      device_.reset();
    }
  }

  bool IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_ != nullptr;
  }

  /**
   * @brief Encode @p data ("hex" or text) and write it fully, then drain.
   * @return Number of bytes written.
   */
  expected<size_t, SerialFailure> Write(const std::string& data,
                                        const std::string& format) {
    using Result = expected<size_t, SerialFailure>;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!device_) {
      return Result::error(detail::MakeSerialFailure(SerialError::kNotOpen,
                                                     "Serial port not open"));
    }

    std::vector<uint8_t> bytes;
    if (format == "hex") {
      auto decoded = DecodeHex(data);
      if (!decoded.has_value()) {
        return Result::error(detail::MakeSerialFailure(
            SerialError::kInvalidData, HexErrorMessage(decoded.get_error())));
      }
      bytes = std::move(decoded.value());
    } else {
      bytes.assign(data.begin(), data.end());
    }

    auto wr = device_->Write(bytes.data(), bytes.size());
    if (!wr.has_value()) {
      RSB_LOG_ERROR("Serial", "write failed: %s",
                    wr.get_error().message.c_str());
      return wr;
    }
    auto fl = device_->Flush();
    if (!fl.has_value()) {
      RSB_LOG_ERROR("Serial", "flush failed: %s",
                    fl.get_error().message.c_str());
      return Result::error(fl.get_error());
    }
    RSB_LOG_DEBUG("Serial", "write ok bytes=%zu", bytes.size());
    return Result::success(bytes.size());
  }

  /// @brief One bounded read of at most @p max_bytes. Timeout yields len 0.
  expected<SerialReadResult, SerialFailure> Read(
      size_t max_bytes = kDefaultReadMaxBytes) {
    using Result = expected<SerialReadResult, SerialFailure>;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!device_) {
      return Result::error(detail::MakeSerialFailure(SerialError::kNotOpen,
                                                     "Serial port not open"));
    }

    std::vector<uint8_t> buf(max_bytes);
    auto rd = device_->Read(buf.data(), buf.size());
    if (!rd.has_value()) {
      if (rd.get_error().code == SerialError::kTimeout) {
        return Result::success(SerialReadResult());
      }
      RSB_LOG_ERROR("Serial", "read failed: %s",
                    rd.get_error().message.c_str());
      return Result::error(rd.get_error());
    }

    SerialReadResult out;
    out.len = rd.value();
    out.text = DecodeUtf8Lossy(buf.data(), out.len);
    out.hex = EncodeHex(buf.data(), out.len);
    RSB_LOG_DEBUG("Serial", "read ok bytes=%zu", out.len);
    return Result::success(std::move(out));
  }

  const SerialScanRoots& Roots() const noexcept { return roots_; }

 private:
  std::unique_ptr<SerialDeviceOpener> opener_;
  SerialScanRoots roots_;
  mutable std::mutex mutex_;
  std::unique_ptr<SerialDevice> device_;
};

}  // namespace rsb

#endif  // RSB_SERIAL_SESSION_HPP_
