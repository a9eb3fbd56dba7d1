/**
 * @file serial_device.hpp
 * @brief Serial device capability {read, write, flush, raw handle} and its
 *        POSIX termios implementation.
 *
 * The session manager only sees SerialDevice / SerialDeviceOpener; the
 * platform implementation is chosen once when the opener is constructed.
 *
 * Timeouts: every Read/Write waits at most the configured timeout using
 * poll(2) on a non-blocking descriptor. A read that sees no data within
 * the timeout returns 0 bytes, not an error.
 */

#ifndef RSB_SERIAL_DEVICE_HPP_
#define RSB_SERIAL_DEVICE_HPP_

#include "rsb/platform.hpp"
#include "rsb/vocabulary.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <string>

#if defined(RSB_PLATFORM_POSIX)
#include <fcntl.h>
#include <poll.h>
#include <sys/time.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace rsb {

// ============================================================================
// Serial Error
// ============================================================================

enum class SerialError : uint8_t {
  kInvalidConfig = 0,  ///< Rejected before touching any device
  kNotOpen,
  kOpenFailed,
  kConfigFailed,       ///< termios rejected the settings
  kWriteFailed,
  kReadFailed,
  kFlushFailed,
  kTimeout,
  kInvalidData,        ///< Malformed hex payload
  kInternal,
};

/// @brief Error code plus the human-readable text shown to the UI.
struct SerialFailure {
  SerialError code = SerialError::kInternal;
  std::string message;
};

enum class Parity : uint8_t {
  kNone = 0,
  kOdd = 1,
  kEven = 2,
};

/// @brief Effective line settings handed to a device opener.
struct SerialLineConfig {
  std::string path;
  uint32_t baud_rate = 115200U;
  Parity parity = Parity::kNone;
  uint8_t stop_bits = 1U;
  uint8_t data_bits = 8U;
  uint32_t timeout_ms = 100U;
};

namespace detail {

inline SerialFailure MakeSerialFailure(SerialError code, std::string msg) {
  SerialFailure f;
  f.code = code;
  f.message = std::move(msg);
  return f;
}

inline SerialFailure ErrnoFailure(SerialError code, int err) {
  return MakeSerialFailure(code, std::strerror(err));
}

/// poll(2) timeout for the time left until @p deadline_ms, saturated at
/// INT_MAX so a large device timeout never becomes an infinite wait.
inline int PollBudgetMs(uint64_t deadline_ms, uint64_t now_ms) noexcept {
  if (now_ms >= deadline_ms) return 0;
  return static_cast<int>(std::min<uint64_t>(
      deadline_ms - now_ms,
      static_cast<uint64_t>(std::numeric_limits<int>::max())));
}

}  // namespace detail

// ============================================================================
// SerialDevice - open device capability
// ============================================================================

class SerialDevice {
 public:
  virtual ~SerialDevice() = default;

  /// @brief Single bounded read. 0 bytes on timeout.
  virtual expected<size_t, SerialFailure> Read(uint8_t* buf, size_t len) = 0;

  /// @brief Write the whole buffer or fail.
  virtual expected<size_t, SerialFailure> Write(const uint8_t* data,
                                                size_t len) = 0;

  /// @brief Block until queued output has been transmitted.
  virtual expected<void, SerialFailure> Flush() = 0;

  /// @brief OS descriptor for diagnostics only (fd on POSIX).
  virtual int64_t RawHandle() const = 0;

  virtual const SerialLineConfig& Line() const = 0;
};

class SerialDeviceOpener {
 public:
  virtual ~SerialDeviceOpener() = default;

  virtual expected<std::unique_ptr<SerialDevice>, SerialFailure> Open(
      const SerialLineConfig& cfg) = 0;
};

#if defined(RSB_PLATFORM_POSIX)

// ============================================================================
// PosixSerialDevice
// ============================================================================

class PosixSerialDevice final : public SerialDevice {
 public:
  ~PosixSerialDevice() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  PosixSerialDevice(const PosixSerialDevice&) = delete;
  PosixSerialDevice& operator=(const PosixSerialDevice&) = delete;

  /**
   * @brief Open and configure @p cfg.path in raw mode.
   */
  static expected<std::unique_ptr<SerialDevice>, SerialFailure> Open(
      const SerialLineConfig& cfg) {
    using Result = expected<std::unique_ptr<SerialDevice>, SerialFailure>;

    speed_t speed;
    if (!BaudToSpeed(cfg.baud_rate, speed)) {
      return Result::error(detail::MakeSerialFailure(
          SerialError::kConfigFailed,
          "Unsupported baud rate: " + std::to_string(cfg.baud_rate)));
    }

    int fd = ::open(cfg.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
      return Result::error(
          detail::ErrnoFailure(SerialError::kOpenFailed, errno));
    }

    std::unique_ptr<PosixSerialDevice> dev(new PosixSerialDevice(fd, cfg));
    auto r = dev->ConfigurePort(speed);
    if (!r.has_value()) {
      return Result::error(r.get_error());
    }
    return Result::success(std::unique_ptr<SerialDevice>(std::move(dev)));
  }

  expected<size_t, SerialFailure> Read(uint8_t* buf, size_t len) override {
    if (len == 0) return expected<size_t, SerialFailure>::success(0U);

    auto ready = WaitFor(POLLIN);
    if (!ready.has_value()) {
      return expected<size_t, SerialFailure>::error(ready.get_error());
    }
    if (!ready.value()) return expected<size_t, SerialFailure>::success(0U);

    for (;;) {
      const ssize_t n = ::read(fd_, buf, len);
      if (n >= 0) {
        return expected<size_t, SerialFailure>::success(static_cast<size_t>(n));
      }
      const int err = errno;
      if (err == EINTR) continue;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        return expected<size_t, SerialFailure>::success(0U);
      }
      return expected<size_t, SerialFailure>::error(
          detail::ErrnoFailure(SerialError::kReadFailed, err));
    }
  }

  expected<size_t, SerialFailure> Write(const uint8_t* data,
                                        size_t len) override {
    size_t written = 0U;
    while (written < len) {
      const ssize_t n = ::write(fd_, data + written, len - written);
      if (n > 0) {
        written += static_cast<size_t>(n);
        continue;
      }
      const int err = (n < 0) ? errno : EAGAIN;
      if (err == EINTR) continue;
      if (err != EAGAIN && err != EWOULDBLOCK) {
        return expected<size_t, SerialFailure>::error(
            detail::ErrnoFailure(SerialError::kWriteFailed, err));
      }
      // Output queue full: wait for room, bounded by the port timeout.
      auto ready = WaitFor(POLLOUT);
      if (!ready.has_value()) {
        return expected<size_t, SerialFailure>::error(ready.get_error());
      }
      if (!ready.value()) {
        return expected<size_t, SerialFailure>::error(detail::MakeSerialFailure(
            SerialError::kTimeout, "Operation timed out"));
      }
    }
    return expected<size_t, SerialFailure>::success(written);
  }

  expected<void, SerialFailure> Flush() override {
    while (::tcdrain(fd_) != 0) {
      if (errno != EINTR) {
        return expected<void, SerialFailure>::error(
            detail::ErrnoFailure(SerialError::kFlushFailed, errno));
      }
    }
    return expected<void, SerialFailure>::success();
  }

  int64_t RawHandle() const override { return static_cast<int64_t>(fd_); }

  const SerialLineConfig& Line() const override { return cfg_; }

  // ------------------------------------------------------------------
  // Baud table
  // ------------------------------------------------------------------

  /// @brief Map a numeric baud rate to its termios constant.
  /// @return false for rates termios cannot express.
  static bool BaudToSpeed(uint32_t baud, speed_t& out) noexcept {
    switch (baud) {
      case 1200U:
        out = B1200;
        return true;
      case 2400U:
        out = B2400;
        return true;
      case 4800U:
        out = B4800;
        return true;
      case 9600U:
        out = B9600;
        return true;
      case 19200U:
        out = B19200;
        return true;
      case 38400U:
        out = B38400;
        return true;
      case 57600U:
        out = B57600;
        return true;
      case 115200U:
        out = B115200;
        return true;
      case 230400U:
        out = B230400;
        return true;
#ifdef B460800
      case 460800U:
        out = B460800;
        return true;
#endif
#ifdef B921600
      case 921600U:
        out = B921600;
        return true;
#endif
      default:
        return false;
    }
  }

 private:
  PosixSerialDevice(int fd, const SerialLineConfig& cfg) : fd_(fd), cfg_(cfg) {}

  /// @brief Raw 8N1-style setup with the configured framing, no flow control.
  expected<void, SerialFailure> ConfigurePort(speed_t speed) noexcept {
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));

    if (::tcgetattr(fd_, &tio) != 0) {
      return expected<void, SerialFailure>::error(
          detail::ErrnoFailure(SerialError::kConfigFailed, errno));
    }

    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                           INLCR | IGNCR | ICRNL | IXON |
                                           IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &=
        static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
#ifdef CRTSCTS
    tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

    switch (cfg_.data_bits) {
      case 5U:
        tio.c_cflag |= CS5;
        break;
      case 6U:
        tio.c_cflag |= CS6;
        break;
      case 7U:
        tio.c_cflag |= CS7;
        break;
      default:
        tio.c_cflag |= CS8;
        break;
    }

    if (cfg_.parity == Parity::kOdd) {
      tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD);
    } else if (cfg_.parity == Parity::kEven) {
      tio.c_cflag |= PARENB;
    }

    if (cfg_.stop_bits == 2U) {
      tio.c_cflag |= CSTOPB;
    }

    // Reads are bounded by poll(2), not by the line discipline.
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
      return expected<void, SerialFailure>::error(
          detail::ErrnoFailure(SerialError::kConfigFailed, errno));
    }

    ::tcflush(fd_, TCIOFLUSH);
    return expected<void, SerialFailure>::success();
  }

  /// @return true when @p events became ready, false on timeout.
  expected<bool, SerialFailure> WaitFor(short events) {
    const uint64_t deadline = NowMs() + cfg_.timeout_ms;
    for (;;) {
      const uint64_t now = NowMs();
      const int remaining = detail::PollBudgetMs(deadline, now);
      struct pollfd pfd;
      pfd.fd = fd_;
      pfd.events = events;
      pfd.revents = 0;
      const int rc = ::poll(&pfd, 1, remaining);
      if (rc > 0) {
        if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
          return expected<bool, SerialFailure>::error(detail::MakeSerialFailure(
              (events == POLLIN) ? SerialError::kReadFailed
                                 : SerialError::kWriteFailed,
              "Device reported an error condition"));
        }
        return expected<bool, SerialFailure>::success(true);
      }
      if (rc == 0) return expected<bool, SerialFailure>::success(false);
      if (errno != EINTR) {
        return expected<bool, SerialFailure>::error(detail::ErrnoFailure(
            (events == POLLIN) ? SerialError::kReadFailed
                               : SerialError::kWriteFailed,
            errno));
      }
    }
  }

  static uint64_t NowMs() noexcept {
    struct timespec ts;
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000U +
           static_cast<uint64_t>(ts.tv_nsec) / 1000000U;
  }

  // ------------------------------------------------------------------
  // Data members (Google C++ Style: snake_case_ with trailing underscore)
  // ------------------------------------------------------------------

  int fd_;
  SerialLineConfig cfg_;
};

/// @brief Opener producing PosixSerialDevice instances.
class PosixSerialOpener final : public SerialDeviceOpener {
 public:
  expected<std::unique_ptr<SerialDevice>, SerialFailure> Open(
      const SerialLineConfig& cfg) override {
    return PosixSerialDevice::Open(cfg);
  }
};

#endif  // RSB_PLATFORM_POSIX

}  // namespace rsb

#endif  // RSB_SERIAL_DEVICE_HPP_
