/**
 * @file log.hpp
 * @brief Synchronous printf-style leveled logging to stderr.
 *
 * Two filter stages:
 *   - compile time: RSB_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL) removes calls
 *   - run time:     log::SetLevel() gates what reaches the sink
 *
 * Output format:
 *   [2024-01-01 12:00:00.123] [INFO] [Serial] open ok port=/dev/ttyUSB0 (serial_session.hpp:120)
 *
 * Writes are serialized by a process-wide mutex so lines from concurrent
 * threads never interleave.
 */

#ifndef RSB_LOG_HPP_
#define RSB_LOG_HPP_

#include "rsb/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <sys/time.h>

#ifndef RSB_LOG_MIN_LEVEL
#ifdef NDEBUG
#define RSB_LOG_MIN_LEVEL 1
#else
#define RSB_LOG_MIN_LEVEL 0
#endif
#endif

namespace rsb {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

#ifdef NDEBUG
static constexpr Level kDefaultLevel = Level::kInfo;
#else
static constexpr Level kDefaultLevel = Level::kDebug;
#endif

inline std::atomic<Level>& LogLevelRef() noexcept {
  static std::atomic<Level> level{kDefaultLevel};
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& SinkMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "";
  const char* last = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') last = p + 1;
  }
  return last;
}

inline bool TagEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'a' && *a <= 'z') ? static_cast<char>(*a - 32) : *a;
    char lb = (*b >= 'a' && *b <= 'z') ? static_cast<char>(*b - 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Level control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Map a level name ("debug", "INFO", "warning", ...) to a Level.
 * @return @p fallback when the name is not recognized.
 */
inline Level LevelFromString(const char* name, Level fallback) noexcept {
  if (name == nullptr) return fallback;
  if (detail::TagEqual(name, "DEBUG") || detail::TagEqual(name, "TRACE"))
    return Level::kDebug;
  if (detail::TagEqual(name, "INFO")) return Level::kInfo;
  if (detail::TagEqual(name, "WARN") || detail::TagEqual(name, "WARNING"))
    return Level::kWarn;
  if (detail::TagEqual(name, "ERROR")) return Level::kError;
  if (detail::TagEqual(name, "FATAL") || detail::TagEqual(name, "CRITICAL"))
    return Level::kFatal;
  if (detail::TagEqual(name, "OFF")) return Level::kOff;
  return fallback;
}

inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::SinkMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel()) ||
      level == Level::kOff) {
    return;
  }

  char msg[1024];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  const time_t sec = tv.tv_sec;
  struct tm tm_buf;
  ::localtime_r(&sec, &tm_buf);
  char ts[32];
  (void)std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::lock_guard<std::mutex> lock(detail::SinkMutex());
  (void)std::fprintf(stderr, "[%s.%03d] [%s] [%s] %s (%s:%d)\n", ts,
                     static_cast<int>(tv.tv_usec / 1000),
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "-", msg,
                     detail::Basename(file), line);
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

RSB_PRINTF_FORMAT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept;

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace rsb

// ============================================================================
// Macros
// ============================================================================

#define RSB_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                 \
    if (RSB_LOG_MIN_LEVEL <= 0) {                                      \
      ::rsb::log::LogWrite(::rsb::log::Level::kDebug, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

#define RSB_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                 \
    if (RSB_LOG_MIN_LEVEL <= 1) {                                      \
      ::rsb::log::LogWrite(::rsb::log::Level::kInfo, cat, __FILE__,    \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

#define RSB_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                 \
    if (RSB_LOG_MIN_LEVEL <= 2) {                                      \
      ::rsb::log::LogWrite(::rsb::log::Level::kWarn, cat, __FILE__,    \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

#define RSB_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                 \
    if (RSB_LOG_MIN_LEVEL <= 3) {                                      \
      ::rsb::log::LogWrite(::rsb::log::Level::kError, cat, __FILE__,   \
                           __LINE__, fmt, ##__VA_ARGS__);              \
    }                                                                  \
  } while (0)

/// Logged at kFatal and flushed; the caller decides how to terminate.
#define RSB_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                 \
    ::rsb::log::LogWrite(::rsb::log::Level::kFatal, cat, __FILE__,     \
                         __LINE__, fmt, ##__VA_ARGS__);                \
  } while (0)

#endif  // RSB_LOG_HPP_
