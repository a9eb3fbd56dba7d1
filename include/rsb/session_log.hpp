/**
 * @file session_log.hpp
 * @brief Persist a finished UI session log to disk with a fallback path.
 */

#ifndef RSB_SESSION_LOG_HPP_
#define RSB_SESSION_LOG_HPP_

#include "rsb/log.hpp"
#include "rsb/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

namespace rsb {

static constexpr const char kPreferredSessionLogPath[] = "/home/pi/logs/rs485.log";

struct SessionLogPaths {
  std::string preferred = kPreferredSessionLogPath;
  std::string fallback;  ///< Empty: no fallback
};

/// @brief $HOME/logs/rs485.log, or empty when HOME is unset.
inline std::string DefaultFallbackLogPath() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') return std::string();
  return (std::filesystem::path(home) / "logs" / "rs485.log").string();
}

inline SessionLogPaths DefaultSessionLogPaths() {
  SessionLogPaths p;
  p.fallback = DefaultFallbackLogPath();
  return p;
}

namespace detail {

/// Create parent directories and replace the file contents.
inline expected<void, std::string> WriteWholeFile(const std::string& path,
                                                  const std::string& contents) {
  namespace fs = std::filesystem;
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) return expected<void, std::string>::error(ec.message());
  }

  FILE* fp = std::fopen(path.c_str(), "wb");
  if (fp == nullptr) {
    return expected<void, std::string>::error(std::strerror(errno));
  }
  const size_t n = std::fwrite(contents.data(), 1, contents.size(), fp);
  const int write_err = (n != contents.size()) ? errno : 0;
  if (std::fclose(fp) != 0 && write_err == 0) {
    return expected<void, std::string>::error(std::strerror(errno));
  }
  if (write_err != 0) {
    return expected<void, std::string>::error(std::strerror(write_err));
  }
  return expected<void, std::string>::success();
}

}  // namespace detail

/**
 * @brief Write @p contents to the preferred path, else to the fallback.
 * @return The path written, or the preferred path's error message when
 *         both attempts fail.
 */
inline expected<std::string, std::string> SaveSessionLog(
    const std::string& contents,
    const SessionLogPaths& paths = DefaultSessionLogPaths()) {
  auto first = detail::WriteWholeFile(paths.preferred, contents);
  if (first.has_value()) {
    RSB_LOG_INFO("SessionLog", "saved %zu bytes to %s", contents.size(),
                 paths.preferred.c_str());
    return expected<std::string, std::string>::success(paths.preferred);
  }
  RSB_LOG_WARN("SessionLog", "write %s failed: %s", paths.preferred.c_str(),
               first.get_error().c_str());

  if (!paths.fallback.empty() && paths.fallback != paths.preferred) {
    auto second = detail::WriteWholeFile(paths.fallback, contents);
    if (second.has_value()) {
      RSB_LOG_INFO("SessionLog", "saved %zu bytes to fallback %s",
                   contents.size(), paths.fallback.c_str());
      return expected<std::string, std::string>::success(paths.fallback);
    }
    RSB_LOG_ERROR("SessionLog", "fallback %s failed: %s",
                  paths.fallback.c_str(), second.get_error().c_str());
  }
  return expected<std::string, std::string>::error(first.get_error());
}

}  // namespace rsb

#endif  // RSB_SESSION_LOG_HPP_
