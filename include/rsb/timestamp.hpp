/**
 * @file timestamp.hpp
 * @brief RFC 3339 parsing and formatting on a UTC microsecond timeline.
 *
 * Timestamps are int64 microseconds since 1970-01-01T00:00:00Z. The store
 * keeps them as naive UTC text "YYYY-MM-DD HH:MM:SS.ffffff", whose
 * lexicographic order equals chronological order.
 */

#ifndef RSB_TIMESTAMP_HPP_
#define RSB_TIMESTAMP_HPP_

#include "rsb/vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace rsb {

using UtcMicros = int64_t;

namespace detail {

/// Howard Hinnant's days_from_civil.
inline int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
  y -= (m <= 2) ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline void CivilFromDays(int64_t z, int64_t& y, unsigned& m,
                          unsigned& d) noexcept {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp + (mp < 10 ? 3 : -9);
  y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

inline bool IsLeap(int64_t y) noexcept {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline unsigned DaysInMonth(int64_t y, unsigned m) noexcept {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && IsLeap(y)) ? 29U : kDays[m - 1];
}

/// Read exactly @p n digits at @p pos.
inline bool ReadDigits(const std::string& s, size_t& pos, size_t n,
                       unsigned& out) noexcept {
  if (pos + n > s.size()) return false;
  unsigned v = 0;
  for (size_t i = 0; i < n; ++i) {
    const char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<unsigned>(c - '0');
  }
  pos += n;
  out = v;
  return true;
}

inline bool Expect(const std::string& s, size_t& pos, char c) noexcept {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

inline void SplitMicros(UtcMicros ts, int64_t& days, int64_t& sec_of_day,
                        int64_t& micros) noexcept {
  static constexpr int64_t kMicrosPerDay = 86400LL * 1000000LL;
  days = ts / kMicrosPerDay;
  int64_t rem = ts % kMicrosPerDay;
  if (rem < 0) {
    rem += kMicrosPerDay;
    --days;
  }
  sec_of_day = rem / 1000000LL;
  micros = rem % 1000000LL;
}

/// Shared date-time grammar; @p naive_utc also accepts a missing offset.
inline optional<UtcMicros> ParseDateTime(const std::string& s,
                                         bool naive_utc) noexcept {
  size_t pos = 0;
  unsigned year, month, day, hour, minute, second;
  if (!detail::ReadDigits(s, pos, 4, year) || !detail::Expect(s, pos, '-') ||
      !detail::ReadDigits(s, pos, 2, month) || !detail::Expect(s, pos, '-') ||
      !detail::ReadDigits(s, pos, 2, day)) {
    return std::nullopt;
  }
  if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) {
    return std::nullopt;
  }
  ++pos;
  if (!detail::ReadDigits(s, pos, 2, hour) || !detail::Expect(s, pos, ':') ||
      !detail::ReadDigits(s, pos, 2, minute) || !detail::Expect(s, pos, ':') ||
      !detail::ReadDigits(s, pos, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 ||
      day > detail::DaysInMonth(year, month) || hour > 23 || minute > 59 ||
      second > 59) {
    return std::nullopt;
  }

  int64_t micros = 0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    size_t digits = 0;
    int64_t scale = 100000;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (scale > 0) {
        micros += (s[pos] - '0') * scale;
        scale /= 10;
      }
      ++pos;
      ++digits;
    }
    if (digits == 0) return std::nullopt;
  }

  int64_t offset_sec = 0;
  if (pos >= s.size()) {
    if (!naive_utc) return std::nullopt;
  } else if (s[pos] == 'Z' || s[pos] == 'z') {
    ++pos;
  } else if (s[pos] == '+' || s[pos] == '-') {
    const int sign = (s[pos] == '-') ? -1 : 1;
    ++pos;
    unsigned oh, om;
    if (!detail::ReadDigits(s, pos, 2, oh) || !detail::Expect(s, pos, ':') ||
        !detail::ReadDigits(s, pos, 2, om) || oh > 23 || om > 59) {
      return std::nullopt;
    }
    offset_sec = sign * static_cast<int64_t>(oh * 3600 + om * 60);
  } else {
    return std::nullopt;
  }
  if (pos != s.size()) return std::nullopt;

  const int64_t days = detail::DaysFromCivil(year, month, day);
  const int64_t secs =
      days * 86400 + hour * 3600 + minute * 60 + second - offset_sec;
  return secs * 1000000LL + micros;
}

}  // namespace detail

/// 0000-01-01 00:00:00.000000 and 9999-12-31 23:59:59.999999 UTC, the span
/// whose four-digit storage text still sorts chronologically.
static constexpr UtcMicros kMinStorableMicros = -62167219200LL * 1000000LL;
static constexpr UtcMicros kMaxStorableMicros =
    253402300800LL * 1000000LL - 1;

/**
 * @brief Parse an RFC 3339 date-time ("2024-05-01T12:00:00.5+02:00").
 *
 * Accepts 'T', 't' or ' ' as separator, 'Z'/'z' or +hh:mm/-hh:mm offset,
 * and any number of fraction digits (truncated to microseconds).
 * Leap second 60 is rejected.
 */
inline optional<UtcMicros> ParseRfc3339(const std::string& s) noexcept {
  return detail::ParseDateTime(s, false);
}

/**
 * @brief Naive UTC storage text with six fraction digits.
 *
 * Instants outside [kMinStorableMicros, kMaxStorableMicros] are clamped to
 * the nearest end, so an offset that pushes a query bound past year 9999
 * still compares correctly against stored rows.
 */
inline std::string FormatStorage(UtcMicros ts) {
  if (ts < kMinStorableMicros) ts = kMinStorableMicros;
  if (ts > kMaxStorableMicros) ts = kMaxStorableMicros;
  int64_t days, sod, micros;
  detail::SplitMicros(ts, days, sod, micros);
  int64_t y;
  unsigned m, d;
  detail::CivilFromDays(days, y, m, d);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld.%06lld",
                static_cast<long long>(y), m, d,
                static_cast<long long>(sod / 3600),
                static_cast<long long>((sod / 60) % 60),
                static_cast<long long>(sod % 60),
                static_cast<long long>(micros));
  return buf;
}

/// @brief Parse storage text; also tolerates a missing fraction.
inline optional<UtcMicros> ParseStorage(const std::string& s) noexcept {
  return detail::ParseDateTime(s, true);
}

/**
 * @brief RFC 3339 with "+00:00" offset; fraction omitted when zero,
 *        three digits for whole milliseconds, otherwise six.
 */
inline std::string FormatRfc3339(UtcMicros ts) {
  int64_t days, sod, micros;
  detail::SplitMicros(ts, days, sod, micros);
  int64_t y;
  unsigned m, d;
  detail::CivilFromDays(days, y, m, d);
  char frac[16] = "";
  if (micros != 0) {
    if (micros % 1000 == 0) {
      std::snprintf(frac, sizeof(frac), ".%03lld",
                    static_cast<long long>(micros / 1000));
    } else {
      std::snprintf(frac, sizeof(frac), ".%06lld",
                    static_cast<long long>(micros));
    }
  }
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld%s+00:00",
                static_cast<long long>(y), m, d,
                static_cast<long long>(sod / 3600),
                static_cast<long long>((sod / 60) % 60),
                static_cast<long long>(sod % 60), frac);
  return buf;
}

inline UtcMicros NowUtcMicros() noexcept {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace rsb

#endif  // RSB_TIMESTAMP_HPP_
