/**
 * @file byte_codec.hpp
 * @brief Hex and lossy UTF-8 renderings of raw serial bytes.
 */

#ifndef RSB_BYTE_CODEC_HPP_
#define RSB_BYTE_CODEC_HPP_

#include "rsb/vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rsb {

enum class HexError : uint8_t {
  kOddDigitCount = 0,
  kInvalidDigit,
};

inline const char* HexErrorMessage(HexError e) noexcept {
  return (e == HexError::kOddDigitCount)
             ? "Hex input must have an even number of digits"
             : "Invalid hex digit";
}

namespace detail {

inline int HexNibble(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

inline bool IsSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

}  // namespace detail

/**
 * @brief Decode a whitespace-tolerant hex string ("0a 0B\tff").
 *
 * Whitespace is removed before validation; the digit count is checked
 * before any digit, so "0G1" reports kOddDigitCount.
 */
inline expected<std::vector<uint8_t>, HexError> DecodeHex(
    const std::string& input) {
  std::string digits;
  digits.reserve(input.size());
  for (char c : input) {
    if (!detail::IsSpace(c)) digits.push_back(c);
  }
  if (digits.size() % 2 != 0) {
    return expected<std::vector<uint8_t>, HexError>::error(
        HexError::kOddDigitCount);
  }

  std::vector<uint8_t> bytes;
  bytes.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    const int hi = detail::HexNibble(digits[i]);
    const int lo = detail::HexNibble(digits[i + 1]);
    if (hi < 0 || lo < 0) {
      return expected<std::vector<uint8_t>, HexError>::error(
          HexError::kInvalidDigit);
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return expected<std::vector<uint8_t>, HexError>::success(std::move(bytes));
}

/// @brief Uppercase, single-space separated: {0x0A, 0xFF} -> "0A FF".
inline std::string EncodeHex(const uint8_t* data, size_t len) {
  static constexpr char kDigits[] = "0123456789ABCDEF";
  std::string out;
  if (len == 0) return out;
  out.reserve(len * 3 - 1);
  for (size_t i = 0; i < len; ++i) {
    if (i != 0) out.push_back(' ');
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

/**
 * @brief Decode UTF-8, replacing each maximal invalid subsequence with
 *        U+FFFD. Never fails.
 */
inline std::string DecodeUtf8Lossy(const uint8_t* data, size_t len) {
  static constexpr char kReplacement[] = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(len);

  size_t i = 0;
  while (i < len) {
    const uint8_t b0 = data[i];
    if (b0 < 0x80) {
      out.push_back(static_cast<char>(b0));
      ++i;
      continue;
    }

    size_t need = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
      need = 1;
    } else if (b0 == 0xE0) {
      need = 2;
      lo = 0xA0;
    } else if (b0 >= 0xE1 && b0 <= 0xEC) {
      need = 2;
    } else if (b0 == 0xED) {
      need = 2;
      hi = 0x9F;
    } else if (b0 >= 0xEE && b0 <= 0xEF) {
      need = 2;
    } else if (b0 == 0xF0) {
      need = 3;
      lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
      need = 3;
    } else if (b0 == 0xF4) {
      need = 3;
      hi = 0x8F;
    } else {
      out += kReplacement;
      ++i;
      continue;
    }

    // Second byte has the tightened bounds, the rest are plain 80..BF.
    size_t consumed = 1;
    bool ok = true;
    for (size_t k = 0; k < need; ++k) {
      if (i + consumed >= len) {
        ok = false;
        break;
      }
      const uint8_t b = data[i + consumed];
      const uint8_t min = (k == 0) ? lo : 0x80;
      const uint8_t max = (k == 0) ? hi : 0xBF;
      if (b < min || b > max) {
        ok = false;
        break;
      }
      ++consumed;
    }

    if (ok) {
      out.append(reinterpret_cast<const char*>(data + i), consumed);
    } else {
      out += kReplacement;
    }
    i += consumed;
  }
  return out;
}

}  // namespace rsb

#endif  // RSB_BYTE_CODEC_HPP_
