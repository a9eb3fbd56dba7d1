/**
 * @file websocket.hpp
 * @brief RFC 6455 handshake key derivation and frame codec.
 *
 * Server side only needs unmasked outbound frames and masked inbound
 * frames; the encoder supports an optional mask so tests can play the
 * client role. Fragmented messages are not reassembled: each frame is
 * surfaced on its own.
 */

#ifndef RSB_WEBSOCKET_HPP_
#define RSB_WEBSOCKET_HPP_

#include "rsb/http.hpp"
#include "rsb/vocabulary.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace rsb {
namespace ws {

static constexpr char kAcceptGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
static constexpr uint64_t kMaxFramePayload = 1024U * 1024U;

enum class Opcode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA,
};

// ============================================================================
// SHA-1 / Base64 (handshake only)
// ============================================================================

class Sha1 {
 public:
  void Update(const uint8_t* data, size_t len) {
    bit_length_ += static_cast<uint64_t>(len) * 8U;
    while (len > 0) {
      const size_t n = std::min<size_t>(64 - buffer_size_, len);
      std::memcpy(buffer_.data() + buffer_size_, data, n);
      buffer_size_ += n;
      data += n;
      len -= n;
      if (buffer_size_ == 64) {
        ProcessBlock(buffer_.data());
        buffer_size_ = 0;
      }
    }
  }

  std::array<uint8_t, 20> Finalize() {
    buffer_[buffer_size_++] = 0x80;
    if (buffer_size_ > 56) {
      while (buffer_size_ < 64) buffer_[buffer_size_++] = 0x00;
      ProcessBlock(buffer_.data());
      buffer_size_ = 0;
    }
    while (buffer_size_ < 56) buffer_[buffer_size_++] = 0x00;
    for (int i = 7; i >= 0; --i) {
      buffer_[buffer_size_++] =
          static_cast<uint8_t>((bit_length_ >> (i * 8)) & 0xFFU);
    }
    ProcessBlock(buffer_.data());

    std::array<uint8_t, 20> digest{};
    for (int i = 0; i < 5; ++i) {
      digest[i * 4 + 0] = static_cast<uint8_t>(state_[i] >> 24);
      digest[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
      digest[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
      digest[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    return digest;
  }

 private:
  static uint32_t Rotl(uint32_t v, uint32_t bits) noexcept {
    return (v << bits) | (v >> (32 - bits));
  }

  void ProcessBlock(const uint8_t* block) noexcept {
    uint32_t w[80];
    for (int i = 0; i < 16; ++i) {
      w[i] = (static_cast<uint32_t>(block[i * 4 + 0]) << 24) |
             (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
             (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
             static_cast<uint32_t>(block[i * 4 + 3]);
    }
    for (int i = 16; i < 80; ++i) {
      w[i] = Rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    uint32_t a = state_[0];
    uint32_t b = state_[1];
    uint32_t c = state_[2];
    uint32_t d = state_[3];
    uint32_t e = state_[4];
    for (int i = 0; i < 80; ++i) {
      uint32_t f;
      uint32_t k;
      if (i < 20) {
        f = (b & c) | ((~b) & d);
        k = 0x5A827999U;
      } else if (i < 40) {
        f = b ^ c ^ d;
        k = 0x6ED9EBA1U;
      } else if (i < 60) {
        f = (b & c) | (b & d) | (c & d);
        k = 0x8F1BBCDCU;
      } else {
        f = b ^ c ^ d;
        k = 0xCA62C1D6U;
      }
      const uint32_t temp = Rotl(a, 5) + f + e + k + w[i];
      e = d;
      d = c;
      c = Rotl(b, 30);
      b = a;
      a = temp;
    }
    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
  }

  std::array<uint8_t, 64> buffer_{};
  size_t buffer_size_ = 0;
  uint64_t bit_length_ = 0;
  std::array<uint32_t, 5> state_{
      {0x67452301U, 0xEFCDAB89U, 0x98BADCFEU, 0x10325476U, 0xC3D2E1F0U}};
};

inline std::string Base64Encode(const uint8_t* data, size_t len) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((len + 2) / 3) * 4);
  size_t i = 0;
  while (i < len) {
    const size_t chunk = std::min<size_t>(3, len - i);
    const uint32_t a = data[i++];
    const uint32_t b = (chunk >= 2) ? data[i++] : 0U;
    const uint32_t c = (chunk == 3) ? data[i++] : 0U;
    const uint32_t triple = (a << 16) | (b << 8) | c;
    out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    out.push_back((chunk >= 2) ? kAlphabet[(triple >> 6) & 0x3F] : '=');
    out.push_back((chunk == 3) ? kAlphabet[triple & 0x3F] : '=');
  }
  return out;
}

/// @brief Sec-WebSocket-Accept value for a client's Sec-WebSocket-Key.
inline std::string AcceptKey(const std::string& client_key) {
  const std::string merged = client_key + kAcceptGuid;
  Sha1 sha;
  sha.Update(reinterpret_cast<const uint8_t*>(merged.data()), merged.size());
  const auto digest = sha.Finalize();
  return Base64Encode(digest.data(), digest.size());
}

/**
 * @brief True when @p req is a GET asking to upgrade to websocket with a
 *        key present.
 */
inline bool IsUpgradeRequest(const HttpRequest& req) {
  if (req.method != "GET") return false;
  const std::string* upgrade = req.Header("Upgrade");
  const std::string* conn = req.Header("Connection");
  const std::string* key = req.Header("Sec-WebSocket-Key");
  return upgrade != nullptr && detail::IEquals(*upgrade, "websocket") &&
         conn != nullptr && detail::HeaderHasToken(*conn, "upgrade") &&
         key != nullptr && !key->empty();
}

/// @brief 101 response completing the handshake for @p client_key.
inline std::string HandshakeResponse(const std::string& client_key) {
  HttpResponse r;
  r.status = 101;
  r.headers.emplace_back("Upgrade", "websocket");
  r.headers.emplace_back("Connection", "Upgrade");
  r.headers.emplace_back("Sec-WebSocket-Accept", AcceptKey(client_key));
  return r.Serialize();
}

// ============================================================================
// Frames
// ============================================================================

struct Frame {
  bool fin = true;
  Opcode opcode = Opcode::kText;
  std::string payload;  ///< Unmasked
};

/**
 * @brief Encode one frame. @p mask non-null produces a masked (client)
 *        frame.
 */
inline std::string EncodeFrame(Opcode opcode, const std::string& payload,
                               const uint8_t* mask = nullptr) {
  std::string out;
  out.reserve(payload.size() + 14);
  out.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));
  const uint8_t mask_bit = (mask != nullptr) ? 0x80 : 0x00;
  const uint64_t len = payload.size();
  if (len < 126) {
    out.push_back(static_cast<char>(mask_bit | len));
  } else if (len <= 0xFFFFU) {
    out.push_back(static_cast<char>(mask_bit | 126));
    out.push_back(static_cast<char>((len >> 8) & 0xFF));
    out.push_back(static_cast<char>(len & 0xFF));
  } else {
    out.push_back(static_cast<char>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) {
      out.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }
  }
  if (mask != nullptr) {
    out.append(reinterpret_cast<const char*>(mask), 4);
    for (size_t i = 0; i < payload.size(); ++i) {
      out.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
    }
  } else {
    out += payload;
  }
  return out;
}

enum class FrameStatus : uint8_t {
  kComplete = 0,
  kIncomplete,
  kProtocolError,  ///< Reserved bits, oversize payload or bad control frame
};

/**
 * @brief Decode one frame from the front of @p buf.
 * @param consumed Bytes belonging to the frame on kComplete.
 */
inline FrameStatus TryParseFrame(const std::string& buf, Frame& frame,
                                 size_t& consumed) {
  if (buf.size() < 2) return FrameStatus::kIncomplete;
  const uint8_t b0 = static_cast<uint8_t>(buf[0]);
  const uint8_t b1 = static_cast<uint8_t>(buf[1]);
  if ((b0 & 0x70) != 0) return FrameStatus::kProtocolError;

  const bool masked = (b1 & 0x80) != 0;
  uint64_t len = b1 & 0x7F;
  size_t pos = 2;
  if (len == 126) {
    if (buf.size() < pos + 2) return FrameStatus::kIncomplete;
    len = (static_cast<uint64_t>(static_cast<uint8_t>(buf[2])) << 8) |
          static_cast<uint8_t>(buf[3]);
    pos += 2;
  } else if (len == 127) {
    if (buf.size() < pos + 8) return FrameStatus::kIncomplete;
    len = 0;
    for (size_t i = 0; i < 8; ++i) {
      len = (len << 8) | static_cast<uint8_t>(buf[pos + i]);
    }
    pos += 8;
  }
  if (len > kMaxFramePayload) return FrameStatus::kProtocolError;

  const uint8_t op = b0 & 0x0F;
  if ((op & 0x08) != 0 && (len > 125 || (b0 & 0x80) == 0)) {
    return FrameStatus::kProtocolError;
  }

  uint8_t mask[4] = {0, 0, 0, 0};
  if (masked) {
    if (buf.size() < pos + 4) return FrameStatus::kIncomplete;
    std::memcpy(mask, buf.data() + pos, 4);
    pos += 4;
  }
  if (buf.size() < pos + len) return FrameStatus::kIncomplete;

  frame.fin = (b0 & 0x80) != 0;
  frame.opcode = static_cast<Opcode>(op);
  frame.payload.assign(buf, pos, static_cast<size_t>(len));
  if (masked) {
    for (size_t i = 0; i < frame.payload.size(); ++i) {
      frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
    }
  }
  consumed = pos + static_cast<size_t>(len);
  return FrameStatus::kComplete;
}

}  // namespace ws
}  // namespace rsb

#endif  // RSB_WEBSOCKET_HPP_
