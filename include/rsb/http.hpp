/**
 * @file http.hpp
 * @brief Minimal HTTP/1.1 request parsing and response serialization.
 *
 * Only what the telemetry endpoints need: request line, headers, no
 * request bodies beyond Content-Length skipping, and fixed-length
 * responses. Header names are matched case-insensitively.
 */

#ifndef RSB_HTTP_HPP_
#define RSB_HTTP_HPP_

#include "rsb/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace rsb {

static constexpr size_t kMaxRequestHeaderBytes = 16U * 1024U;
static constexpr size_t kMaxRequestBodyBytes = 64U * 1024U;

enum class ParseStatus : uint8_t {
  kComplete = 0,
  kIncomplete,  ///< Need more bytes
  kBadRequest,
  kTooLarge,
};

struct HttpRequest {
  std::string method;
  std::string target;  ///< Raw request target ("/a/b?x=1")
  std::string path;    ///< Target before '?', still percent-encoded
  std::string query;   ///< Target after '?', without the '?'
  std::string version;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  /// @brief First header named @p name (case-insensitive), or nullptr.
  const std::string* Header(const char* name) const;

  bool KeepAlive() const;
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool IEquals(const std::string& a, const char* b) noexcept {
  size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (AsciiLower(a[i]) != AsciiLower(b[i])) return false;
  }
  return i == a.size() && b[i] == '\0';
}

/// True if the comma-separated header value contains @p token.
inline bool HeaderHasToken(const std::string& value, const char* token) {
  size_t start = 0;
  while (start <= value.size()) {
    size_t comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    size_t b = start;
    size_t e = comma;
    while (b < e && (value[b] == ' ' || value[b] == '\t')) ++b;
    while (e > b && (value[e - 1] == ' ' || value[e - 1] == '\t')) --e;
    if (IEquals(value.substr(b, e - b), token)) return true;
    start = comma + 1;
  }
  return false;
}

inline int HexValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

inline std::string Decode(const std::string& in, bool plus_is_space) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    const char c = in[i];
    if (c == '%' && i + 2 < in.size() && HexValue(in[i + 1]) >= 0 &&
        HexValue(in[i + 2]) >= 0) {
      out.push_back(static_cast<char>((HexValue(in[i + 1]) << 4) |
                                      HexValue(in[i + 2])));
      i += 2;
    } else if (c == '+' && plus_is_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace detail

inline const std::string* HttpRequest::Header(const char* name) const {
  for (const auto& h : headers) {
    if (detail::IEquals(h.first, name)) return &h.second;
  }
  return nullptr;
}

inline bool HttpRequest::KeepAlive() const {
  const std::string* conn = Header("Connection");
  if (version == "HTTP/1.0") {
    return conn != nullptr && detail::HeaderHasToken(*conn, "keep-alive");
  }
  return conn == nullptr || !detail::HeaderHasToken(*conn, "close");
}

/// @brief Percent-decode a path segment ('+' stays '+'). Bad escapes pass through.
inline std::string PercentDecode(const std::string& in) {
  return detail::Decode(in, false);
}

/**
 * @brief Split an application/x-www-form-urlencoded query into decoded
 *        name/value pairs, in order. Empty pieces are skipped.
 */
inline std::vector<std::pair<std::string, std::string>> ParseQueryString(
    const std::string& query) {
  std::vector<std::pair<std::string, std::string>> out;
  size_t start = 0;
  while (start <= query.size()) {
    size_t amp = query.find('&', start);
    if (amp == std::string::npos) amp = query.size();
    if (amp > start) {
      const std::string piece = query.substr(start, amp - start);
      const size_t eq = piece.find('=');
      if (eq == std::string::npos) {
        out.emplace_back(detail::Decode(piece, true), std::string());
      } else {
        out.emplace_back(detail::Decode(piece.substr(0, eq), true),
                         detail::Decode(piece.substr(eq + 1), true));
      }
    }
    start = amp + 1;
  }
  return out;
}

/// @brief Last value for @p name in a parsed query, if present.
inline optional<std::string> FindQueryParam(
    const std::vector<std::pair<std::string, std::string>>& params,
    const char* name) {
  optional<std::string> found;
  for (const auto& p : params) {
    if (p.first == name) found = p.second;
  }
  return found;
}

/**
 * @brief Parse one request from the front of @p buf.
 *
 * On kComplete, @p consumed is the number of bytes that belong to the
 * request (headers plus body) so pipelined requests can follow.
 */
inline ParseStatus ParseHttpRequest(const std::string& buf, HttpRequest& req,
                                    size_t& consumed) {
  const size_t header_end = buf.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return (buf.size() > kMaxRequestHeaderBytes) ? ParseStatus::kTooLarge
                                                 : ParseStatus::kIncomplete;
  }
  if (header_end > kMaxRequestHeaderBytes) return ParseStatus::kTooLarge;

  req = HttpRequest();
  size_t line_end = buf.find("\r\n");
  const std::string request_line = buf.substr(0, line_end);
  const size_t sp1 = request_line.find(' ');
  const size_t sp2 = (sp1 == std::string::npos)
                         ? std::string::npos
                         : request_line.find(' ', sp1 + 1);
  if (sp1 == std::string::npos || sp2 == std::string::npos || sp1 == 0 ||
      sp2 == sp1 + 1) {
    return ParseStatus::kBadRequest;
  }
  req.method = request_line.substr(0, sp1);
  req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  req.version = request_line.substr(sp2 + 1);
  if (req.version.rfind("HTTP/1.", 0) != 0 || req.target.empty()) {
    return ParseStatus::kBadRequest;
  }
  const size_t qmark = req.target.find('?');
  if (qmark == std::string::npos) {
    req.path = req.target;
  } else {
    req.path = req.target.substr(0, qmark);
    req.query = req.target.substr(qmark + 1);
  }

  size_t pos = line_end + 2;
  while (pos < header_end + 2) {
    line_end = buf.find("\r\n", pos);
    const std::string line = buf.substr(pos, line_end - pos);
    pos = line_end + 2;
    if (line.empty()) break;
    const size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      return ParseStatus::kBadRequest;
    }
    size_t vb = colon + 1;
    size_t ve = line.size();
    while (vb < ve && (line[vb] == ' ' || line[vb] == '\t')) ++vb;
    while (ve > vb && (line[ve - 1] == ' ' || line[ve - 1] == '\t')) --ve;
    req.headers.emplace_back(line.substr(0, colon), line.substr(vb, ve - vb));
  }

  size_t body_len = 0;
  if (const std::string* cl = req.Header("Content-Length")) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(cl->c_str(), &end, 10);
    if (cl->empty() || end == nullptr || *end != '\0') {
      return ParseStatus::kBadRequest;
    }
    if (v > kMaxRequestBodyBytes) return ParseStatus::kTooLarge;
    body_len = static_cast<size_t>(v);
  }
  const size_t body_start = header_end + 4;
  if (buf.size() < body_start + body_len) return ParseStatus::kIncomplete;
  req.body = buf.substr(body_start, body_len);
  consumed = body_start + body_len;
  return ParseStatus::kComplete;
}

// ============================================================================
// Response
// ============================================================================

inline const char* HttpReason(int status) noexcept {
  switch (status) {
    case 101:
      return "Switching Protocols";
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

struct HttpResponse {
  int status = 200;
  std::string content_type = "text/plain; charset=utf-8";
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  bool keep_alive = true;

  static HttpResponse Json(int status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.content_type = "application/json";
    r.body = std::move(body);
    return r;
  }

  static HttpResponse Text(int status, std::string body) {
    HttpResponse r;
    r.status = status;
    r.body = std::move(body);
    return r;
  }

  /// @brief Status line, headers (with permissive CORS) and body.
  std::string Serialize() const {
    std::string out;
    out.reserve(128 + body.size());
    out += "HTTP/1.1 ";
    out += std::to_string(status);
    out += ' ';
    out += HttpReason(status);
    out += "\r\n";
    if (status != 204 && status != 101) {
      out += "Content-Type: ";
      out += content_type;
      out += "\r\nContent-Length: ";
      out += std::to_string(body.size());
      out += "\r\n";
    }
    out += "Access-Control-Allow-Origin: *\r\n";
    for (const auto& h : headers) {
      out += h.first;
      out += ": ";
      out += h.second;
      out += "\r\n";
    }
    if (status != 101) {
      out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    }
    out += "\r\n";
    if (status != 204 && status != 101) out += body;
    return out;
  }
};

}  // namespace rsb

#endif  // RSB_HTTP_HPP_
