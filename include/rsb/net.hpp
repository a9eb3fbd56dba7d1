/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file net.hpp
 * @brief Loopback-grade TCP plumbing over sockpp: a connection type used by
 *        the health prober and the telemetry server sessions, and the
 *        server's listener.
 *
 * Every call reports through rsb::expected<V, NetError>; nothing throws.
 */

#ifndef RSB_NET_HPP_
#define RSB_NET_HPP_

#include "rsb/platform.hpp"
#include "rsb/vocabulary.hpp"

#include <sockpp/inet_address.h>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_connector.h>
#include <sockpp/tcp_socket.h>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>

namespace rsb {
namespace net {

enum class NetError : uint8_t {
  kConnectFailed = 0,
  kBindFailed,
  kListenFailed,
  kAcceptFailed,
  kSendFailed,
  kRecvFailed,
  kTimeout,
  kClosed,
  kInvalidAddress,
};

inline const char* NetErrorName(NetError e) noexcept {
  static constexpr const char* kNames[] = {
      "connect failed", "bind failed", "listen failed",
      "accept failed",  "send failed", "recv failed",
      "timeout",        "closed",      "invalid address"};
  const auto i = static_cast<size_t>(e);
  return (i < sizeof(kNames) / sizeof(kNames[0])) ? kNames[i]
                                                  : "invalid address";
}

namespace detail {

template <typename T>
inline expected<T, NetError> NetFail(NetError e) noexcept {
  return expected<T, NetError>::error(e);
}

/// poll(2) for POLLIN on @p fd, retrying EINTR. Hangup counts as readable.
inline expected<bool, NetError> PollReadable(int fd,
                                             uint32_t timeout_ms) noexcept {
  struct pollfd pfd = {fd, POLLIN, 0};
  int rc;
  do {
    rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) return NetFail<bool>(NetError::kRecvFailed);
  return expected<bool, NetError>::success(rc > 0);
}

}  // namespace detail

// ============================================================================
// TcpClient
// ============================================================================

/**
 * @brief One TCP connection. Move-only.
 *
 * Shutdown() may be called from another thread to wake a blocked Recv()
 * while leaving the descriptor valid until Close().
 */
class TcpClient {
 public:
  TcpClient() noexcept = default;
  TcpClient(TcpClient&&) noexcept = default;
  TcpClient& operator=(TcpClient&&) noexcept = default;
  TcpClient(const TcpClient&) = delete;
  TcpClient& operator=(const TcpClient&) = delete;

  /**
   * @brief Resolve @p host and connect.
   * @param timeout_ms Upper bound on the connect; 0 blocks.
   */
  static expected<TcpClient, NetError> Connect(const char* host, uint16_t port,
                                               int32_t timeout_ms = 5000) noexcept {
    auto addr = sockpp::inet_address::create(host, port);
    if (!addr) return detail::NetFail<TcpClient>(NetError::kInvalidAddress);

    sockpp::tcp_connector conn;
    const auto res =
        (timeout_ms > 0)
            ? conn.connect(addr.value(), std::chrono::milliseconds(timeout_ms))
            : conn.connect(addr.value());
    if (!res) return detail::NetFail<TcpClient>(NetError::kConnectFailed);
    return expected<TcpClient, NetError>::success(TcpClient(std::move(conn)));
  }

  /// @brief Write all of @p data (sockpp retries short writes).
  expected<void, NetError> SendAll(const void* data, size_t len) noexcept {
    if (!sock_.is_open()) return detail::NetFail<void>(NetError::kClosed);
    const auto res = sock_.write_n(data, len);
    if (!res || res.value() != len) {
      return detail::NetFail<void>(NetError::kSendFailed);
    }
    return expected<void, NetError>::success();
  }

  expected<void, NetError> SendAll(const std::string& data) noexcept {
    return SendAll(data.data(), data.size());
  }

  /// @return Bytes read; 0 is end of stream.
  expected<size_t, NetError> Recv(void* buf, size_t len) noexcept {
    if (!sock_.is_open()) return detail::NetFail<size_t>(NetError::kClosed);
    const auto res = sock_.read(buf, len);
    if (!res) return detail::NetFail<size_t>(NetError::kRecvFailed);
    return expected<size_t, NetError>::success(res.value());
  }

  /// @return true once Recv() would not block (data, EOF or error).
  expected<bool, NetError> WaitReadable(uint32_t timeout_ms) noexcept {
    if (!sock_.is_open()) return detail::NetFail<bool>(NetError::kClosed);
    return detail::PollReadable(sock_.handle(), timeout_ms);
  }

  int Fd() const noexcept { return sock_.handle(); }
  bool IsOpen() const noexcept { return sock_.is_open(); }

  void Shutdown() noexcept {
    if (sock_.is_open()) (void)sock_.shutdown(SHUT_RDWR);
  }

  void Close() noexcept { (void)sock_.close(); }

 private:
  friend class TcpServer;

  explicit TcpClient(sockpp::tcp_socket&& sock) noexcept
      : sock_(std::move(sock)) {}

  sockpp::tcp_socket sock_;
};

// ============================================================================
// TcpServer
// ============================================================================

class TcpServer {
 public:
  TcpServer() noexcept = default;
  TcpServer(TcpServer&&) noexcept = default;
  TcpServer& operator=(TcpServer&&) noexcept = default;
  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;

  /// @brief Bind and listen on @p host:@p port; port 0 is ephemeral.
  static expected<TcpServer, NetError> Listen(const char* host, uint16_t port,
                                              int32_t backlog = 16) noexcept {
    auto addr = sockpp::inet_address::create(host, port);
    if (!addr) return detail::NetFail<TcpServer>(NetError::kInvalidAddress);
    TcpServer server;
    if (!server.acc_.open(addr.value(), backlog)) {
      return detail::NetFail<TcpServer>(NetError::kListenFailed);
    }
    return expected<TcpServer, NetError>::success(std::move(server));
  }

  /// @brief Blocks until a peer connects or Shutdown() is called.
  expected<TcpClient, NetError> Accept() noexcept {
    if (!acc_.is_open()) return detail::NetFail<TcpClient>(NetError::kClosed);
    auto res = acc_.accept();
    if (!res) return detail::NetFail<TcpClient>(NetError::kAcceptFailed);
    return expected<TcpClient, NetError>::success(TcpClient(res.release()));
  }

  /// @brief Bound port in host order; 0 when not listening.
  uint16_t LocalPort() const noexcept {
    if (!acc_.is_open()) return 0U;
    struct sockaddr_in sa;
    std::memset(&sa, 0, sizeof(sa));
    socklen_t len = sizeof(sa);
    const int rc = ::getsockname(acc_.handle(),
                                 reinterpret_cast<struct sockaddr*>(&sa), &len);
    return (rc == 0) ? ntohs(sa.sin_port) : 0U;
  }

  int Fd() const noexcept { return acc_.handle(); }
  bool IsOpen() const noexcept { return acc_.is_open(); }

  /// @brief Wake the thread blocked in Accept(); Close() releases the fd.
  void Shutdown() noexcept {
    if (acc_.is_open()) (void)::shutdown(acc_.handle(), SHUT_RDWR);
  }

  void Close() noexcept { (void)acc_.close(); }

 private:
  sockpp::tcp_acceptor acc_;
};

}  // namespace net
}  // namespace rsb

#endif  // RSB_NET_HPP_
