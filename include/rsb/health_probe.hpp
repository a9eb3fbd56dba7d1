/**
 * @file health_probe.hpp
 * @brief Bounded-timeout TCP liveness probe.
 *
 * A probe is a plain TCP connect: success means something accepted the
 * connection on host:port. No bytes are exchanged and the socket is
 * closed immediately.
 */

#ifndef RSB_HEALTH_PROBE_HPP_
#define RSB_HEALTH_PROBE_HPP_

#include "rsb/net.hpp"
#include "rsb/vocabulary.hpp"

#include <cstdint>

namespace rsb {

static constexpr uint32_t kDefaultProbeTimeoutMs = 150U;

/**
 * @brief Attempt a TCP connect to @p host:@p port within @p timeout_ms.
 * @return success when the connection was accepted; kInvalidAddress when
 *         the host does not resolve; kConnectFailed otherwise.
 */
inline expected<void, net::NetError> ProbeTcp(
    const char* host, uint16_t port,
    uint32_t timeout_ms = kDefaultProbeTimeoutMs) noexcept {
  // 0 would mean "blocking" to the connector.
  const int32_t bounded = (timeout_ms == 0U) ? 1 : static_cast<int32_t>(timeout_ms);
  auto conn = net::TcpClient::Connect(host, port, bounded);
  if (!conn.has_value()) {
    return expected<void, net::NetError>::error(conn.get_error());
  }
  conn.value().Close();
  return expected<void, net::NetError>::success();
}

/// @brief Boolean form of ProbeTcp() for policy code.
inline bool IsPortOpen(const char* host, uint16_t port,
                       uint32_t timeout_ms = kDefaultProbeTimeoutMs) noexcept {
  return ProbeTcp(host, port, timeout_ms).has_value();
}

}  // namespace rsb

#endif  // RSB_HEALTH_PROBE_HPP_
