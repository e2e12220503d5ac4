#ifndef __APC_TCP_SOCKET_HANDLER__
#define __APC_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace apc {
/**
 * @brief IPv4/IPv6 client sockets to the agent server.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  static constexpr chrono::milliseconds DEFAULT_CONNECT_TIMEOUT =
      chrono::seconds(3);

  explicit TcpSocketHandler(
      chrono::milliseconds _connectTimeout = DEFAULT_CONNECT_TIMEOUT);
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the endpoint and tries each address in turn, giving every
   * attempt connectTimeout to complete. The returned socket is blocking.
   * @return The socket fd, or -1 when no address accepted the connection.
   */
  virtual int connect(const SocketEndpoint& endpoint);

  chrono::milliseconds getConnectTimeout() const { return connectTimeout; }

 protected:
  /** @brief Sets TCP_NODELAY; every record is written in one go. */
  virtual void initSocket(int fd);

  /** @brief getaddrinfo() wrapper. Returns NULL and logs on failure. */
  addrinfo* resolve(const SocketEndpoint& endpoint);
  /** @brief One non-blocking connect attempt bounded by connectTimeout. */
  int connectTo(const addrinfo* address, const SocketEndpoint& endpoint);

  chrono::milliseconds connectTimeout;
};
}  // namespace apc

#endif  // __APC_TCP_SOCKET_HANDLER__
