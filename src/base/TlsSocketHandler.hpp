#ifndef __APC_TLS_SOCKET_HANDLER__
#define __APC_TLS_SOCKET_HANDLER__

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "TcpSocketHandler.hpp"

namespace apc {
/**
 * @brief TCP client sockets wrapped in an OpenSSL session.
 *
 * The agent server only speaks one (old) TLS version and presents a
 * certificate nobody can verify, so the context pins the protocol version
 * and disables peer verification. After the handshake the socket is switched
 * to non-blocking mode; every SSL call runs under the per-socket mutex so the
 * reader and the writers never touch the SSL object at the same time.
 */
class TlsSocketHandler : public TcpSocketHandler {
 public:
  /**
   * @param tlsVersion OpenSSL protocol constant, e.g. TLS1_VERSION.
   */
  explicit TlsSocketHandler(
      int tlsVersion,
      chrono::milliseconds _connectTimeout = DEFAULT_CONNECT_TIMEOUT);
  virtual ~TlsSocketHandler();

  /**
   * @brief Connects over TCP and runs the TLS client handshake. The handshake
   * gets connectTimeout per socket read or write.
   * @return The socket fd or -1 when either step failed.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /** @brief Also reports data buffered inside OpenSSL. */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Frees the SSL session and closes the socket. */
  virtual void close(int fd);

  /**
   * @brief Maps "1.0", "1.1", "1.2" or "1.3" to the OpenSSL constant.
   * @throws std::invalid_argument for anything else.
   */
  static int parseTlsVersion(const string& version);

 protected:
  SSL* getSsl(int fd);
  /** @brief Bounds blocking socket calls made by SSL_connect; zero clears. */
  void setHandshakeTimeout(int fd, chrono::milliseconds timeout);
  /**
   * @brief Converts the result of a failed SSL_read/SSL_write into the
   * read()/write() convention (0 on EOF, -1 with errno otherwise).
   */
  ssize_t translateSslError(SSL* ssl, int rc, const char* operation);
  /** @brief Drains the OpenSSL error queue into a printable string. */
  static string getSslErrors();

  SSL_CTX* sslContext;
  /** @brief SSL session per connected socket, guarded by globalMutex. */
  map<int, SSL*> sslSessions;
};
}  // namespace apc

#endif  // __APC_TLS_SOCKET_HANDLER__
