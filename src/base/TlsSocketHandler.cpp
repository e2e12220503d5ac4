#include "TlsSocketHandler.hpp"

namespace apc {
TlsSocketHandler::TlsSocketHandler(int tlsVersion,
                                   chrono::milliseconds _connectTimeout)
    : TcpSocketHandler(_connectTimeout) {
  sslContext = SSL_CTX_new(TLS_client_method());
  if (sslContext == NULL) {
    STFATAL << "Could not create the OpenSSL context: " << getSslErrors();
  }
  if (SSL_CTX_set_min_proto_version(sslContext, tlsVersion) != 1 ||
      SSL_CTX_set_max_proto_version(sslContext, tlsVersion) != 1) {
    STFATAL << "Unsupported TLS version " << tlsVersion << ": "
            << getSslErrors();
  }
  // Old protocol versions are below the default security level of OpenSSL 3
  SSL_CTX_set_security_level(sslContext, 0);
  if (SSL_CTX_set_cipher_list(sslContext, "DEFAULT:@SECLEVEL=0") != 1) {
    LOG(WARNING) << "Could not relax the cipher list: " << getSslErrors();
  }
  // It's just raw TLS, encrypted by session keys, there is no host
  // verification
  SSL_CTX_set_verify(sslContext, SSL_VERIFY_NONE, NULL);
  SSL_CTX_set_mode(sslContext, SSL_MODE_ENABLE_PARTIAL_WRITE |
                                   SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
}

TlsSocketHandler::~TlsSocketHandler() {
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    for (auto it : sslSessions) {
      SSL_free(it.second);
    }
    sslSessions.clear();
  }
  SSL_CTX_free(sslContext);
}

int TlsSocketHandler::connect(const SocketEndpoint& endpoint) {
  int sockFd = TcpSocketHandler::connect(endpoint);
  if (sockFd == -1) {
    return -1;
  }
  lock_guard<std::recursive_mutex> guard(globalMutex);
  SSL* ssl = SSL_new(sslContext);
  if (ssl == NULL) {
    LOG(ERROR) << "Could not create an SSL session: " << getSslErrors();
    UnixSocketHandler::close(sockFd);
    return -1;
  }
  SSL_set_fd(ssl, sockFd);
  setHandshakeTimeout(sockFd, connectTimeout);
  VLOG(1) << "Starting TLS handshake with " << endpoint;
  int rc = SSL_connect(ssl);
  if (rc != 1) {
    LOG(ERROR) << "TLS handshake with " << endpoint << " failed ("
               << SSL_get_error(ssl, rc) << "): " << getSslErrors();
    SSL_free(ssl);
    UnixSocketHandler::close(sockFd);
    return -1;
  }
  setHandshakeTimeout(sockFd, chrono::milliseconds(0));
  LOG(INFO) << "TLS session established with " << endpoint << " using "
            << SSL_get_version(ssl) << " / " << SSL_get_cipher(ssl);
  setBlocking(sockFd, false);
  sslSessions[sockFd] = ssl;
  return sockFd;
}

void TlsSocketHandler::setHandshakeTimeout(int fd,
                                           chrono::milliseconds timeout) {
  auto micros = chrono::duration_cast<chrono::microseconds>(timeout).count();
  timeval tv;
  tv.tv_sec = micros / 1000000;
  tv.tv_usec = micros % 1000000;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (char*)&tv, sizeof(tv)));
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, (char*)&tv, sizeof(tv)));
}

SSL* TlsSocketHandler::getSsl(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = sslSessions.find(fd);
  if (it == sslSessions.end()) {
    return NULL;
  }
  return it->second;
}

bool TlsSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  auto socketMutex = getSocketMutex(fd);
  SSL* ssl = getSsl(fd);
  if (socketMutex && ssl) {
    lock_guard<recursive_mutex> guard(*socketMutex);
    if (SSL_pending(ssl) > 0) {
      return true;
    }
  }
  return UnixSocketHandler::waitForData(fd, sec, usec);
}

ssize_t TlsSocketHandler::read(int fd, void* buf, size_t count) {
  auto socketMutex = lockableSocket(fd, "read from");
  SSL* ssl = getSsl(fd);
  if (!socketMutex || !ssl) {
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ERR_clear_error();
  errno = 0;
  int rc = SSL_read(ssl, buf, int(count));
  if (rc > 0) {
    return rc;
  }
  return translateSslError(ssl, rc, "read");
}

ssize_t TlsSocketHandler::write(int fd, const void* buf, size_t count) {
  auto socketMutex = lockableSocket(fd, "write to");
  SSL* ssl = getSsl(fd);
  if (!socketMutex || !ssl) {
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ERR_clear_error();
  errno = 0;
  int rc = SSL_write(ssl, buf, int(count));
  if (rc > 0) {
    return rc;
  }
  return translateSslError(ssl, rc, "write");
}

ssize_t TlsSocketHandler::translateSslError(SSL* ssl, int rc,
                                            const char* operation) {
  auto localErrno = errno;
  int sslError = SSL_get_error(ssl, rc);
  switch (sslError) {
    case SSL_ERROR_ZERO_RETURN:
      VLOG(1) << "TLS session closed by peer during " << operation;
      return 0;
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
      errno = EAGAIN;
      return -1;
    case SSL_ERROR_SYSCALL:
      if (localErrno == 0) {
        // EOF without close_notify
        VLOG(1) << "TLS peer went away during " << operation;
        return 0;
      }
      LOG(WARNING) << "TLS " << operation << " failed: " << localErrno << " "
                   << strerror(localErrno);
      errno = localErrno;
      return -1;
    default:
      LOG(WARNING) << "TLS " << operation << " failed (" << sslError
                   << "): " << getSslErrors();
      errno = EPROTO;
      return -1;
  }
}

void TlsSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = sslSessions.find(fd);
  if (it != sslSessions.end()) {
    SSL_free(it->second);
    sslSessions.erase(it);
  }
  UnixSocketHandler::close(fd);
}

int TlsSocketHandler::parseTlsVersion(const string& version) {
  if (version == "1.0") {
    return TLS1_VERSION;
  }
  if (version == "1.1") {
    return TLS1_1_VERSION;
  }
  if (version == "1.2") {
    return TLS1_2_VERSION;
  }
  if (version == "1.3") {
    return TLS1_3_VERSION;
  }
  throw std::invalid_argument("Unknown TLS version: " + version);
}

string TlsSocketHandler::getSslErrors() {
  string errors;
  unsigned long code;
  while ((code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    if (!errors.empty()) {
      errors += "; ";
    }
    errors += buf;
  }
  return errors.empty() ? string("no OpenSSL error") : errors;
}
}  // namespace apc
