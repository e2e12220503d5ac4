#include "TcpSocketHandler.hpp"

namespace apc {
TcpSocketHandler::TcpSocketHandler(chrono::milliseconds _connectTimeout)
    : connectTimeout(_connectTimeout) {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addrinfo *results = resolve(endpoint);
  if (results == NULL) {
    return -1;
  }
  int sockFd = -1;
  for (addrinfo *p = results; p != NULL && sockFd == -1; p = p->ai_next) {
    sockFd = connectTo(p, endpoint);
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to any address of " << endpoint;
    return -1;
  }
  LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

addrinfo *TcpSocketHandler::resolve(const SocketEndpoint &endpoint) {
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_V4MAPPED | AI_ADDRCONFIG);
  string portname = to_string(endpoint.getPort());

  // (re)initialize the DNS system
  ::res_init();
  addrinfo *results = NULL;
  int rc = getaddrinfo(endpoint.getName().c_str(), portname.c_str(), &hints,
                       &results);
  if (rc != 0) {
    LOG(ERROR) << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    return NULL;
  }
  return results;
}

int TcpSocketHandler::connectTo(const addrinfo *address,
                                const SocketEndpoint &endpoint) {
  int sockFd =
      ::socket(address->ai_family, address->ai_socktype, address->ai_protocol);
  if (sockFd == -1) {
    LOG(INFO) << "Error creating socket: " << strerror(errno);
    return -1;
  }

  // Nonblocking only while connecting, so the attempt can time out
  setBlocking(sockFd, false);
  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) == -1 &&
      errno != EINPROGRESS) {
    LOG(INFO) << "Error connecting to " << endpoint << ": " << strerror(errno);
    ::close(sockFd);
    return -1;
  }

  fd_set writable;
  FD_ZERO(&writable);
  FD_SET(sockFd, &writable);
  auto micros =
      chrono::duration_cast<chrono::microseconds>(connectTimeout).count();
  timeval tv;
  tv.tv_sec = micros / 1000000;
  tv.tv_usec = micros % 1000000;
  if (::select(sockFd + 1, NULL, &writable, NULL, &tv) <= 0 ||
      !FD_ISSET(sockFd, &writable)) {
    LOG(INFO) << "Timed out connecting to " << endpoint << " after "
              << connectTimeout.count() << " ms";
    ::close(sockFd);
    return -1;
  }

  int soError = 0;
  socklen_t len = sizeof(soError);
  FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &soError, &len));
  if (soError != 0) {
    LOG(INFO) << "Error connecting to " << endpoint << ": "
              << strerror(soError);
    ::close(sockFd);
    return -1;
  }
  setBlocking(sockFd, true);
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace apc
