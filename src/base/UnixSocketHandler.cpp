#include "UnixSocketHandler.hpp"

namespace apc {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set readable;
  FD_ZERO(&readable);
  FD_SET(fd, &readable);
  timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = ::select(fd + 1, &readable, NULL, NULL, &timeout);
  if (n == -1) {
    // A bad fd is reported as readable so the following read() fails loudly
    VLOG(4) << "select on fd " << fd << " failed: " << strerror(errno);
    return errno != EINTR;
  }
  return n > 0 && FD_ISSET(fd, &readable);
}

bool UnixSocketHandler::hasData(int fd) { return waitForData(fd, 0, 0); }

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

shared_ptr<recursive_mutex> UnixSocketHandler::lockableSocket(
    int fd, const char* operation) {
  if (fd <= 0) {
    STFATAL << "Tried to " << operation << " an invalid socket: " << fd;
  }
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    LOG(INFO) << "Tried to " << operation << " closed socket " << fd;
    errno = EPIPE;
  }
  return socketMutex;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  auto socketMutex = lockableSocket(fd, "read from");
  if (!socketMutex) {
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t bytesRead = ::read(fd, buf, count);
  auto localErrno = errno;
  if (bytesRead < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading fd " << fd << ": " << strerror(localErrno);
  }
  VLOG(4) << "Read " << bytesRead << " bytes from fd " << fd;
  errno = localErrno;
  return bytesRead;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  auto socketMutex = lockableSocket(fd, "write to");
  if (!socketMutex) {
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(4) << "Writing " << count << " bytes to fd " << fd;
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (!activeSocketMutexes.emplace(fd, make_shared<recursive_mutex>())
           .second) {
    STFATAL << "Tried to track fd " << fd << " twice";
  }
}

void UnixSocketHandler::shutdownSocket(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (activeSocketMutexes.find(fd) == activeSocketMutexes.end()) {
    VLOG(1) << "Tried to shut down unknown socket " << fd;
    return;
  }
  // Don't take the socket mutex: a reader may be blocked inside it.
  if (::shutdown(fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
    LOG(WARNING) << "Error shutting down socket " << fd << ": "
                 << strerror(errno);
  }
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    STERROR << "Tried to close unknown socket " << fd;
    return;
  }
  auto socketMutex = it->second;
  lock_guard<std::recursive_mutex> guard(*socketMutex);
  VLOG(1) << "Closing socket " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (const auto &it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  // Without MSG_NOSIGNAL, a write to a dead peer must not raise SIGPIPE
  int val = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
      -1) {
    ::signal(SIGPIPE, SIG_IGN);
  }
#endif
}

void UnixSocketHandler::setBlocking(int sockFd, bool blocking) {
  int opts = fcntl(sockFd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts = blocking ? (opts & ~O_NONBLOCK) : (opts | O_NONBLOCK);
  FATAL_FAIL_UNLESS_EINVAL(fcntl(sockFd, F_SETFL, opts));
}
}  // namespace apc
