#include "RawSocketUtils.hpp"

namespace apc {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      STERROR << "Cannot write to raw socket: " << strerror(localErrno);
      throw std::runtime_error("Cannot write to raw socket");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to raw socket: socket closed");
    }
    bytesWritten += rc;
  }
}

string RawSocketUtils::readRecord(int fd, int timeoutMs) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readRecord");
  }
  string record;
  while (true) {
    fd_set input;
    FD_ZERO(&input);
    FD_SET(fd, &input);
    struct timeval timeout;
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;
    int n = select(fd + 1, &input, NULL, NULL, &timeout);
    if (n == 0) {
      throw std::runtime_error("Timed out waiting for a record");
    }
    if (n < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      throw std::runtime_error(string("select failed: ") +
                               strerror(GetErrno()));
    }
    char c;
    ssize_t rc = ::read(fd, &c, 1);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      throw std::runtime_error(string("Cannot read from raw socket: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Socket has closed abruptly.");
    }
    record.push_back(c);
    if (c == END_OF_TEXT || c == END_OF_TRANSMISSION_BLOCK) {
      return record;
    }
  }
}
}  // namespace apc
