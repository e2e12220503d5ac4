#include "SocketHandler.hpp"

namespace apc {
void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  const char* data = (const char*)buf;
  auto lastProgress = chrono::steady_clock::now();
  size_t written = 0;
  while (written < count) {
    ssize_t bytesWritten = write(fd, data + written, count - written);
    if (bytesWritten > 0) {
      written += bytesWritten;
      lastProgress = chrono::steady_clock::now();
      continue;
    }
    if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed while writing");
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
      LOG(WARNING) << "Write to fd " << fd
                   << " failed: " << strerror(localErrno);
      throw std::runtime_error(string("Write failed: ") +
                               strerror(localErrno));
    }
    if (timeout &&
        chrono::steady_clock::now() - lastProgress > WRITE_STALL_TIMEOUT) {
      throw std::runtime_error("Write stalled for " +
                               to_string(WRITE_STALL_TIMEOUT.count()) +
                               " seconds");
    }
    VLOG(3) << "Socket buffer full, " << count - written << " bytes left";
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}
}  // namespace apc
