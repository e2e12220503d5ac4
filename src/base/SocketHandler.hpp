#ifndef __APC_SOCKET_HANDLER__
#define __APC_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace apc {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks until the fd becomes readable or the timeout elapses.
   * @return true when a read will not block.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Returns true when data is ready to read on a descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   * @return Bytes read, 0 when the peer closed, -1 with errno set on error.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /** @brief How long writeAllOrThrow() tolerates a full socket buffer. */
  static constexpr chrono::seconds WRITE_STALL_TIMEOUT = chrono::seconds(10);

  /**
   * @brief Writes every byte, retrying while the socket buffer is full.
   * @param timeout Give up after WRITE_STALL_TIMEOUT without progress.
   * @throws std::runtime_error when the write fails, the peer is gone or the
   * write stalls.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Stops both directions of the socket so a blocked reader wakes up.
   * The descriptor stays valid until close().
   */
  virtual void shutdownSocket(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace apc

#endif  // __APC_SOCKET_HANDLER__
