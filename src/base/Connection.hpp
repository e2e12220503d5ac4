#ifndef __APC_CONNECTION__
#define __APC_CONNECTION__

#include "ApcErrors.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace apc {
/**
 * @brief Owns one connected socket: serializes writers and separates
 * shutdown (wake everyone up) from release of the descriptor.
 */
class Connection {
 public:
  Connection(shared_ptr<SocketHandler> _socketHandler, int _socketFd);

  virtual ~Connection();

  /**
   * @brief Writes a whole record. Concurrent writers never interleave.
   * @throws ConnectionClosed when the connection is shut down or the write
   * fails.
   */
  virtual void writeRecord(const string& record);

  /** @brief File descriptor of the connected socket or -1. */
  int getSocketFd() {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    return socketFd;
  }

  inline shared_ptr<SocketHandler> getSocketHandler() { return socketHandler; }

  /**
   * @brief Stops the socket in both directions so the reader sees EOF and
   * writers fail fast. The descriptor stays open until closeSocket().
   */
  void shutdown();

  inline bool isShuttingDown() {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    return shuttingDown;
  }

  /**
   * @brief Releases the descriptor. Waits for an in-progress write.
   */
  virtual void closeSocket();

 protected:
  /** @brief Socket API used for every read, write and close. */
  shared_ptr<SocketHandler> socketHandler;
  /** @brief Connected socket descriptor, -1 once closed. */
  int socketFd;
  /** @brief Set by `shutdown()`. */
  bool shuttingDown;
  /** @brief Guards connection state changes in multi-threaded scenarios. */
  recursive_mutex connectionMutex;
  /** @brief Held for the duration of one record write. */
  std::mutex writeMutex;
};
}  // namespace apc

#endif  // __APC_CONNECTION__
