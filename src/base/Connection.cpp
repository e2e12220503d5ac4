#include "Connection.hpp"

namespace apc {
Connection::Connection(shared_ptr<SocketHandler> _socketHandler, int _socketFd)
    : socketHandler(_socketHandler), socketFd(_socketFd), shuttingDown(false) {}

Connection::~Connection() {
  if (!shuttingDown) {
    STERROR << "Call shutdown before destructing a Connection.";
  }
  if (socketFd != -1) {
    LOG(INFO) << "Connection destroyed";
    closeSocket();
  }
}

void Connection::writeRecord(const string& record) {
  lock_guard<std::mutex> writeGuard(writeMutex);
  int fd;
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (shuttingDown || socketFd == -1) {
      throw ConnectionClosed("Tried to write to a closed connection");
    }
    fd = socketFd;
  }
  try {
    socketHandler->writeAllOrThrow(fd, record.data(), record.length(), true);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Write to fd " << fd << " failed: " << re.what();
    throw ConnectionClosed(string("Write failed: ") + re.what());
  }
  VLOG(2) << "Wrote " << record.length() << " bytes";
}

void Connection::shutdown() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (shuttingDown) {
    return;
  }
  LOG(INFO) << "Shutting down connection";
  shuttingDown = true;
  if (socketFd != -1) {
    socketHandler->shutdownSocket(socketFd);
  }
}

void Connection::closeSocket() {
  lock_guard<std::mutex> writeGuard(writeMutex);
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (socketFd == -1) {
    LOG(INFO) << "Tried to close a dead socket";
    return;
  }
  VLOG(1) << "Closing socket " << socketFd;
  socketHandler->close(socketFd);
  socketFd = -1;
}
}  // namespace apc
