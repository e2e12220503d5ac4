#ifndef __APC_FAKE_AGENT_SERVER__
#define __APC_FAKE_AGENT_SERVER__

#include <queue>

#include "Cp1251.hpp"
#include "EventCodec.hpp"
#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"
#include "UnixSocketHandler.hpp"

namespace apc {
// Hands out pre-made socketpair ends instead of dialing out.
class SocketPairHandler : public UnixSocketHandler {
 public:
  void queueConnectFd(int fd) {
    lock_guard<std::mutex> guard(queueMutex);
    connectQueue.push(fd);
  }

  int connect(const SocketEndpoint&) override {
    lock_guard<std::mutex> guard(queueMutex);
    if (connectQueue.empty()) {
      return -1;
    }
    int fd = connectQueue.front();
    connectQueue.pop();
    addToActiveSockets(fd);
    initSocket(fd);
    return fd;
  }

 private:
  std::mutex queueMutex;
  std::queue<int> connectQueue;
};

// A command as the server sees it on the wire.
struct ReceivedCommand {
  string keyword;
  char type = 0;
  string clientId;
  int processId = 0;
  int invokeId = 0;
  int segmentCount = 0;
  vector<string> segments;
};

// Plays the agent server on the far end of a socketpair.
class FakeAgentServer {
 public:
  FakeAgentServer() : handler(make_shared<SocketPairHandler>()) {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    clientFd = fds[0];
    serverFd = fds[1];
    handler->queueConnectFd(clientFd);
  }

  ~FakeAgentServer() { closeServerSide(); }

  void sendRaw(const string& bytes) { RawSocketUtils::writeAll(serverFd, bytes); }

  void sendEvent(const string& keyword, EventType type, int invokeId,
                 const vector<string>& segments, bool incomplete = false) {
    sendRaw(EventCodec::encodeRecord(keyword, type, serverClientId, 4242,
                                     invokeId, segments, incomplete));
  }

  void sendStart() {
    sendEvent(KEYWORD_AGENT_START, EventType::NOTIFICATION, 0,
              {STATUS_AGENT_STARTUP});
  }

  void sendNotification(const string& keyword,
                        const vector<string>& segments) {
    sendEvent(keyword, EventType::NOTIFICATION, 0, segments);
  }

  // Answers a command with a successful final response.
  void respond(const ReceivedCommand& command,
               const vector<string>& segments = {"M00000"}) {
    sendEvent(command.keyword, EventType::RESPONSE, command.invokeId,
              segments);
  }

  ReceivedCommand readCommand(int timeoutMs = 5000) {
    // Header offsets are Windows-1251 bytes; only text fields are transcoded.
    string record = RawSocketUtils::readRecord(serverFd, timeoutMs);
    ReceivedCommand command;
    command.keyword = Cp1251::toUtf8(trim(record.substr(0, 20)));
    command.type = record[20];
    command.clientId = Cp1251::toUtf8(trim(record.substr(21, 20)));
    command.processId = stoi(trim(record.substr(41, 6)));
    command.invokeId = stoi(trim(record.substr(47, 4)));
    command.segmentCount = stoi(trim(record.substr(51, 4)));
    string rest = record.substr(55, record.length() - 56);
    if (!rest.empty()) {
      auto parts = split(rest.substr(1), RECORD_SEPARATOR);
      // getline drops a trailing empty segment
      if (rest.back() == RECORD_SEPARATOR) {
        parts.push_back("");
      }
      for (const auto& part : parts) {
        command.segments.push_back(Cp1251::toUtf8(part));
      }
    }
    return command;
  }

  // True once the client closed its end.
  bool clientHungUp(int timeoutMs = 2000) {
    fd_set input;
    FD_ZERO(&input);
    FD_SET(serverFd, &input);
    struct timeval timeout;
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;
    if (select(serverFd + 1, &input, NULL, NULL, &timeout) <= 0) {
      return false;
    }
    char c;
    return ::read(serverFd, &c, 1) == 0;
  }

  void closeServerSide() {
    if (serverFd >= 0) {
      ::close(serverFd);
      serverFd = -1;
    }
  }

  shared_ptr<SocketPairHandler> handler;
  // Client id field of every record the server sends.
  string serverClientId = "server";
  int clientFd;
  int serverFd;
};

inline SocketEndpoint fakeEndpoint() { return SocketEndpoint("fake", 1); }
}  // namespace apc

#endif  // __APC_FAKE_AGENT_SERVER__
