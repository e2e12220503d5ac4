#include "Session.hpp"

#include "EventCodec.hpp"
#include "FrameReader.hpp"

namespace apc {
namespace {
// Returns the invoke id to the pool when the command is done.
class InvokeIdLease {
 public:
  InvokeIdLease(InvokeIdPool* _pool, int _id) : pool(_pool), id(_id) {}
  ~InvokeIdLease() { pool->release(id); }

 private:
  InvokeIdPool* pool;
  int id;
};

// Removes the table entry. Declared after the lease so it runs first.
class RequestRegistration {
 public:
  RequestRegistration(RequestTable* _table, int _id)
      : table(_table), id(_id) {}
  ~RequestRegistration() { table->remove(id); }

 private:
  RequestTable* table;
  int id;
};

class CancellationSubscription {
 public:
  CancellationSubscription(shared_ptr<CancellationToken> _token,
                           function<void()> callback)
      : token(_token), subscription(0) {
    if (token) {
      subscription = token->subscribe(callback);
    }
  }
  ~CancellationSubscription() {
    if (token && subscription) {
      token->unsubscribe(subscription);
    }
  }

 private:
  shared_ptr<CancellationToken> token;
  int subscription;
};
}  // namespace

Session::Session(shared_ptr<SocketHandler> _socketHandler,
                 const SocketEndpoint& endpoint, const SessionConfig& _config)
    : config(_config),
      processId(int(getpid() % 1000000)),
      invokeIds(_config.maxInvokeId),
      notifications(
          make_shared<EventQueue<Event>>(_config.notificationCapacity)),
      events(_config.eventQueueCapacity),
      open(false),
      stopRequested(false),
      running(false),
      shutDown(false),
      decodeFailures(0),
      unmatchedResponses(0),
      droppedNotifications(0) {
  LOG(INFO) << "Connecting to " << endpoint;
  int fd = _socketHandler->connect(endpoint);
  if (fd < 0) {
    throw ConnectFailure("Could not connect to " + endpoint.getName() + ":" +
                         to_string(endpoint.getPort()));
  }
  connection = make_shared<Connection>(_socketHandler, fd);
  readerThread = make_shared<std::thread>(&Session::readerLoop, this);

  SessionItem first;
  string failure;
  if (!events.popFor(&first, config.handshakeTimeout)) {
    failure = "No event from the server within " +
              to_string(config.handshakeTimeout.count()) + " ms";
  } else if (first.type == SessionItem::READER_FAILED) {
    failure = "Connection lost before the handshake: " + first.reason;
  } else if (!first.event.isStart()) {
    failure = "Expected " + string(KEYWORD_AGENT_START) + " " +
              STATUS_AGENT_STARTUP + ", got " + first.event.getKeyword() +
              " " + first.event.getStatus();
  }
  if (!failure.empty()) {
    LOG(ERROR) << "Handshake failed: " << failure;
    shutdown(failure);
    readerThread->join();
    readerThread.reset();
    connection->closeSocket();
    throw HandshakeFailure(failure);
  }
  startEvent = first.event;
  open = true;
  LOG(INFO) << "Session started: " << startEvent;
}

Session::~Session() {
  stop();
  wait();
  shutdown("Session destroyed");
  if (readerThread) {
    readerThread->join();
    readerThread.reset();
  }
  connection->closeSocket();
}

void Session::readerLoop() {
  el::Helpers::setThreadName("apc-reader");
  FrameReader reader(connection->getSocketHandler(),
                     connection->getSocketFd(), config.readTimeout,
                     config.maxRecordSize);
  auto interrupted = [this] { return stopRequested.load(); };
  try {
    while (true) {
      string record = reader.readRecord();
      SessionItem item;
      try {
        item.event = EventCodec::decode(record);
      } catch (const DecodeFailure& df) {
        decodeFailures++;
        LOG(ERROR) << "Skipping malformed record: " << df.what();
        continue;
      }
      VLOG(1) << "Received " << item.event;
      if (!events.push(std::move(item), interrupted)) {
        VLOG(1) << "Event queue closed, reader exiting";
        return;
      }
    }
  } catch (const ConnectionClosed& cc) {
    if (connection->isShuttingDown()) {
      VLOG(1) << "Reader stopped: " << cc.what();
    } else {
      LOG(ERROR) << "Reader failed: " << cc.what();
    }
    SessionItem item;
    item.type = SessionItem::READER_FAILED;
    item.reason = cc.what();
    events.forcePush(std::move(item));
  }
}

void Session::run() {
  if (running.exchange(true)) {
    STFATAL << "Session loop is already running";
  }
  el::Helpers::setThreadName("apc-session");
  SessionItem item;
  while (events.pop(&item)) {
    if (item.type == SessionItem::STOP) {
      shutdown("Stop requested");
      break;
    }
    if (item.type == SessionItem::READER_FAILED) {
      shutdown(item.reason);
      break;
    }
    dispatch(item.event);
  }
  shutdown("Event queue closed");
  LOG(INFO) << "Session loop finished";
}

void Session::start() {
  loopThread = make_shared<std::thread>([this] { run(); });
}

void Session::stop() {
  if (stopRequested.exchange(true)) {
    return;
  }
  VLOG(1) << "Stop requested";
  SessionItem item;
  item.type = SessionItem::STOP;
  events.forcePush(std::move(item));
  // Producers blocked on a full queue re-check stopRequested.
  events.wakeProducers();
  notifications->wakeProducers();
}

void Session::wait() {
  if (loopThread && loopThread->joinable()) {
    loopThread->join();
  }
}

void Session::dispatch(const Event& event) {
  if (event.isNotification()) {
    if (config.notificationOverflow == OverflowPolicy::BLOCK) {
      if (!notifications->push(event,
                               [this] { return stopRequested.load(); })) {
        VLOG(1) << "Discarding " << event.getKeyword()
                << ", session is stopping";
      }
    } else if (!notifications->tryPush(event)) {
      droppedNotifications++;
      LOG(WARNING) << "Notification queue full, dropping "
                   << event.getKeyword();
    }
    return;
  }
  if (!requests.deliver(event)) {
    unmatchedResponses++;
    LOG(WARNING) << "No command waiting for " << event.getKeyword()
                 << " invoke id " << event.getInvokeId() << ", dropping it";
  }
}

void Session::shutdown(const string& reason) {
  {
    lock_guard<std::mutex> guard(shutdownMutex);
    if (shutDown) {
      return;
    }
    shutDown = true;
  }
  LOG(INFO) << "Closing session: " << reason;
  open = false;
  stopRequested = true;
  connection->shutdown();
  notifications->close();
  events.close();
  int aborted = requests.closeAll();
  if (aborted) {
    LOG(INFO) << "Aborted " << aborted << " pending commands";
  }
}

Response Session::invoke(const Command& command,
                         const CommandOptions& options) {
  if (!open) {
    throw ConnectionClosed("Session is closed");
  }
  int invokeId = config.invokeIdWait.count() > 0
                     ? invokeIds.acquire(config.invokeIdWait)
                     : invokeIds.acquire();
  InvokeIdLease lease(&invokeIds, invokeId);
  auto request = requests.add(invokeId);
  RequestRegistration registration(&requests, invokeId);

  string record =
      EventCodec::encode(command, config.clientId, processId, invokeId);
  CancellationSubscription subscription(options.cancellation,
                                        [request] { request->cancel(); });
  if (request->getState() == RequestState::CANCELLED) {
    throw CommandCancelled(command.getKeyword() + " was cancelled");
  }

  VLOG(1) << "Sending " << command.getKeyword() << " invoke id " << invokeId;
  try {
    connection->writeRecord(record);
  } catch (const ConnectionClosed& cc) {
    if (!stopRequested) {
      LOG(ERROR) << "Sending " << command.getKeyword()
                 << " failed: " << cc.what();
    }
    stop();
    throw;
  }

  optional<chrono::milliseconds> timeout = options.timeout;
  if (!timeout && config.commandTimeout.count() > 0) {
    timeout = config.commandTimeout;
  }
  switch (request->wait(timeout)) {
    case RequestState::COMPLETED:
      return request->getResponse();
    case RequestState::CLOSED:
      throw ConnectionClosed(command.getKeyword() +
                             " aborted, session closed");
    case RequestState::CANCELLED:
      throw CommandCancelled(command.getKeyword() + " was cancelled");
    case RequestState::WAITING:
      break;
  }
  throw CommandTimeout(command.getKeyword() + " got no response within " +
                       to_string(timeout ? timeout->count() : 0) + " ms");
}
}  // namespace apc
