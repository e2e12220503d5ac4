#ifndef __APC_SESSION__
#define __APC_SESSION__

#include "ApcErrors.hpp"
#include "Connection.hpp"
#include "Event.hpp"
#include "EventQueue.hpp"
#include "Headers.hpp"
#include "InvokeIdPool.hpp"
#include "RequestTable.hpp"
#include "SessionConfig.hpp"
#include "SocketHandler.hpp"

namespace apc {
enum class SessionState { OPEN, CLOSED };

/** @brief What the reader thread and stop() hand to the loop. */
struct SessionItem {
  enum Type { EVENT, STOP, READER_FAILED };

  Type type = EVENT;
  Event event;
  string reason;
};

/**
 * @brief One agent session on one connection.
 *
 * A reader thread frames and decodes server records into an internal queue.
 * The loop (run()) consumes that queue in arrival order, hands notifications
 * to the notification queue and responses to the command waiting on their
 * invoke id. Commands are issued with invoke() from any thread.
 *
 * The session is OPEN from a successful handshake until the first stop
 * request or connection failure, then CLOSED for good. Closing wakes every
 * waiting command with ConnectionClosed and closes the notification queue.
 */
class Session {
 public:
  /**
   * @brief Connects and waits for the AGTSTART notification.
   * @throws ConnectFailure when the connection cannot be made.
   * @throws HandshakeFailure when the first event is anything else, or none
   * arrives within handshakeTimeout. The socket is closed before throwing.
   */
  Session(shared_ptr<SocketHandler> _socketHandler,
          const SocketEndpoint& endpoint,
          const SessionConfig& _config = SessionConfig());

  /** @brief Stops the session, joins its threads and closes the socket. */
  virtual ~Session();

  /** @brief Runs the loop on the calling thread until the session closes. */
  void run();
  /** @brief Runs the loop on a thread owned by the session. */
  void start();
  /** @brief Asks the loop to close the session. Safe from any thread. */
  void stop();
  /** @brief Joins the thread started by start(). */
  void wait();

  /**
   * @brief Sends a command and blocks for every event answering it.
   *
   * The invoke id is released and the table entry removed on every exit.
   * @throws IdentifierExhausted, ConnectionClosed, CommandTimeout,
   * CommandCancelled, EncodeFailure
   */
  Response invoke(const Command& command,
                  const CommandOptions& options = CommandOptions());

  /** @brief Unsolicited events. Closed when the session closes. */
  shared_ptr<EventQueue<Event>> getNotifications() { return notifications; }

  SessionState getState() const {
    return open ? SessionState::OPEN : SessionState::CLOSED;
  }
  bool isOpen() const { return open; }

  /** @brief The AGTSTART notification that opened the session. */
  const Event& getStartEvent() const { return startEvent; }
  const SessionConfig& getConfig() const { return config; }
  int getProcessId() const { return processId; }

  int64_t getDecodeFailures() const { return decodeFailures; }
  int64_t getUnmatchedResponses() const { return unmatchedResponses; }
  int64_t getDroppedNotifications() const { return droppedNotifications; }
  int getInvokeIdsInUse() const { return invokeIds.getInUse(); }
  size_t getPendingRequests() const { return requests.size(); }

 protected:
  void readerLoop();
  void dispatch(const Event& event);
  /**
   * @brief Closes the session. Runs once; later calls return immediately.
   */
  void shutdown(const string& reason);

  SessionConfig config;
  int processId;
  shared_ptr<Connection> connection;
  InvokeIdPool invokeIds;
  RequestTable requests;
  shared_ptr<EventQueue<Event>> notifications;
  EventQueue<SessionItem> events;
  Event startEvent;

  atomic<bool> open;
  atomic<bool> stopRequested;
  atomic<bool> running;
  bool shutDown;
  std::mutex shutdownMutex;

  atomic<int64_t> decodeFailures;
  atomic<int64_t> unmatchedResponses;
  atomic<int64_t> droppedNotifications;

  shared_ptr<std::thread> readerThread;
  shared_ptr<std::thread> loopThread;
};
}  // namespace apc

#endif  // __APC_SESSION__
