#ifndef __APC_EVENT__
#define __APC_EVENT__

#include "Headers.hpp"

namespace apc {
/** @brief Type code carried in byte 20 of every record. */
enum class EventType : char {
  COMMAND = 'C',
  NOTIFICATION = 'N',
  RESPONSE = 'R',
  DATA = 'D',
  PENDING = 'P',
  BUSY = 'B',
  ERROR = 'E',
};

enum class EventKind { NOTIFICATION, RESPONSE };

/** @brief Returns true for the type codes a server may send. */
bool isServerEventType(char code);

ostream& operator<<(ostream& os, EventType type);

// Session start marker
extern const char* const KEYWORD_AGENT_START;
extern const char* const STATUS_AGENT_STARTUP;

/**
 * @brief One decoded server record. Immutable once built.
 */
class Event {
 public:
  Event()
      : type(EventType::NOTIFICATION),
        processId(0),
        invokeId(0),
        segmentCount(0),
        incomplete(false) {}

  Event(const string& _keyword, EventType _type, const string& _clientId,
        int _processId, int _invokeId, int _segmentCount, bool _incomplete,
        const vector<string>& _segments);

  EventKind getKind() const {
    return type == EventType::NOTIFICATION ? EventKind::NOTIFICATION
                                           : EventKind::RESPONSE;
  }
  bool isNotification() const { return getKind() == EventKind::NOTIFICATION; }
  EventType getType() const { return type; }
  const string& getKeyword() const { return keyword; }
  const string& getClientId() const { return clientId; }
  int getProcessId() const { return processId; }
  /** @brief Zero for notifications. */
  int getInvokeId() const { return invokeId; }
  /** @brief Segment count declared in the header. */
  int getSegmentCount() const { return segmentCount; }
  /** @brief True when the record ended with ETB: more records follow. */
  bool isIncomplete() const { return incomplete; }

  /**
   * @brief True when the event ends its command: a final response, an error
   * or a busy answer.
   */
  bool isTerminal() const {
    return type == EventType::RESPONSE || type == EventType::ERROR ||
           type == EventType::BUSY;
  }

  /** @brief Raw data segments in wire order. */
  const vector<string>& getSegments() const { return segments; }
  /**
   * @brief True when every segment is a `NAME,VALUE` pair and the payload is
   * available through getFields().
   */
  bool hasFields() const { return !fields.empty(); }
  const map<string, string>& getFields() const { return fields; }
  /** @brief First segment, or empty when there is none. */
  string getStatus() const { return segments.empty() ? "" : segments[0]; }

  /** @brief The session start notification that opens every connection. */
  bool isStart() const {
    return type == EventType::NOTIFICATION &&
           keyword == KEYWORD_AGENT_START &&
           getStatus() == STATUS_AGENT_STARTUP;
  }

 protected:
  string keyword;
  EventType type;
  string clientId;
  int processId;
  int invokeId;
  int segmentCount;
  bool incomplete;
  vector<string> segments;
  map<string, string> fields;
};

ostream& operator<<(ostream& os, const Event& event);

/**
 * @brief An outgoing command: keyword plus ordered data segments.
 */
class Command {
 public:
  Command() {}
  explicit Command(const string& _keyword) : keyword(_keyword) {}
  Command(const string& _keyword, const vector<string>& _segments)
      : keyword(_keyword), segments(_segments) {}

  const string& getKeyword() const { return keyword; }
  const vector<string>& getSegments() const { return segments; }

 protected:
  string keyword;
  vector<string> segments;
};

/**
 * @brief Everything the server sent for one invoke id: the intermediate
 * data/pending events followed by the terminal event.
 */
class Response {
 public:
  Response() {}
  explicit Response(const vector<Event>& _events) : events(_events) {}

  const vector<Event>& getEvents() const { return events; }
  /** @brief The event that completed the command. */
  const Event& getTerminal() const;
  /** @brief True unless the terminal event is an error or busy answer. */
  bool isSuccess() const;
  /** @brief Segments of every DATA event, in arrival order. */
  vector<string> getData() const;

 protected:
  vector<Event> events;
};
}  // namespace apc

#endif  // __APC_EVENT__
