#ifndef __APC_AGENT_CLIENT__
#define __APC_AGENT_CLIENT__

#include "ApcErrors.hpp"
#include "Headers.hpp"
#include "Session.hpp"

namespace apc {
/** @brief Which calling list a field command addresses. */
enum class ListType { OUTBOUND, INBOUND };

string toWire(ListType listType);

// Notification keywords pushed by the server
extern const char* const NOTIFY_CALL;
extern const char* const NOTIFY_AUTO_RELEASE_LINE;
extern const char* const NOTIFY_JOB_END;
extern const char* const NOTIFY_SYSTEM_ERROR;
extern const char* const NOTIFY_HEADSET_CONN_BROKEN;

/** @brief One field description returned by AGTReadField. */
struct Field {
  string name;
  string type;
  int length = 0;
  string value;

  /**
   * @brief Parses `NAME,TYPE,LENGTH,VALUE`. The value keeps any commas. A
   * segment that does not have all four parts becomes the value alone.
   */
  static Field parse(const string& segment);
};

ostream& operator<<(ostream& os, const Field& field);

/**
 * @brief Agent operations on top of a Session. Every call sends one command
 * and waits for its answer; an error or busy answer throws CommandFailed.
 */
class AgentClient {
 public:
  explicit AgentClient(shared_ptr<Session> _session) : session(_session) {}

  void logon(const string& agentName, const string& password);
  void logoff();

  void reserveHeadset(int headsetId);
  void freeHeadset();
  void connectHeadset();
  void disconnectHeadset();

  vector<string> listJobs();
  void attachJob(const string& jobName);
  void detachJob();
  /** @brief Current agent state entries. */
  vector<string> listState();
  void setWorkClass(const string& workClass);

  void setNotifyKeyField(ListType listType, const string& fieldName);
  void setDataField(ListType listType, const string& fieldName);
  Field readField(ListType listType, const string& fieldName);
  void updateField(ListType listType, const string& fieldName,
                   const string& value);

  void availWork();
  void noFurtherWork();
  void readyNextItem();
  void releaseLine();
  void hangupCall();
  void finishedItem(int completionCode);

  /**
   * @brief Sends any command and returns the server's answer.
   * @throws CommandFailed when the answer is an error or busy event.
   */
  Response execute(const Command& command);

  shared_ptr<EventQueue<Event>> notifications() {
    return session->getNotifications();
  }

  /** @brief Options applied to every command, e.g. a cancellation token. */
  void setCommandOptions(const CommandOptions& options) {
    commandOptions = options;
  }

  shared_ptr<Session> getSession() { return session; }

 protected:
  /**
   * @brief Payload of an answer: the DATA segments, or the terminal segments
   * after the status when the server sent no DATA event.
   */
  static vector<string> payloadOf(const Response& response);

  shared_ptr<Session> session;
  CommandOptions commandOptions;
};
}  // namespace apc

#endif  // __APC_AGENT_CLIENT__
