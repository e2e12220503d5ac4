#ifndef __APC_PENDING_REQUEST__
#define __APC_PENDING_REQUEST__

#include "Event.hpp"
#include "Headers.hpp"

namespace apc {
enum class RequestState { WAITING, COMPLETED, CLOSED, CANCELLED };

ostream& operator<<(ostream& os, RequestState state);

/**
 * @brief One in-flight command: collects the events answering its invoke id
 * until a terminal one arrives. The first state change out of WAITING wins;
 * later signals are ignored.
 */
class PendingRequest {
 public:
  explicit PendingRequest(int _invokeId);

  int getInvokeId() const { return invokeId; }

  /**
   * @brief Records an event for this request.
   * @return false when the request already finished and the event was
   * dropped.
   */
  bool deliver(const Event& event);

  /** @brief Shutdown signal: the connection is gone. */
  void close();

  void cancel();

  /**
   * @brief Blocks until the request leaves WAITING or the timeout passes.
   * @return The state at return; WAITING means the wait timed out.
   */
  RequestState wait(const optional<chrono::milliseconds>& timeout);

  RequestState getState() const;

  /** @brief Events collected so far, terminal event last once COMPLETED. */
  Response getResponse() const;

 protected:
  bool finish(RequestState newState);

  int invokeId;
  RequestState state;
  vector<Event> events;
  mutable std::mutex requestMutex;
  std::condition_variable stateChanged;
};
}  // namespace apc

#endif  // __APC_PENDING_REQUEST__
