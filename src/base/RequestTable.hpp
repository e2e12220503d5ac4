#ifndef __APC_REQUEST_TABLE__
#define __APC_REQUEST_TABLE__

#include "ApcErrors.hpp"
#include "Event.hpp"
#include "Headers.hpp"
#include "PendingRequest.hpp"

namespace apc {
/**
 * @brief Maps invoke ids to the commands waiting on them.
 *
 * Insert, remove and closeAll take the lock exclusively; delivery takes it
 * shared. Lock order is table lock, then a request's own lock.
 */
class RequestTable {
 public:
  RequestTable() : closed(false) {}

  /**
   * @brief Registers a request for a freshly acquired id.
   * @throws ConnectionClosed after closeAll().
   */
  shared_ptr<PendingRequest> add(int invokeId);

  /** @brief Removes the entry. Returns false when it was not there. */
  bool remove(int invokeId);

  /**
   * @brief Hands a response event to the request waiting on its id.
   * @return false when nobody waits for that id any more.
   */
  bool deliver(const Event& event);

  /**
   * @brief Refuses new registrations and wakes every registered request
   * with a shutdown signal. Entries stay until their owners remove them.
   * @return Number of requests signalled.
   */
  int closeAll();

  bool isClosed() const;
  size_t size() const;

 protected:
  bool closed;
  unordered_map<int, shared_ptr<PendingRequest>> requests;
  mutable std::shared_mutex tableMutex;
};
}  // namespace apc

#endif  // __APC_REQUEST_TABLE__
