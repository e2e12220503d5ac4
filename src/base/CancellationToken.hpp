#ifndef __APC_CANCELLATION_TOKEN__
#define __APC_CANCELLATION_TOKEN__

#include "Headers.hpp"

namespace apc {
/**
 * @brief Caller-owned switch that aborts in-flight commands. One token may
 * be shared by several commands; cancelling is permanent.
 */
class CancellationToken {
 public:
  CancellationToken() : cancelled(false), nextSubscription(1) {}

  /** @brief Fires every subscribed callback once. */
  void cancel();

  bool isCancelled() const;

  /**
   * @brief Registers a callback for cancel(). Runs it immediately when the
   * token is already cancelled.
   * @return Handle for unsubscribe(), 0 when the callback already ran.
   */
  int subscribe(function<void()> callback);

  void unsubscribe(int subscription);

 protected:
  bool cancelled;
  int nextSubscription;
  map<int, function<void()>> callbacks;
  mutable std::mutex tokenMutex;
};
}  // namespace apc

#endif  // __APC_CANCELLATION_TOKEN__
