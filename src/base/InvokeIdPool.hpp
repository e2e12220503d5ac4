#ifndef __APC_INVOKE_ID_POOL__
#define __APC_INVOKE_ID_POOL__

#include "ApcErrors.hpp"
#include "Headers.hpp"

namespace apc {
/**
 * @brief Hands out the correlation ids that tie a command to its response.
 *
 * Ids run from 1 to maxId (zero belongs to notifications). Free ids are
 * reissued in FIFO order, so a just released id is the last to come back.
 */
class InvokeIdPool {
 public:
  static const int DEFAULT_MAX_ID = 9999;

  explicit InvokeIdPool(int _maxId = DEFAULT_MAX_ID);

  /**
   * @brief Takes a free id.
   * @throws IdentifierExhausted when every id is held.
   */
  int acquire();

  /**
   * @brief Takes a free id, waiting up to `wait` for one to be released.
   * @throws IdentifierExhausted when none came back in time.
   */
  int acquire(chrono::milliseconds wait);

  /**
   * @brief Returns an id to the pool.
   * @return false, leaving the pool untouched, when the id is not held.
   */
  bool release(int id);

  bool isHeld(int id) const;
  int getInUse() const;
  int getCapacity() const { return maxId; }

 protected:
  int takeFront();

  int maxId;
  deque<int> freeIds;
  unordered_set<int> heldIds;
  mutable std::mutex poolMutex;
  std::condition_variable idReleased;
};
}  // namespace apc

#endif  // __APC_INVOKE_ID_POOL__
