#include "InvokeIdPool.hpp"

namespace apc {
InvokeIdPool::InvokeIdPool(int _maxId) : maxId(_maxId) {
  if (maxId <= 0 || maxId > DEFAULT_MAX_ID) {
    throw std::invalid_argument("Invoke id range must be 1.." +
                                to_string(DEFAULT_MAX_ID) + ", got " +
                                to_string(maxId));
  }
  for (int id = 1; id <= maxId; id++) {
    freeIds.push_back(id);
  }
}

int InvokeIdPool::acquire() {
  lock_guard<std::mutex> guard(poolMutex);
  if (freeIds.empty()) {
    throw IdentifierExhausted("All " + to_string(maxId) +
                              " invoke ids are in use");
  }
  return takeFront();
}

int InvokeIdPool::acquire(chrono::milliseconds wait) {
  unique_lock<std::mutex> guard(poolMutex);
  if (!idReleased.wait_for(guard, wait, [this] { return !freeIds.empty(); })) {
    throw IdentifierExhausted("No invoke id came free within " +
                              to_string(wait.count()) + " ms");
  }
  return takeFront();
}

int InvokeIdPool::takeFront() {
  int id = freeIds.front();
  freeIds.pop_front();
  heldIds.insert(id);
  VLOG(3) << "Acquired invoke id " << id;
  return id;
}

bool InvokeIdPool::release(int id) {
  {
    lock_guard<std::mutex> guard(poolMutex);
    if (heldIds.erase(id) == 0) {
      LOG(ERROR) << "Tried to release invoke id " << id
                 << " which is not held";
      return false;
    }
    freeIds.push_back(id);
    VLOG(3) << "Released invoke id " << id;
  }
  idReleased.notify_one();
  return true;
}

bool InvokeIdPool::isHeld(int id) const {
  lock_guard<std::mutex> guard(poolMutex);
  return heldIds.find(id) != heldIds.end();
}

int InvokeIdPool::getInUse() const {
  lock_guard<std::mutex> guard(poolMutex);
  return int(heldIds.size());
}
}  // namespace apc
