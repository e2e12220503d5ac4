#include "CancellationToken.hpp"

namespace apc {
void CancellationToken::cancel() {
  map<int, function<void()>> toRun;
  {
    lock_guard<std::mutex> guard(tokenMutex);
    if (cancelled) {
      return;
    }
    cancelled = true;
    toRun.swap(callbacks);
  }
  // Callbacks take their own locks; never call them under tokenMutex.
  for (auto& it : toRun) {
    it.second();
  }
}

bool CancellationToken::isCancelled() const {
  lock_guard<std::mutex> guard(tokenMutex);
  return cancelled;
}

int CancellationToken::subscribe(function<void()> callback) {
  {
    lock_guard<std::mutex> guard(tokenMutex);
    if (!cancelled) {
      int subscription = nextSubscription++;
      callbacks[subscription] = std::move(callback);
      return subscription;
    }
  }
  callback();
  return 0;
}

void CancellationToken::unsubscribe(int subscription) {
  lock_guard<std::mutex> guard(tokenMutex);
  callbacks.erase(subscription);
}
}  // namespace apc
