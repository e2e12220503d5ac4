#include "InterruptWatcher.hpp"

namespace apc {
InterruptWatcher::InterruptWatcher(atomic<bool>* _interrupted,
                                   chrono::milliseconds _pollInterval)
    : interrupted(_interrupted),
      pollInterval(_pollInterval),
      interrupts(0),
      done(false),
      token(make_shared<CancellationToken>()) {
  watchThread = std::thread(&InterruptWatcher::run, this);
}

InterruptWatcher::~InterruptWatcher() {
  {
    lock_guard<std::mutex> guard(tokenMutex);
    done = true;
  }
  wake.notify_all();
  watchThread.join();
}

shared_ptr<CancellationToken> InterruptWatcher::renewToken() {
  lock_guard<std::mutex> guard(tokenMutex);
  token = make_shared<CancellationToken>();
  return token;
}

shared_ptr<CancellationToken> InterruptWatcher::getToken() {
  lock_guard<std::mutex> guard(tokenMutex);
  return token;
}

void InterruptWatcher::run() {
  el::Helpers::setThreadName("apc-interrupt");
  while (true) {
    shared_ptr<CancellationToken> current;
    {
      unique_lock<std::mutex> guard(tokenMutex);
      wake.wait_for(guard, pollInterval, [this] { return done; });
      if (done) {
        return;
      }
      if (!interrupted->exchange(false)) {
        continue;
      }
      current = token;
    }
    interrupts++;
    LOG(INFO) << "Interrupted, cancelling pending commands";
    // Outside the lock: cancel() runs the waiting commands' callbacks
    current->cancel();
  }
}
}  // namespace apc
