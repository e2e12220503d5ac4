#ifndef __APC_INTERRUPT_WATCHER__
#define __APC_INTERRUPT_WATCHER__

#include "CancellationToken.hpp"
#include "Headers.hpp"

namespace apc {
/**
 * @brief Turns an interrupt flag raised by a signal handler into a cancel()
 * on the token agent commands carry.
 *
 * Signal handlers may only store to the flag, so a background thread polls
 * it. Each raise is consumed and cancels the token current at that moment;
 * commands blocked without a timeout then wake with CommandCancelled.
 */
class InterruptWatcher {
 public:
  explicit InterruptWatcher(atomic<bool>* _interrupted,
                            chrono::milliseconds _pollInterval =
                                chrono::milliseconds(100));
  ~InterruptWatcher();

  /**
   * @brief Swaps in a fresh token, so commands sent after an interrupt run
   * until the next one.
   */
  shared_ptr<CancellationToken> renewToken();

  shared_ptr<CancellationToken> getToken();

  /** @brief Number of interrupts seen so far. */
  int getInterrupts() const { return interrupts; }

 protected:
  void run();

  atomic<bool>* interrupted;
  chrono::milliseconds pollInterval;
  atomic<int> interrupts;
  bool done;
  std::mutex tokenMutex;
  std::condition_variable wake;
  shared_ptr<CancellationToken> token;
  std::thread watchThread;
};
}  // namespace apc

#endif  // __APC_INTERRUPT_WATCHER__
