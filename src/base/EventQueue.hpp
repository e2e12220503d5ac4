#ifndef __APC_EVENT_QUEUE__
#define __APC_EVENT_QUEUE__

#include "Headers.hpp"

namespace apc {
/**
 * @brief Bounded, closable multi-producer multi-consumer queue.
 *
 * After close() nothing more is accepted, but consumers keep draining what
 * was queued before pop() reports closure.
 */
template <typename T>
class EventQueue {
 public:
  explicit EventQueue(size_t _capacity) : capacity(_capacity), closed(false) {
    if (capacity == 0) {
      throw std::invalid_argument("Queue capacity must be positive");
    }
  }

  /**
   * @brief Waits for space, then enqueues.
   * @param interrupted Checked whenever the producer wakes up; returning true
   * gives up. Call wakeProducers() after changing what it reads.
   * @return false when the queue is closed or the wait was interrupted.
   */
  bool push(T item, const function<bool()>& interrupted) {
    unique_lock<std::mutex> guard(queueMutex);
    notFull.wait(guard, [&] {
      return closed || items.size() < capacity || interrupted();
    });
    if (closed || items.size() >= capacity) {
      return false;
    }
    items.push_back(std::move(item));
    guard.unlock();
    notEmpty.notify_one();
    return true;
  }

  /** @brief Enqueues only if there is room. */
  bool tryPush(T item) {
    unique_lock<std::mutex> guard(queueMutex);
    if (closed || items.size() >= capacity) {
      return false;
    }
    items.push_back(std::move(item));
    guard.unlock();
    notEmpty.notify_one();
    return true;
  }

  /** @brief Enqueues past the capacity. Used for control messages. */
  bool forcePush(T item) {
    unique_lock<std::mutex> guard(queueMutex);
    if (closed) {
      return false;
    }
    items.push_back(std::move(item));
    guard.unlock();
    notEmpty.notify_one();
    return true;
  }

  /**
   * @brief Blocks for the next item.
   * @return false once the queue is closed and empty.
   */
  bool pop(T* item) {
    unique_lock<std::mutex> guard(queueMutex);
    notEmpty.wait(guard, [this] { return closed || !items.empty(); });
    return takeFront(&guard, item);
  }

  /** @brief Like pop() but gives up after `timeout`. */
  bool popFor(T* item, chrono::milliseconds timeout) {
    unique_lock<std::mutex> guard(queueMutex);
    notEmpty.wait_for(guard, timeout,
                      [this] { return closed || !items.empty(); });
    return takeFront(&guard, item);
  }

  void close() {
    {
      lock_guard<std::mutex> guard(queueMutex);
      closed = true;
    }
    notEmpty.notify_all();
    notFull.notify_all();
  }

  /** @brief Makes blocked producers re-check their interrupt predicate. */
  void wakeProducers() {
    { lock_guard<std::mutex> guard(queueMutex); }
    notFull.notify_all();
  }

  bool isClosed() const {
    lock_guard<std::mutex> guard(queueMutex);
    return closed;
  }

  size_t size() const {
    lock_guard<std::mutex> guard(queueMutex);
    return items.size();
  }

  size_t getCapacity() const { return capacity; }

 protected:
  bool takeFront(unique_lock<std::mutex>* guard, T* item) {
    if (items.empty()) {
      return false;
    }
    *item = std::move(items.front());
    items.pop_front();
    guard->unlock();
    notFull.notify_one();
    return true;
  }

  size_t capacity;
  bool closed;
  deque<T> items;
  mutable std::mutex queueMutex;
  std::condition_variable notEmpty;
  std::condition_variable notFull;
};
}  // namespace apc

#endif  // __APC_EVENT_QUEUE__
