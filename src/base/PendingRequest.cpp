#include "PendingRequest.hpp"

namespace apc {
ostream& operator<<(ostream& os, RequestState state) {
  switch (state) {
    case RequestState::WAITING:
      return os << "WAITING";
    case RequestState::COMPLETED:
      return os << "COMPLETED";
    case RequestState::CLOSED:
      return os << "CLOSED";
    case RequestState::CANCELLED:
      return os << "CANCELLED";
  }
  return os << "UNKNOWN";
}

PendingRequest::PendingRequest(int _invokeId)
    : invokeId(_invokeId), state(RequestState::WAITING) {}

bool PendingRequest::deliver(const Event& event) {
  {
    lock_guard<std::mutex> guard(requestMutex);
    if (state != RequestState::WAITING) {
      VLOG(1) << "Invoke id " << invokeId << " is already " << state
              << ", refusing " << event.getKeyword();
      return false;
    }
    events.push_back(event);
    if (!event.isTerminal()) {
      VLOG(1) << "Invoke id " << invokeId << " got intermediate "
              << event.getType() << " event";
      return true;
    }
    state = RequestState::COMPLETED;
  }
  stateChanged.notify_all();
  return true;
}

void PendingRequest::close() { finish(RequestState::CLOSED); }

void PendingRequest::cancel() { finish(RequestState::CANCELLED); }

bool PendingRequest::finish(RequestState newState) {
  {
    lock_guard<std::mutex> guard(requestMutex);
    if (state != RequestState::WAITING) {
      return false;
    }
    state = newState;
  }
  stateChanged.notify_all();
  return true;
}

RequestState PendingRequest::wait(
    const optional<chrono::milliseconds>& timeout) {
  unique_lock<std::mutex> guard(requestMutex);
  auto done = [this] { return state != RequestState::WAITING; };
  if (timeout) {
    stateChanged.wait_for(guard, *timeout, done);
  } else {
    stateChanged.wait(guard, done);
  }
  return state;
}

RequestState PendingRequest::getState() const {
  lock_guard<std::mutex> guard(requestMutex);
  return state;
}

Response PendingRequest::getResponse() const {
  lock_guard<std::mutex> guard(requestMutex);
  return Response(events);
}
}  // namespace apc
