#include "RequestTable.hpp"

namespace apc {
shared_ptr<PendingRequest> RequestTable::add(int invokeId) {
  unique_lock<std::shared_mutex> guard(tableMutex);
  if (closed) {
    throw ConnectionClosed("Session is closed");
  }
  if (requests.find(invokeId) != requests.end()) {
    STFATAL << "Invoke id " << invokeId << " is already pending";
  }
  auto request = make_shared<PendingRequest>(invokeId);
  requests[invokeId] = request;
  return request;
}

bool RequestTable::remove(int invokeId) {
  unique_lock<std::shared_mutex> guard(tableMutex);
  return requests.erase(invokeId) > 0;
}

bool RequestTable::deliver(const Event& event) {
  shared_lock<std::shared_mutex> guard(tableMutex);
  auto it = requests.find(event.getInvokeId());
  if (it == requests.end()) {
    return false;
  }
  return it->second->deliver(event);
}

int RequestTable::closeAll() {
  unique_lock<std::shared_mutex> guard(tableMutex);
  closed = true;
  int signalled = 0;
  for (auto& it : requests) {
    it.second->close();
    signalled++;
  }
  return signalled;
}

bool RequestTable::isClosed() const {
  shared_lock<std::shared_mutex> guard(tableMutex);
  return closed;
}

size_t RequestTable::size() const {
  shared_lock<std::shared_mutex> guard(tableMutex);
  return requests.size();
}
}  // namespace apc
