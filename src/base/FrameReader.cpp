#include "FrameReader.hpp"

namespace apc {
namespace {
// Poll interval while waiting for data, so the deadline is checked
// regularly.
const int64_t WAIT_SLICE_USEC = 100 * 1000;
}  // namespace

FrameReader::FrameReader(shared_ptr<SocketHandler> _socketHandler,
                         int _socketFd, chrono::milliseconds _readTimeout,
                         size_t _maxRecordSize)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      readTimeout(_readTimeout),
      maxRecordSize(_maxRecordSize),
      discardedRecords(0) {}

string FrameReader::readRecord() {
  string record;
  while (!popRecord(&record)) {
    readChunk();
  }
  return record;
}

void FrameReader::readChunk() {
  auto deadline = chrono::steady_clock::now() + readTimeout;
  while (true) {
    if (socketHandler->waitForData(socketFd, 0, WAIT_SLICE_USEC)) {
      char buf[MAX_CHUNK_SIZE];
      ssize_t bytesRead = socketHandler->read(socketFd, buf, MAX_CHUNK_SIZE);
      if (bytesRead > 0) {
        VLOG(3) << "Read " << bytesRead << " bytes from fd " << socketFd;
        append(buf, bytesRead);
        return;
      }
      if (bytesRead == 0) {
        throw ConnectionClosed("Server closed the connection");
      }
      auto localErrno = GetErrno();
      if (localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
          localErrno != EINTR) {
        throw ConnectionClosed(string("Read failed: ") +
                               strerror(localErrno));
      }
    }
    if (readTimeout.count() > 0 && chrono::steady_clock::now() >= deadline) {
      throw StreamTimeout("No data from the server for " +
                          to_string(readTimeout.count()) + " ms");
    }
  }
}

void FrameReader::append(const char* data, size_t count) {
  size_t start = 0;
  for (size_t i = 0; i < count; i++) {
    if (data[i] != END_OF_TEXT && data[i] != END_OF_TRANSMISSION_BLOCK) {
      continue;
    }
    partialRecord.append(data + start, i + 1 - start);
    start = i + 1;
    if (partialRecord.length() > maxRecordSize) {
      LOG(ERROR) << "Dropping a record of " << partialRecord.length()
                 << " bytes, limit is " << maxRecordSize;
      discardedRecords++;
    } else {
      VLOG(2) << "Record: " << partialRecord;
      completeRecords.push_back(partialRecord);
    }
    partialRecord.clear();
  }
  if (start < count) {
    partialRecord.append(data + start, count - start);
    if (partialRecord.length() > maxRecordSize) {
      LOG(ERROR) << "Record grew past " << maxRecordSize
                 << " bytes without a terminator, discarding it";
      discardedRecords++;
      partialRecord.clear();
    }
  }
}

bool FrameReader::popRecord(string* record) {
  if (completeRecords.empty()) {
    return false;
  }
  *record = completeRecords.front();
  completeRecords.pop_front();
  return true;
}
}  // namespace apc
