#ifndef __APC_FRAME_READER__
#define __APC_FRAME_READER__

#include "ApcErrors.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace apc {
/**
 * @brief Splits the server byte stream into complete records.
 *
 * A record ends at the first ETX or ETB byte. Bytes after the last terminator
 * are kept and joined with the next chunk, so a record may straddle any
 * number of reads and one read may carry several records. Completed records
 * stay in Windows-1251; EventCodec transcodes their text fields.
 */
class FrameReader {
 public:
  static const size_t DEFAULT_MAX_RECORD_SIZE = 64 * 1024;

  /**
   * @param _readTimeout Rolling deadline for each read. Zero waits forever.
   */
  FrameReader(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
              chrono::milliseconds _readTimeout,
              size_t _maxRecordSize = DEFAULT_MAX_RECORD_SIZE);

  /**
   * @brief Blocks until one record is complete and returns it (terminator
   * included).
   * @throws StreamTimeout when no byte arrives before the deadline.
   * @throws ConnectionClosed when the peer closed or the read failed.
   */
  string readRecord();

  /** @brief Feeds raw wire bytes into the framing buffer. */
  void append(const char* data, size_t count);

  /** @brief Pops the oldest completed record, if any. */
  bool popRecord(string* record);

  /** @brief Bytes of the record currently being assembled. */
  size_t getPartialSize() const { return partialRecord.length(); }

  /** @brief Number of oversized records thrown away so far. */
  int64_t getDiscardedRecords() const { return discardedRecords; }

 protected:
  /** @brief Reads one chunk from the socket into the framing buffer. */
  void readChunk();

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  chrono::milliseconds readTimeout;
  size_t maxRecordSize;
  /** @brief Raw bytes after the last terminator seen. */
  string partialRecord;
  deque<string> completeRecords;
  int64_t discardedRecords;
};
}  // namespace apc

#endif  // __APC_FRAME_READER__
