#ifndef __APC_EVENT_CODEC__
#define __APC_EVENT_CODEC__

#include "ApcErrors.hpp"
#include "Event.hpp"
#include "Headers.hpp"

namespace apc {
/**
 * @brief Converts between record text and Event/Command values.
 *
 * Record layout (all fields space padded, widths in Windows-1251 bytes):
 *   keyword[20] type[1] client[20] processId[6] invokeId[4] segments[4]
 *   (RS segment)* terminator
 * The terminator is ETX for a final record and ETB when more records for the
 * same answer follow. Records are raw Windows-1251; Event and Command text
 * is UTF-8.
 */
class EventCodec {
 public:
  static const int KEYWORD_WIDTH = 20;
  static const int CLIENT_ID_WIDTH = 20;
  static const int PROCESS_ID_WIDTH = 6;
  static const int INVOKE_ID_WIDTH = 4;
  static const int SEGMENT_COUNT_WIDTH = 4;
  static const int HEADER_SIZE = KEYWORD_WIDTH + 1 + CLIENT_ID_WIDTH +
                                 PROCESS_ID_WIDTH + INVOKE_ID_WIDTH +
                                 SEGMENT_COUNT_WIDTH;

  /**
   * @brief Parses one complete wire record, terminator included, and
   * transcodes its text fields to UTF-8.
   * @throws DecodeFailure naming the field or marker that did not parse.
   */
  static Event decode(const string& record);

  /**
   * @brief Lays out a command record in Windows-1251.
   * @throws EncodeFailure when a field does not fit or a segment contains a
   * control byte.
   */
  static string encode(const Command& command, const string& clientId,
                       int processId, int invokeId);

  /**
   * @brief Same layout as encode() for any type code and terminator; used to
   * build server records.
   */
  static string encodeRecord(const string& keyword, EventType type,
                             const string& clientId, int processId,
                             int invokeId, const vector<string>& segments,
                             bool incomplete);

 protected:
  static int parseNumber(const string& record, int offset, int width,
                         const char* field);
  static string pad(const string& value, int width, const char* field);
  static string padNumber(int value, int width, const char* field);
};
}  // namespace apc

#endif  // __APC_EVENT_CODEC__
