#include "EventCodec.hpp"

#include "Cp1251.hpp"

namespace apc {
Event EventCodec::decode(const string& record) {
  if (record.empty()) {
    throw DecodeFailure("Empty record");
  }
  char terminator = record.back();
  if (terminator != END_OF_TEXT && terminator != END_OF_TRANSMISSION_BLOCK) {
    throw DecodeFailure("Record is missing its ETX/ETB terminator");
  }
  // Offsets count Windows-1251 bytes; text is transcoded per field.
  string body = record.substr(0, record.length() - 1);
  if (int(body.length()) < HEADER_SIZE) {
    throw DecodeFailure("Record shorter than the header: " +
                        to_string(body.length()) + " < " +
                        to_string(HEADER_SIZE) + " bytes");
  }

  int offset = 0;
  string keyword = Cp1251::toUtf8(trim(body.substr(offset, KEYWORD_WIDTH)));
  if (keyword.empty()) {
    throw DecodeFailure("Record has an empty keyword");
  }
  offset += KEYWORD_WIDTH;

  char typeCode = body[offset];
  if (!isServerEventType(typeCode)) {
    throw DecodeFailure(string("Unknown event type '") + typeCode +
                        "' for keyword " + keyword);
  }
  offset += 1;

  string clientId =
      Cp1251::toUtf8(trim(body.substr(offset, CLIENT_ID_WIDTH)));
  offset += CLIENT_ID_WIDTH;

  int processId = parseNumber(body, offset, PROCESS_ID_WIDTH, "process id");
  offset += PROCESS_ID_WIDTH;
  int invokeId = parseNumber(body, offset, INVOKE_ID_WIDTH, "invoke id");
  offset += INVOKE_ID_WIDTH;
  int segmentCount =
      parseNumber(body, offset, SEGMENT_COUNT_WIDTH, "segment count");
  offset += SEGMENT_COUNT_WIDTH;

  vector<string> segments;
  string rest = body.substr(offset);
  if (!rest.empty()) {
    if (rest[0] != RECORD_SEPARATOR) {
      throw DecodeFailure("Segment marker missing after the header of " +
                          keyword);
    }
    size_t start = 1;
    while (true) {
      size_t next = rest.find(RECORD_SEPARATOR, start);
      if (next == string::npos) {
        segments.push_back(Cp1251::toUtf8(rest.substr(start)));
        break;
      }
      segments.push_back(Cp1251::toUtf8(rest.substr(start, next - start)));
      start = next + 1;
    }
  }
  if (int(segments.size()) != segmentCount) {
    // The server counts segments per answer, not per record.
    VLOG(2) << keyword << " declares " << segmentCount << " segments, record has "
            << segments.size();
  }

  return Event(keyword, EventType(typeCode), clientId, processId, invokeId,
               segmentCount, terminator == END_OF_TRANSMISSION_BLOCK,
               segments);
}

string EventCodec::encode(const Command& command, const string& clientId,
                          int processId, int invokeId) {
  return encodeRecord(command.getKeyword(), EventType::COMMAND, clientId,
                      processId, invokeId, command.getSegments(), false);
}

string EventCodec::encodeRecord(const string& keyword, EventType type,
                                const string& clientId, int processId,
                                int invokeId, const vector<string>& segments,
                                bool incomplete) {
  if (trim(keyword).empty()) {
    throw EncodeFailure("Command keyword is empty");
  }
  // Widths are Windows-1251 bytes, so transcode before padding.
  string record;
  record.reserve(HEADER_SIZE + 64);
  record += pad(Cp1251::fromUtf8(keyword), KEYWORD_WIDTH, "keyword");
  record += char(type);
  record += pad(Cp1251::fromUtf8(clientId), CLIENT_ID_WIDTH, "client id");
  record += padNumber(processId, PROCESS_ID_WIDTH, "process id");
  record += padNumber(invokeId, INVOKE_ID_WIDTH, "invoke id");
  record += padNumber(int(segments.size()), SEGMENT_COUNT_WIDTH,
                      "segment count");
  for (const auto& segment : segments) {
    string wire = Cp1251::fromUtf8(segment);
    if (wire.find_first_of(string{RECORD_SEPARATOR, END_OF_TEXT,
                                  END_OF_TRANSMISSION_BLOCK}) != string::npos) {
      throw EncodeFailure("Segment of " + keyword +
                          " contains a control byte");
    }
    record += RECORD_SEPARATOR;
    record += wire;
  }
  record += incomplete ? END_OF_TRANSMISSION_BLOCK : END_OF_TEXT;
  return record;
}

int EventCodec::parseNumber(const string& record, int offset, int width,
                            const char* field) {
  string text = trim(record.substr(offset, width));
  if (text.empty()) {
    return 0;
  }
  if (text.find_first_not_of("0123456789") != string::npos) {
    throw DecodeFailure(string("Invalid ") + field + ": '" + text + "'");
  }
  return stoi(text);
}

string EventCodec::pad(const string& value, int width, const char* field) {
  if (int(value.length()) > width) {
    throw EncodeFailure(string("Field ") + field + " is longer than " +
                        to_string(width) + " bytes: " + value);
  }
  return value + string(width - value.length(), ' ');
}

string EventCodec::padNumber(int value, int width, const char* field) {
  if (value < 0) {
    throw EncodeFailure(string("Field ") + field + " is negative");
  }
  return pad(to_string(value), width, field);
}
}  // namespace apc
