#include "Event.hpp"

namespace apc {
const char* const KEYWORD_AGENT_START = "AGTSTART";
const char* const STATUS_AGENT_STARTUP = "AGENT_STARTUP";

bool isServerEventType(char code) {
  switch (EventType(code)) {
    case EventType::NOTIFICATION:
    case EventType::RESPONSE:
    case EventType::DATA:
    case EventType::PENDING:
    case EventType::BUSY:
    case EventType::ERROR:
      return true;
    default:
      return false;
  }
}

ostream& operator<<(ostream& os, EventType type) { return os << char(type); }

Event::Event(const string& _keyword, EventType _type, const string& _clientId,
             int _processId, int _invokeId, int _segmentCount,
             bool _incomplete, const vector<string>& _segments)
    : keyword(_keyword),
      type(_type),
      clientId(_clientId),
      processId(_processId),
      invokeId(_invokeId),
      segmentCount(_segmentCount),
      incomplete(_incomplete),
      segments(_segments) {
  map<string, string> pairs;
  for (const auto& segment : segments) {
    auto comma = segment.find(',');
    if (comma == string::npos || comma == 0) {
      return;
    }
    pairs[segment.substr(0, comma)] = segment.substr(comma + 1);
  }
  fields.swap(pairs);
}

ostream& operator<<(ostream& os, const Event& event) {
  os << event.getKeyword() << " type=" << event.getType()
     << " client=" << event.getClientId()
     << " process_id=" << event.getProcessId()
     << " invoke_id=" << event.getInvokeId()
     << " segments=" << event.getSegmentCount();
  if (event.isIncomplete()) {
    os << " incomplete";
  }
  return os;
}

const Event& Response::getTerminal() const {
  if (events.empty()) {
    STFATAL << "Tried to read the terminal event of an empty response";
  }
  return events.back();
}

bool Response::isSuccess() const {
  if (events.empty()) {
    return false;
  }
  auto type = getTerminal().getType();
  return type != EventType::ERROR && type != EventType::BUSY;
}

vector<string> Response::getData() const {
  vector<string> data;
  for (const auto& event : events) {
    if (event.getType() == EventType::DATA) {
      data.insert(data.end(), event.getSegments().begin(),
                  event.getSegments().end());
    }
  }
  return data;
}
}  // namespace apc
