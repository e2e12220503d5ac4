#include "AgentClient.hpp"

namespace apc {
const char* const NOTIFY_CALL = "AGTCallNotify";
const char* const NOTIFY_AUTO_RELEASE_LINE = "AGTAutoReleaseLine";
const char* const NOTIFY_JOB_END = "AGTJobEnd";
const char* const NOTIFY_SYSTEM_ERROR = "AGTSystemError";
const char* const NOTIFY_HEADSET_CONN_BROKEN = "AGTHeadsetConnBroken";

string toWire(ListType listType) {
  return listType == ListType::OUTBOUND ? "O" : "I";
}

Field Field::parse(const string& segment) {
  Field field;
  size_t first = segment.find(',');
  size_t second =
      first == string::npos ? string::npos : segment.find(',', first + 1);
  size_t third =
      second == string::npos ? string::npos : segment.find(',', second + 1);
  if (third == string::npos) {
    field.value = segment;
    return field;
  }
  string length = trim(segment.substr(second + 1, third - second - 1));
  if (length.empty() ||
      length.find_first_not_of("0123456789") != string::npos) {
    field.value = segment;
    return field;
  }
  field.name = segment.substr(0, first);
  field.type = segment.substr(first + 1, second - first - 1);
  field.length = stoi(length);
  field.value = segment.substr(third + 1);
  return field;
}

ostream& operator<<(ostream& os, const Field& field) {
  if (field.name.empty()) {
    return os << field.value;
  }
  return os << field.name << "(" << field.type << "," << field.length
            << ")=" << field.value;
}

Response AgentClient::execute(const Command& command) {
  Response response = session->invoke(command, commandOptions);
  if (!response.isSuccess()) {
    const Event& terminal = response.getTerminal();
    const auto& segments = terminal.getSegments();
    string message = segments.size() > 1 ? segments[1] : "";
    LOG(WARNING) << command.getKeyword() << " answered with "
                 << terminal.getType() << " " << terminal.getStatus();
    throw CommandFailed(command.getKeyword(), terminal.getStatus(), message);
  }
  return response;
}

vector<string> AgentClient::payloadOf(const Response& response) {
  vector<string> data = response.getData();
  if (!data.empty()) {
    return data;
  }
  const auto& segments = response.getTerminal().getSegments();
  if (segments.size() > 1) {
    data.assign(segments.begin() + 1, segments.end());
  }
  return data;
}

void AgentClient::logon(const string& agentName, const string& password) {
  execute(Command("AGTLogon", {agentName, password}));
}

void AgentClient::logoff() { execute(Command("AGTLogoff")); }

void AgentClient::reserveHeadset(int headsetId) {
  execute(Command("AGTReserveHeadset", {to_string(headsetId)}));
}

void AgentClient::freeHeadset() { execute(Command("AGTFreeHeadset")); }

void AgentClient::connectHeadset() { execute(Command("AGTConnHeadset")); }

void AgentClient::disconnectHeadset() {
  execute(Command("AGTDisconnHeadset"));
}

vector<string> AgentClient::listJobs() {
  return payloadOf(execute(Command("AGTListJobs")));
}

void AgentClient::attachJob(const string& jobName) {
  execute(Command("AGTAttachJob", {jobName}));
}

void AgentClient::detachJob() { execute(Command("AGTDetachJob")); }

vector<string> AgentClient::listState() {
  return payloadOf(execute(Command("AGTListState")));
}

void AgentClient::setWorkClass(const string& workClass) {
  execute(Command("AGTSetWorkClass", {workClass}));
}

void AgentClient::setNotifyKeyField(ListType listType,
                                    const string& fieldName) {
  execute(Command("AGTSetNotifyKeyField", {toWire(listType), fieldName}));
}

void AgentClient::setDataField(ListType listType, const string& fieldName) {
  execute(Command("AGTSetDataField", {toWire(listType), fieldName}));
}

Field AgentClient::readField(ListType listType, const string& fieldName) {
  auto payload =
      payloadOf(execute(Command("AGTReadField", {toWire(listType), fieldName})));
  if (payload.empty()) {
    throw CommandFailed("AGTReadField", "",
                        "No value returned for " + fieldName);
  }
  return Field::parse(payload.front());
}

void AgentClient::updateField(ListType listType, const string& fieldName,
                              const string& value) {
  execute(Command("AGTUpdateField", {toWire(listType), fieldName, value}));
}

void AgentClient::availWork() { execute(Command("AGTAvailWork")); }

void AgentClient::noFurtherWork() { execute(Command("AGTNoFurtherWork")); }

void AgentClient::readyNextItem() { execute(Command("AGTReadyNextItem")); }

void AgentClient::releaseLine() { execute(Command("AGTReleaseLine")); }

void AgentClient::hangupCall() { execute(Command("AGTHangupCall")); }

void AgentClient::finishedItem(int completionCode) {
  execute(Command("AGTFinishedItem", {to_string(completionCode)}));
}
}  // namespace apc
