#include "FakeAgentServer.hpp"
#include "Session.hpp"
#include "TestHeaders.hpp"

using namespace apc;

namespace {
SessionConfig testConfig() {
  SessionConfig config;
  config.clientId = "tester";
  config.handshakeTimeout = chrono::seconds(5);
  return config;
}

shared_ptr<Session> startSession(FakeAgentServer* server,
                                 SessionConfig config = testConfig()) {
  server->sendStart();
  auto session =
      make_shared<Session>(server->handler, fakeEndpoint(), config);
  session->start();
  return session;
}

Event popNotification(Session* session) {
  Event event;
  if (!session->getNotifications()->popFor(&event, chrono::seconds(5))) {
    throw std::runtime_error("No notification arrived");
  }
  return event;
}
}  // namespace

TEST_CASE("Session handshake accepts the start notification", "[Session]") {
  FakeAgentServer server;
  server.sendStart();
  Session session(server.handler, fakeEndpoint(), testConfig());

  REQUIRE(session.isOpen());
  REQUIRE(session.getState() == SessionState::OPEN);
  REQUIRE(session.getStartEvent().isStart());
  REQUIRE(session.getStartEvent().getKeyword() == "AGTSTART");
  REQUIRE(session.getInvokeIdsInUse() == 0);
}

TEST_CASE("Session construction fails on a bad first event", "[Session]") {
  FakeAgentServer server;
  server.sendNotification("ERROR", {"E70000"});

  REQUIRE_THROWS_AS(Session(server.handler, fakeEndpoint(), testConfig()),
                    HandshakeFailure);
  REQUIRE(server.handler->getActiveSockets().empty());
  REQUIRE(server.clientHungUp());
}

TEST_CASE("Session construction fails when the first event is a response",
          "[Session]") {
  FakeAgentServer server;
  server.sendEvent("AGTSTART", EventType::RESPONSE, 1, {"AGENT_STARTUP"});
  REQUIRE_THROWS_AS(Session(server.handler, fakeEndpoint(), testConfig()),
                    HandshakeFailure);
  REQUIRE(server.handler->getActiveSockets().empty());
}

TEST_CASE("Session construction fails without any event", "[Session]") {
  FakeAgentServer server;
  SessionConfig config = testConfig();
  config.handshakeTimeout = chrono::milliseconds(100);

  REQUIRE_THROWS_AS(Session(server.handler, fakeEndpoint(), config),
                    HandshakeFailure);
  REQUIRE(server.handler->getActiveSockets().empty());
}

TEST_CASE("Session construction fails when the server hangs up",
          "[Session]") {
  FakeAgentServer server;
  server.closeServerSide();
  REQUIRE_THROWS_AS(Session(server.handler, fakeEndpoint(), testConfig()),
                    HandshakeFailure);
}

TEST_CASE("Session construction fails when the connect fails", "[Session]") {
  auto handler = make_shared<SocketPairHandler>();
  REQUIRE_THROWS_AS(Session(handler, fakeEndpoint(), testConfig()),
                    ConnectFailure);
}

TEST_CASE("Session sends commands in the wire format", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  std::thread responder([&]() {
    auto command = server.readCommand();
    server.respond(command, {"M00000", command.keyword, command.clientId});
  });
  Response response =
      session->invoke(Command("AGTLogon", {"agent01", "secret"}));
  responder.join();

  const Event& terminal = response.getTerminal();
  REQUIRE(terminal.getSegments() ==
          vector<string>{"M00000", "AGTLogon", "tester"});
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE(session->getPendingRequests() == 0);
}

TEST_CASE("Cyrillic client ids keep the header layout", "[Session]") {
  FakeAgentServer server;
  server.serverClientId = u8"СЕРВЕР";
  SessionConfig config = testConfig();
  config.clientId = u8"АГЕНТ";
  auto session = startSession(&server, config);

  ReceivedCommand received;
  std::thread responder([&]() {
    received = server.readCommand();
    server.respond(received, {"M00000", u8"Готово"});
  });
  Response response =
      session->invoke(Command("AGTSetDataField", {u8"NAME,Иванов"}));
  responder.join();

  REQUIRE(received.keyword == "AGTSetDataField");
  REQUIRE(received.type == 'C');
  REQUIRE(received.clientId == u8"АГЕНТ");
  REQUIRE(received.invokeId == response.getTerminal().getInvokeId());
  REQUIRE(received.segmentCount == 1);
  REQUIRE(received.segments == vector<string>{u8"NAME,Иванов"});

  const Event& terminal = response.getTerminal();
  REQUIRE(terminal.getClientId() == u8"СЕРВЕР");
  REQUIRE(terminal.getProcessId() == 4242);
  REQUIRE(terminal.getSegments() == vector<string>{"M00000", u8"Готово"});
  REQUIRE(session->getInvokeIdsInUse() == 0);
}

TEST_CASE("Concurrent commands each get their own response", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);
  const int count = 8;

  std::thread responder([&]() {
    vector<ReceivedCommand> commands;
    for (int i = 0; i < count; i++) {
      commands.push_back(server.readCommand());
    }
    // Answer in reverse order of arrival
    for (auto it = commands.rbegin(); it != commands.rend(); ++it) {
      server.respond(*it, {"M00000", it->segments[0]});
    }
  });

  vector<string> answers(count);
  vector<std::thread> callers;
  for (int i = 0; i < count; i++) {
    callers.emplace_back([&, i]() {
      Response response =
          session->invoke(Command("AGTEcho", {"caller" + to_string(i)}));
      answers[i] = response.getTerminal().getSegments()[1];
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  responder.join();

  for (int i = 0; i < count; i++) {
    REQUIRE(answers[i] == "caller" + to_string(i));
  }
  REQUIRE(session->getInvokeIdsInUse() == 0);
}

TEST_CASE("Session collects intermediate events until the terminal one",
          "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  std::thread responder([&]() {
    auto command = server.readCommand();
    server.sendEvent(command.keyword, EventType::PENDING, command.invokeId,
                     {"M00001"});
    server.sendEvent(command.keyword, EventType::DATA, command.invokeId,
                     {"JOB_A"}, true);
    server.sendEvent(command.keyword, EventType::DATA, command.invokeId,
                     {"JOB_B"}, true);
    server.respond(command);
  });
  Response response = session->invoke(Command("AGTListJobs"));
  responder.join();

  REQUIRE(response.getEvents().size() == 4);
  REQUIRE(response.getData() == vector<string>{"JOB_A", "JOB_B"});
  REQUIRE(response.isSuccess());
}

TEST_CASE("Shutdown releases every pending command", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);
  const int pending = 5;

  atomic<int> closedErrors(0);
  vector<std::thread> callers;
  for (int i = 0; i < pending; i++) {
    callers.emplace_back([&]() {
      try {
        session->invoke(Command("AGTLogon"));
      } catch (const ConnectionClosed&) {
        closedErrors++;
      }
    });
  }
  // Every command is on the wire, so every one is registered
  for (int i = 0; i < pending; i++) {
    server.readCommand();
  }
  REQUIRE(session->getInvokeIdsInUse() == pending);

  session->stop();
  session->wait();
  for (auto& caller : callers) {
    caller.join();
  }

  REQUIRE(closedErrors == pending);
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE(session->getPendingRequests() == 0);
  REQUIRE_FALSE(session->isOpen());
  REQUIRE_THROWS_AS(session->invoke(Command("AGTLogoff")), ConnectionClosed);

  Event event;
  REQUIRE_FALSE(session->getNotifications()->pop(&event));
}

TEST_CASE("Stop racing concurrent commands leaves no id behind",
          "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);
  const int callerCount = 8;

  // Answers every other command until the client goes away
  atomic<bool> serving(true);
  std::thread responder([&]() {
    int seen = 0;
    while (serving) {
      try {
        ReceivedCommand command = server.readCommand(100);
        if (seen++ % 2 == 0) {
          server.respond(command);
        }
      } catch (const std::runtime_error& re) {
        VLOG(1) << "Responder: " << re.what();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }
  });

  atomic<int> responses(0);
  atomic<int> closed(0);
  atomic<int> unexpected(0);
  vector<std::thread> callers;
  for (int i = 0; i < callerCount; i++) {
    callers.emplace_back([&]() {
      while (true) {
        try {
          session->invoke(Command("AGTEcho"));
          responses++;
        } catch (const ConnectionClosed&) {
          closed++;
          return;
        } catch (const std::exception&) {
          unexpected++;
          return;
        }
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  session->stop();
  session->wait();
  for (auto& caller : callers) {
    caller.join();
  }
  serving = false;
  responder.join();

  REQUIRE(unexpected == 0);
  REQUIRE(closed == callerCount);
  REQUIRE(responses > 0);
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE(session->getPendingRequests() == 0);
  REQUIRE_THROWS_AS(session->invoke(Command("AGTEcho")), ConnectionClosed);
}

TEST_CASE("Losing the connection closes the session", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  std::thread hangup([&]() {
    server.readCommand();
    server.closeServerSide();
  });
  REQUIRE_THROWS_AS(session->invoke(Command("AGTAvailWork")),
                    ConnectionClosed);
  hangup.join();
  session->wait();

  REQUIRE_FALSE(session->isOpen());
  REQUIRE(session->getInvokeIdsInUse() == 0);
  Event event;
  REQUIRE_FALSE(session->getNotifications()->pop(&event));
}

TEST_CASE("A read timeout closes the session", "[Session]") {
  FakeAgentServer server;
  SessionConfig config = testConfig();
  config.readTimeout = chrono::milliseconds(150);
  auto session = startSession(&server, config);

  session->wait();
  REQUIRE_FALSE(session->isOpen());
  REQUIRE_THROWS_AS(session->invoke(Command("AGTLogon")), ConnectionClosed);
}

TEST_CASE("Malformed records are skipped", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  server.sendRaw(string("garbage") + END_OF_TEXT);
  server.sendNotification("AGTJobEnd", {"OUTBOUND1"});

  Event event = popNotification(session.get());
  REQUIRE(event.getKeyword() == "AGTJobEnd");
  REQUIRE(session->getDecodeFailures() == 1);
  REQUIRE(session->isOpen());
}

TEST_CASE("Responses nobody waits for are dropped", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  server.sendEvent("AGTLogon", EventType::RESPONSE, 77, {"M00000"});
  server.sendNotification("AGTJobEnd", {"OUTBOUND1"});

  popNotification(session.get());
  REQUIRE(session->getUnmatchedResponses() == 1);
  REQUIRE(session->isOpen());
}

TEST_CASE("Notifications keep their order", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  server.sendNotification("AGTCallNotify", {"CURPHONE,01"});
  server.sendNotification("AGTAutoReleaseLine", {"M00000"});
  server.sendNotification("AGTJobEnd", {"OUTBOUND1"});

  REQUIRE(popNotification(session.get()).getKeyword() == "AGTCallNotify");
  REQUIRE(popNotification(session.get()).getKeyword() ==
          "AGTAutoReleaseLine");
  REQUIRE(popNotification(session.get()).getKeyword() == "AGTJobEnd");
}

TEST_CASE("Notifications survive chunking and the legacy codepage",
          "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  string record = EventCodec::encodeRecord(
      "AGTCallNotify", EventType::NOTIFICATION, "server", 1, 0,
      {u8"NAME,Иванов", "CURPHONE,02"}, false);
  server.sendRaw(record.substr(0, 30));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  server.sendRaw(record.substr(30));

  Event event = popNotification(session.get());
  REQUIRE(event.getFields().at("NAME") == u8"Иванов");
  REQUIRE(event.getFields().at("CURPHONE") == "02");
}

TEST_CASE("A command timeout releases its invoke id", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  CommandOptions options;
  options.timeout = chrono::milliseconds(100);
  REQUIRE_THROWS_AS(session->invoke(Command("AGTLogon"), options),
                    CommandTimeout);
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE(session->getPendingRequests() == 0);

  // The late answer is dropped, the session carries on
  auto late = server.readCommand();
  server.respond(late);
  server.sendNotification("AGTJobEnd", {"OUTBOUND1"});
  popNotification(session.get());
  REQUIRE(session->getUnmatchedResponses() == 1);
}

TEST_CASE("A second answer for a finished command is unmatched",
          "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  std::thread responder([&]() {
    auto command = server.readCommand();
    server.respond(command);
    server.respond(command, {"M00000", "duplicate"});
    server.sendNotification("AGTJobEnd", {"OUTBOUND1"});
  });
  Response response = session->invoke(Command("AGTLogon"));
  responder.join();
  popNotification(session.get());

  REQUIRE(response.getEvents().size() == 1);
  REQUIRE(session->getUnmatchedResponses() == 1);
  REQUIRE(session->getInvokeIdsInUse() == 0);
}

TEST_CASE("The configured command timeout applies by default", "[Session]") {
  FakeAgentServer server;
  SessionConfig config = testConfig();
  config.commandTimeout = chrono::milliseconds(100);
  auto session = startSession(&server, config);

  REQUIRE_THROWS_AS(session->invoke(Command("AGTLogon")), CommandTimeout);
  REQUIRE(session->getInvokeIdsInUse() == 0);
}

TEST_CASE("Cancelling a command releases its invoke id", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  CommandOptions options;
  options.cancellation = make_shared<CancellationToken>();
  std::thread canceller([&]() {
    server.readCommand();
    options.cancellation->cancel();
  });
  REQUIRE_THROWS_AS(session->invoke(Command("AGTLogon"), options),
                    CommandCancelled);
  canceller.join();
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE(session->getPendingRequests() == 0);
}

TEST_CASE("A cancelled token stops the command before it is sent",
          "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);

  CommandOptions options;
  options.cancellation = make_shared<CancellationToken>();
  options.cancellation->cancel();
  REQUIRE_THROWS_AS(session->invoke(Command("AGTLogon"), options),
                    CommandCancelled);
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE_THROWS(server.readCommand(100));
}

TEST_CASE("Running out of invoke ids fails fast", "[Session]") {
  FakeAgentServer server;
  SessionConfig config = testConfig();
  config.maxInvokeId = 2;
  auto session = startSession(&server, config);

  vector<std::thread> callers;
  for (int i = 0; i < 2; i++) {
    callers.emplace_back([&]() {
      try {
        session->invoke(Command("AGTLogon"));
      } catch (const ConnectionClosed&) {
      }
    });
  }
  server.readCommand();
  server.readCommand();

  REQUIRE_THROWS_AS(session->invoke(Command("AGTLogon")),
                    IdentifierExhausted);

  session->stop();
  for (auto& caller : callers) {
    caller.join();
  }
  REQUIRE(session->getInvokeIdsInUse() == 0);
}

TEST_CASE("An unencodable command releases its invoke id", "[Session]") {
  FakeAgentServer server;
  auto session = startSession(&server);
  REQUIRE_THROWS_AS(session->invoke(Command("AGTKeywordLongerThanTwenty")),
                    EncodeFailure);
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE(session->getPendingRequests() == 0);
}

TEST_CASE("Dropping notifications when the sink is full", "[Session]") {
  FakeAgentServer server;
  SessionConfig config = testConfig();
  config.notificationCapacity = 2;
  config.notificationOverflow = OverflowPolicy::DROP_NEWEST;
  auto session = startSession(&server, config);

  std::thread responder([&]() {
    auto command = server.readCommand();
    for (int i = 0; i < 5; i++) {
      server.sendNotification("AGTCallNotify",
                              {"CURPHONE," + to_string(i)});
    }
    server.respond(command);
  });
  // The response comes after the notifications, so they are all handled
  session->invoke(Command("AGTReadyNextItem"));
  responder.join();

  REQUIRE(session->getDroppedNotifications() == 3);
  REQUIRE(session->getNotifications()->size() == 2);
  REQUIRE(popNotification(session.get()).getFields().at("CURPHONE") == "0");
  REQUIRE(popNotification(session.get()).getFields().at("CURPHONE") == "1");
}

TEST_CASE("A full sink applies backpressure until consumed", "[Session]") {
  FakeAgentServer server;
  SessionConfig config = testConfig();
  config.notificationCapacity = 1;
  auto session = startSession(&server, config);

  for (int i = 0; i < 4; i++) {
    server.sendNotification("AGTCallNotify", {"CURPHONE," + to_string(i)});
  }
  for (int i = 0; i < 4; i++) {
    REQUIRE(popNotification(session.get()).getFields().at("CURPHONE") ==
            to_string(i));
  }
  REQUIRE(session->getDroppedNotifications() == 0);
}

TEST_CASE("Stop interrupts a loop blocked on a full sink", "[Session]") {
  FakeAgentServer server;
  SessionConfig config = testConfig();
  config.notificationCapacity = 1;
  auto session = startSession(&server, config);

  for (int i = 0; i < 3; i++) {
    server.sendNotification("AGTCallNotify", {"CURPHONE," + to_string(i)});
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  session->stop();
  session->wait();
  REQUIRE_FALSE(session->isOpen());
}
