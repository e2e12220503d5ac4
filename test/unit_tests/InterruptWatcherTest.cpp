#include "AgentClient.hpp"
#include "FakeAgentServer.hpp"
#include "InterruptWatcher.hpp"
#include "TestHeaders.hpp"

using namespace apc;

namespace {
shared_ptr<Session> startSession(FakeAgentServer* server) {
  SessionConfig config;
  config.clientId = "apcctl";
  server->sendStart();
  auto session =
      make_shared<Session>(server->handler, fakeEndpoint(), config);
  session->start();
  return session;
}

bool waitForCancel(const shared_ptr<CancellationToken>& token) {
  for (int i = 0; i < 500 && !token->isCancelled(); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return token->isCancelled();
}
}  // namespace

TEST_CASE("An interrupt wakes a command that has no timeout",
          "[InterruptWatcher]") {
  atomic<bool> interrupted(false);
  InterruptWatcher watcher(&interrupted, chrono::milliseconds(10));
  FakeAgentServer server;
  auto session = startSession(&server);
  AgentClient client(session);
  CommandOptions options;
  options.cancellation = watcher.getToken();
  client.setCommandOptions(options);

  // The server reads the logon but never answers it
  std::thread interrupter([&]() {
    server.readCommand();
    interrupted = true;
  });
  REQUIRE_THROWS_AS(client.logon("agent01", "secret"), CommandCancelled);
  interrupter.join();

  REQUIRE(watcher.getInterrupts() == 1);
  REQUIRE_FALSE(interrupted);
  REQUIRE(session->getInvokeIdsInUse() == 0);
  REQUIRE(session->getPendingRequests() == 0);
  REQUIRE(session->isOpen());

  session->stop();
  session->wait();
}

TEST_CASE("Commands on a renewed token run until the next interrupt",
          "[InterruptWatcher]") {
  atomic<bool> interrupted(false);
  InterruptWatcher watcher(&interrupted, chrono::milliseconds(10));
  auto first = watcher.getToken();
  interrupted = true;
  REQUIRE(waitForCancel(first));

  FakeAgentServer server;
  auto session = startSession(&server);
  AgentClient client(session);
  CommandOptions options;
  options.timeout = chrono::seconds(5);
  options.cancellation = watcher.renewToken();
  client.setCommandOptions(options);
  REQUIRE_FALSE(options.cancellation->isCancelled());

  std::thread responder([&]() { server.respond(server.readCommand()); });
  client.logoff();
  responder.join();
  REQUIRE(session->getInvokeIdsInUse() == 0);

  interrupted = true;
  REQUIRE(waitForCancel(options.cancellation));
  REQUIRE(watcher.getInterrupts() == 2);
  REQUIRE_THROWS_AS(client.logoff(), CommandCancelled);

  session->stop();
  session->wait();
}
