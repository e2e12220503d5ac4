#include <cxxopts.hpp>

#include "AgentClient.hpp"
#include "Headers.hpp"
#include "InterruptWatcher.hpp"
#include "LogHandler.hpp"
#include "SimpleIni.h"
#include "TlsSocketHandler.hpp"

using namespace apc;

namespace {
atomic<bool> interrupted(false);
const chrono::milliseconds TEARDOWN_COMMAND_TIMEOUT = chrono::seconds(5);

void interruptSignalHandler(int signum) { interrupted = true; }

struct AgentSettings {
  string addr;
  string agentName;
  string password;
  int headsetId = 0;
  string jobName;
  string clientId = "apcctl";
  string tlsVersion = "1.0";
  int connectTimeoutMs = 3000;
  int readTimeoutMs = 0;
  int commandTimeoutMs = 0;
  string logDir;
  string maxlogsize = "20971520";
  bool silent = false;
  int verbose = 0;
};

// Runs a teardown step; failures are logged so the rest still runs.
void bestEffort(const string& what, const function<void()>& step) {
  try {
    step();
  } catch (const ApcError& ae) {
    LOG(WARNING) << what << " failed: " << ae.what();
    CLOG(INFO, "stdout") << what << " failed: " << ae.what() << endl;
  }
}

void handleCallNotify(AgentClient* client, const Event& notification) {
  const auto& fields = notification.getFields();
  auto it = fields.find("CURPHONE");
  if (it == fields.end()) {
    VLOG(1) << "Call notification without CURPHONE";
    return;
  }
  int phoneIndex;
  try {
    phoneIndex = stoi(it->second);
  } catch (const std::logic_error& le) {
    LOG(WARNING) << "Invalid CURPHONE value '" << it->second
                 << "': " << le.what();
    return;
  }
  try {
    Field field = client->readField(ListType::OUTBOUND,
                                    "PHONE_ID" + to_string(phoneIndex));
    CLOG(INFO, "stdout") << field << endl;
  } catch (const CommandFailed& cf) {
    LOG(WARNING) << cf.what();
  }
}

void handleAutoReleaseLine(AgentClient* client) {
  bestEffort("AGTReleaseLine", [client] { client->releaseLine(); });
  bestEffort("AGTFinishedItem", [client] { client->finishedItem(22); });
  bestEffort("AGTReadyNextItem", [client] { client->readyNextItem(); });
}

void runAgent(const AgentSettings& settings) {
  SessionConfig config;
  config.clientId = settings.clientId;
  config.readTimeout = chrono::milliseconds(settings.readTimeoutMs);
  config.commandTimeout = chrono::milliseconds(settings.commandTimeoutMs);

  InterruptWatcher watcher(&interrupted);

  shared_ptr<SocketHandler> socketHandler(new TlsSocketHandler(
      TlsSocketHandler::parseTlsVersion(settings.tlsVersion),
      chrono::milliseconds(settings.connectTimeoutMs)));
  auto session = make_shared<Session>(
      socketHandler, SocketEndpoint::parse(settings.addr), config);
  session->start();
  AgentClient client(session);
  CommandOptions commandOptions;
  commandOptions.cancellation = watcher.getToken();
  client.setCommandOptions(commandOptions);

  // Teardown steps, run in reverse order of setup
  vector<pair<string, function<void()>>> teardown;
  auto unwind = [&] {
    // Bounded and on a fresh token: a second interrupt cuts teardown short
    CommandOptions teardownOptions;
    teardownOptions.timeout = TEARDOWN_COMMAND_TIMEOUT;
    teardownOptions.cancellation = watcher.renewToken();
    client.setCommandOptions(teardownOptions);
    while (!teardown.empty()) {
      if (session->isOpen()) {
        bestEffort(teardown.back().first, teardown.back().second);
      }
      teardown.pop_back();
    }
    session->stop();
    session->wait();
  };

  try {
    client.logon(settings.agentName, settings.password);
    teardown.emplace_back("AGTLogoff", [&client] { client.logoff(); });

    client.reserveHeadset(settings.headsetId);
    teardown.emplace_back("AGTFreeHeadset",
                          [&client] { client.freeHeadset(); });

    client.connectHeadset();
    teardown.emplace_back("AGTDisconnHeadset",
                          [&client] { client.disconnectHeadset(); });

    client.attachJob(settings.jobName);
    teardown.emplace_back("AGTDetachJob", [&client] { client.detachJob(); });

    for (const auto& state : client.listState()) {
      VLOG(1) << "Agent state: " << state;
    }

    client.setDataField(ListType::OUTBOUND, "DEBT_ID");
    client.setDataField(ListType::OUTBOUND, "CURPHONE");

    client.availWork();
    teardown.emplace_back("AGTNoFurtherWork",
                          [&client] { client.noFurtherWork(); });
  } catch (const ApcError& ae) {
    LOG(ERROR) << "Agent setup failed: " << ae.what();
    unwind();
    throw;
  }
  bestEffort("AGTReadyNextItem", [&client] { client.readyNextItem(); });

  auto notifications = client.notifications();
  while (watcher.getInterrupts() == 0) {
    Event notification;
    if (!notifications->popFor(&notification, chrono::milliseconds(200))) {
      if (notifications->isClosed() && notifications->size() == 0) {
        CLOG(INFO, "stdout") << "Notification queue closed" << endl;
        break;
      }
      continue;
    }
    VLOG(1) << "Notification: " << notification;
    try {
      if (notification.getKeyword() == NOTIFY_CALL) {
        handleCallNotify(&client, notification);
      } else if (notification.getKeyword() == NOTIFY_AUTO_RELEASE_LINE) {
        handleAutoReleaseLine(&client);
      }
    } catch (const ConnectionClosed& cc) {
      LOG(ERROR) << "Connection lost: " << cc.what();
      break;
    } catch (const ApcError& ae) {
      LOG(ERROR) << "Handling " << notification.getKeyword()
                 << " failed: " << ae.what();
    }
  }
  if (watcher.getInterrupts() > 0) {
    LOG(INFO) << "Interrupted, shutting down";
  }
  unwind();
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  apc::HandleTerminate();

  ::signal(SIGINT, interruptSignalHandler);
  ::signal(SIGTERM, interruptSignalHandler);

  cxxopts::Options options("apcctl",
                           "Agent client for Avaya Proactive Contact");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("addr", "Server address as host:port",
         cxxopts::value<std::string>())                               //
        ("agent-name", "Agent name", cxxopts::value<std::string>())  //
        ("password", "Agent password", cxxopts::value<std::string>())  //
        ("headset-id", "Headset ID", cxxopts::value<int>())            //
        ("job-name", "Job name", cxxopts::value<std::string>())        //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("timeout", "Read timeout in milliseconds, 0 disables it",
         cxxopts::value<int>())  //
        ("tls-version", "TLS version spoken by the server (1.0 - 1.3)",
         cxxopts::value<std::string>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())          //
        ("logtostdout", "Write log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"));

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "apcctl version " << APC_VERSION << endl;
      exit(0);
    }

    AgentSettings settings;
    settings.logDir = GetTempDirectory() + "apcctl";
    if (result.count("cfgfile")) {
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc < 0) {
        CLOG(INFO, "stdout") << "Invalid config file: " << cfgfilename << endl;
        exit(1);
      }
      settings.addr = ini.GetValue("Server", "addr", "");
      settings.connectTimeoutMs =
          int(ini.GetLongValue("Server", "connect_timeout_ms", 3000));
      settings.readTimeoutMs =
          int(ini.GetLongValue("Server", "read_timeout_ms", 0));
      settings.tlsVersion = ini.GetValue("Server", "tls_version", "1.0");
      settings.commandTimeoutMs =
          int(ini.GetLongValue("Server", "command_timeout_ms", 0));
      settings.agentName = ini.GetValue("Agent", "name", "");
      settings.password = ini.GetValue("Agent", "password", "");
      settings.headsetId = int(ini.GetLongValue("Agent", "headset_id", 0));
      settings.jobName = ini.GetValue("Agent", "job_name", "");
      settings.clientId = ini.GetValue("Agent", "client_id", "apcctl");
      settings.verbose = int(ini.GetLongValue("Debug", "verbose", 0));
      settings.silent = ini.GetLongValue("Debug", "silent", 0) != 0;
      const char* logsize = ini.GetValue("Debug", "logsize", NULL);
      if (logsize && atoi(logsize) != 0) {
        settings.maxlogsize = string(logsize);
      }
      const char* logdir = ini.GetValue("Debug", "logdir", NULL);
      if (logdir) {
        settings.logDir = logdir;
      }
    }

    // Command line flags win over the config file
    if (result.count("addr")) {
      settings.addr = result["addr"].as<string>();
    }
    if (result.count("agent-name")) {
      settings.agentName = result["agent-name"].as<string>();
    }
    if (result.count("password")) {
      settings.password = result["password"].as<string>();
    }
    if (result.count("headset-id")) {
      settings.headsetId = result["headset-id"].as<int>();
    }
    if (result.count("job-name")) {
      settings.jobName = result["job-name"].as<string>();
    }
    if (result.count("timeout")) {
      settings.readTimeoutMs = result["timeout"].as<int>();
    }
    if (result.count("tls-version")) {
      settings.tlsVersion = result["tls-version"].as<string>();
    }
    if (result.count("logdir")) {
      settings.logDir = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      settings.verbose = result["verbose"].as<int>();
    }

    if (settings.addr.empty() || settings.agentName.empty()) {
      CLOG(INFO, "stdout") << "--addr and --agent-name are required\n"
                           << options.help({}) << endl;
      exit(1);
    }

    LogHandler::setVerbosity(settings.verbose);
    if (settings.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    LogHandler::setupLogFiles(&defaultConf, settings.logDir, "apcctl",
                              result.count("logtostdout"), false,
                              settings.maxlogsize);
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("apcctl-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    runAgent(settings);
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::invalid_argument& ia) {
    CLOG(INFO, "stdout") << "Error: " << ia.what() << endl;
    exitCode = 1;
  } catch (const ApcError& ae) {
    CLOG(INFO, "stdout") << "Error: " << ae.what() << endl;
    exitCode = 1;
  }

  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
