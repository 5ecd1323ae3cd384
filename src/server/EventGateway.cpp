#include "EventGateway.hpp"

namespace gm {
namespace {
// Strings pass through, numbers are printed, anything else is empty
string stringField(const json& payload, const char* key) {
  if (!payload.is_object()) {
    return "";
  }
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<string>();
  }
  if (it->is_number_integer()) {
    return to_string(it->get<int64_t>());
  }
  return it->dump();
}

json errorMessage(const string& message) {
  json j;
  j["message"] = message;
  return j;
}
}  // namespace

EventGateway::EventGateway(shared_ptr<SessionManager> _manager,
                           shared_ptr<RemoteSessionController> _remote,
                           shared_ptr<OutputRelay> _relay,
                           shared_ptr<Authorizer> _authorizer,
                           shared_ptr<EventSink> _sink,
                           const string& _defaultGdbCommand)
    : manager(_manager),
      remote(_remote),
      relay(_relay),
      authorizer(_authorizer),
      sink(_sink),
      defaultGdbCommand(_defaultGdbCommand) {
  handlers["pty_interaction"] = &EventGateway::onPtyInteraction;
  handlers["run_gdb_command"] = &EventGateway::onRunGdbCommand;
  handlers["run_command"] = &EventGateway::onRunGdbCommand;
  handlers["ssh_connect"] = &EventGateway::onSshConnect;
  handlers["ssh_command"] = &EventGateway::onSshCommand;
  handlers["ssh_command_input"] = &EventGateway::onSshCommandInput;
  handlers["ssh_shell_start"] = &EventGateway::onSshShellStart;
  handlers["ssh_shell_input"] = &EventGateway::onSshShellInput;
  handlers["ssh_shell_stop"] = &EventGateway::onSshShellStop;
  handlers["ssh_disconnect"] = &EventGateway::onSshDisconnect;
  handlers["kill_session"] = &EventGateway::onKillSession;
  handlers["dashboard_data"] = &EventGateway::onDashboardData;
}

AuthResult EventGateway::handleConnect(const string& clientId,
                                       const ConnectRequest& request) {
  string reason;
  AuthResult result = authorizer->authorize(request, &reason);
  if (result == AuthResult::CROSS_ORIGIN) {
    return result;
  }
  if (result == AuthResult::INVALID_TOKEN) {
    sink->emit(clientId, "server_error", errorMessage(reason));
    return result;
  }

  {
    lock_guard<mutex> guard(authorizedMutex);
    authorizedClients.insert(clientId);
  }
  LOG(INFO) << "Client " << clientId << " connected";

  json response;
  if (request.has_gdbpid() && request.gdbpid() > 0) {
    pid_t gdbpid = request.gdbpid();
    try {
      auto session = manager->connectClientToDebugSession(gdbpid, clientId);
      response["ok"] = true;
      response["started_new_gdb_process"] = false;
      response["pid"] = session->getPid();
      response["message"] =
          "Connected to existing gdb process " + to_string(gdbpid);
    } catch (const std::runtime_error& ex) {
      response["ok"] = false;
      response["started_new_gdb_process"] = false;
      response["message"] = "Failed to attach to gdb process " +
                            to_string(gdbpid) + ": " + ex.what();
    }
  } else {
    string gdbCommand = request.has_gdb_command() && !request.gdb_command().empty()
                            ? request.gdb_command()
                            : defaultGdbCommand;
    string miVersion = request.has_mi_version() && !request.mi_version().empty()
                           ? request.mi_version()
                           : "mi2";
    try {
      auto session =
          manager->addNewDebugSession(gdbCommand, miVersion, clientId);
      response["ok"] = true;
      response["started_new_gdb_process"] = true;
      response["pid"] = session->getPid();
      response["message"] =
          "Started new gdb process, pid " + to_string(session->getPid());
    } catch (const std::runtime_error& ex) {
      STERROR << "Could not start gdb: " << ex.what();
      response["ok"] = false;
      response["started_new_gdb_process"] = false;
      response["message"] =
          string("Failed to establish gdb session: ") + ex.what();
    }
  }
  sink->emit(clientId, "debug_session_connection_event", response);

  relay->startIfNeeded();
  return AuthResult::AUTHORIZED;
}

bool EventGateway::isAuthorized(const string& clientId) {
  lock_guard<mutex> guard(authorizedMutex);
  return authorizedClients.find(clientId) != authorizedClients.end();
}

void EventGateway::handleEvent(const string& clientId, const string& name,
                               const json& payload) {
  if (!isAuthorized(clientId)) {
    LOG(WARNING) << "Refusing " << name << " from unauthorized client "
                 << clientId;
    sink->emit(clientId, "server_error",
               errorMessage("Not authorized. Please refresh this webpage."));
    return;
  }
  auto it = handlers.find(name);
  if (it == handlers.end()) {
    LOG(WARNING) << "Unknown event from " << clientId << ": " << name;
    sink->emit(clientId, "server_error", errorMessage("Unknown event " + name));
    return;
  }
  VLOG(1) << "Handling " << name << " for " << clientId;
  try {
    (this->*(it->second))(clientId, payload);
  } catch (const json::exception& ex) {
    LOG(WARNING) << "Malformed " << name << " payload: " << ex.what();
    sink->emit(clientId, "server_error",
               errorMessage("Malformed " + name + " request: " + ex.what()));
  }
}

void EventGateway::handleDisconnect(const string& clientId) {
  {
    lock_guard<mutex> guard(authorizedMutex);
    authorizedClients.erase(clientId);
  }
  LOG(INFO) << "Client " << clientId << " disconnected";
  manager->disconnectClient(clientId);
  remote->clientDisconnected(clientId);
}

void EventGateway::onPtyInteraction(const string& clientId,
                                    const json& payload) {
  auto session = manager->debugSessionFromClientId(clientId);
  if (session.get() == NULL) {
    sink->emit(clientId, "error_running_gdb_command",
               errorMessage("no session"));
    return;
  }
  json data = payload.is_object() ? payload.value("data", json::object())
                                  : json::object();
  string ptyName = stringField(data, "pty_name");
  PtyKind kind;
  if (ptyName == "user_pty") {
    kind = PtyKind::USER;
  } else if (ptyName == "program_pty") {
    kind = PtyKind::PROGRAM;
  } else {
    sink->emit(clientId, "error_running_gdb_command",
               errorMessage("Unknown pty_name " + ptyName));
    return;
  }

  string action = stringField(data, "action");
  try {
    if (action == "write") {
      session->writePty(kind, stringField(data, "key"));
    } else if (action == "set_winsize") {
      session->setWinsize(kind, data.at("rows").get<int>(),
                          data.at("cols").get<int>());
    } else {
      sink->emit(clientId, "error_running_gdb_command",
                 errorMessage("Unknown action " + action));
    }
  } catch (const std::runtime_error& ex) {
    sink->emit(clientId, "error_running_gdb_command", errorMessage(ex.what()));
  } catch (const json::exception& ex) {
    sink->emit(clientId, "error_running_gdb_command", errorMessage(ex.what()));
  }
}

void EventGateway::onRunGdbCommand(const string& clientId,
                                   const json& payload) {
  auto session = manager->debugSessionFromClientId(clientId);
  if (session.get() == NULL) {
    sink->emit(clientId, "error_running_gdb_command",
               errorMessage("no session"));
    return;
  }
  vector<string> commands;
  json cmd = payload.is_object() ? payload.value("cmd", json()) : json();
  if (cmd.is_string()) {
    commands.push_back(cmd.get<string>());
  } else if (cmd.is_array()) {
    for (auto& c : cmd) {
      commands.push_back(c.get<string>());
    }
  } else {
    sink->emit(clientId, "error_running_gdb_command",
               errorMessage("cmd must be a string or a list of strings"));
    return;
  }
  try {
    for (auto& c : commands) {
      session->writeMi(c);
    }
  } catch (const std::runtime_error& ex) {
    sink->emit(clientId, "error_running_gdb_command", errorMessage(ex.what()));
  }
}

void EventGateway::onSshConnect(const string& clientId, const json& payload) {
  optional<string> password;
  string passwordField = stringField(payload, "password");
  if (!passwordField.empty()) {
    password = passwordField;
  }
  remote->connect(clientId, stringField(payload, "host"),
                  stringField(payload, "username"), password,
                  stringField(payload, "port"));
}

void EventGateway::onSshCommand(const string& clientId, const json& payload) {
  remote->runCommand(clientId, trim(stringField(payload, "command")));
}

void EventGateway::onSshCommandInput(const string& clientId,
                                     const json& payload) {
  remote->sendCommandInput(clientId, stringField(payload, "data"));
}

void EventGateway::onSshShellStart(const string& clientId, const json&) {
  remote->startShell(clientId);
}

void EventGateway::onSshShellInput(const string& clientId,
                                   const json& payload) {
  remote->shellInput(clientId, stringField(payload, "data"));
}

void EventGateway::onSshShellStop(const string& clientId, const json&) {
  remote->stopShell(clientId);
}

void EventGateway::onSshDisconnect(const string& clientId, const json&) {
  remote->disconnect(clientId);
}

void EventGateway::onKillSession(const string& clientId, const json& payload) {
  json response;
  string pidString = stringField(payload, "gdbpid");
  pid_t gdbpid = 0;
  try {
    gdbpid = pid_t(stoi(pidString));
  } catch (const std::logic_error&) {
    response["ok"] = false;
    response["message"] = "Invalid gdb pid: " + pidString;
    sink->emit(clientId, "kill_session_result", response);
    return;
  }
  if (manager->removeDebugSessionByPid(gdbpid)) {
    LOG(INFO) << "Client " << clientId << " killed gdb process " << gdbpid;
    response["ok"] = true;
    response["message"] = "Killed gdb process " + to_string(gdbpid);
  } else {
    response["ok"] = false;
    response["message"] = "No gdb process with pid " + to_string(gdbpid);
  }
  sink->emit(clientId, "kill_session_result", response);
}

void EventGateway::onDashboardData(const string& clientId, const json&) {
  json response;
  response["sessions"] = manager->getDashboardData();
  sink->emit(clientId, "dashboard_data", response);
}
}  // namespace gm
