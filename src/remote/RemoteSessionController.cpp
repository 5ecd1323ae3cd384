#include "RemoteSessionController.hpp"

#include "TerminalSanitizer.hpp"

namespace gm {
namespace {
const char* UNSUPPORTED_MESSAGE =
    "Remote shell support is not available on this server.";
const char* NO_CONNECTION_MESSAGE = "No SSH connection established.";
const char* CANCELLED_MESSAGE = "Connection request cancelled.";
const char* CONNECTION_CLOSED_COMMAND_MESSAGE =
    "Command terminated because the connection was closed.";
const char* SHELL_STOPPED_MESSAGE = "Interactive shell stopped.";

// Drains everything currently buffered on one stream.
string drainStream(RemoteChannel* channel, bool stderrStream) {
  string data;
  while (true) {
    int bytesRead = stderrStream ? channel->readStderr(&data, READ_CHUNK_SIZE)
                                 : channel->readStdout(&data, READ_CHUNK_SIZE);
    if (bytesRead <= 0) {
      break;
    }
  }
  return data;
}

void closeQuietly(shared_ptr<RemoteClient> client) {
  try {
    client->close();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Error closing remote client: " << ex.what();
  }
}

void closeQuietly(shared_ptr<RemoteChannel> channel) {
  try {
    channel->close();
  } catch (const std::exception& ex) {
    VLOG(1) << "Error closing remote channel: " << ex.what();
  }
}

optional<int> parsePort(const string& rawPort) {
  string port = trim(rawPort);
  if (port.empty()) {
    return DEFAULT_SSH_PORT;
  }
  if (port.length() > 5 ||
      port.find_first_not_of("0123456789") != string::npos) {
    return nullopt;
  }
  int value = stoi(port);
  if (value < 1 || value > 65535) {
    return nullopt;
  }
  return value;
}
}  // namespace

RemoteSessionController::RemoteSessionController(
    shared_ptr<EventSink> _sink, shared_ptr<RemoteClientFactory> _factory,
    bool _enabled, int _timeoutSeconds)
    : sink(_sink),
      factory(_factory),
      enabled(_enabled),
      timeoutSeconds(_timeoutSeconds),
      connectPool(new ThreadPool(4)) {}

RemoteSessionController::~RemoteSessionController() { shutdown(); }

void RemoteSessionController::emitToClient(const string& clientId,
                                           const string& event,
                                           const json& payload) {
  sink->emit(clientId, event, payload);
}

shared_ptr<RemoteSession> RemoteSessionController::getSession(
    const string& clientId) {
  lock_guard<mutex> guard(sessionsMutex);
  auto it = sessions.find(clientId);
  if (it == sessions.end()) {
    return shared_ptr<RemoteSession>();
  }
  return it->second;
}

bool RemoteSessionController::hasSession(const string& clientId) {
  return getSession(clientId).get() != NULL;
}

bool RemoteSessionController::hasPendingConnection(const string& clientId) {
  lock_guard<mutex> guard(pendingMutex);
  return pendingConnections.find(clientId) != pendingConnections.end();
}

void RemoteSessionController::connect(const string& clientId,
                                      const string& host,
                                      const string& username,
                                      const optional<string>& password,
                                      const string& port) {
  if (!isAvailable()) {
    emitToClient(clientId, "ssh_connection_event",
                 {{"ok", false}, {"message", UNSUPPORTED_MESSAGE}});
    return;
  }

  auto portNumber = parsePort(port);
  if (!portNumber) {
    emitToClient(clientId, "ssh_connection_event",
                 {{"ok", false}, {"message", "Invalid port number."}});
    return;
  }

  RemoteTarget target;
  target.host = trim(host);
  target.username = trim(username);
  target.port = *portNumber;
  if (password && !password->empty()) {
    target.password = password;
  }
  target.timeoutSeconds = timeoutSeconds;
  if (target.host.empty() || target.username.empty()) {
    emitToClient(
        clientId, "ssh_connection_event",
        {{"ok", false},
         {"message", "Host and username are required to connect."}});
    return;
  }

  auto previous = cancelPendingConnection(clientId);
  if (previous.get() != NULL) {
    previous->notified = true;
  }
  closeSession(clientId, false);

  auto pending = make_shared<PendingConnection>(factory->create());
  {
    lock_guard<mutex> guard(pendingMutex);
    pendingConnections[clientId] = pending;
  }
  LOG(INFO) << "Client " << clientId << " connecting to " << target.username
            << "@" << target.host << ":" << target.port;
  connectPool->enqueue([this, clientId, pending, target]() {
    establishConnection(clientId, pending, target);
  });
}

void RemoteSessionController::establishConnection(
    const string& clientId, shared_ptr<PendingConnection> pending,
    const RemoteTarget& target) {
  string failure;
  try {
    pending->client->connect(target);
  } catch (const std::exception& ex) {
    failure = ex.what();
    if (failure.empty()) {
      failure = "unknown error";
    }
  }

  bool promoted = false;
  {
    lock_guard<mutex> guard(pendingMutex);
    if (failure.empty() && !pending->cancelled) {
      lock_guard<mutex> sessionsGuard(sessionsMutex);
      sessions[clientId] = make_shared<RemoteSession>(pending->client);
      promoted = true;
    }
    auto it = pendingConnections.find(clientId);
    if (it != pendingConnections.end() && it->second == pending) {
      pendingConnections.erase(it);
    }
  }

  if (promoted) {
    pending->notified = true;
    ostringstream oss;
    oss << "Connected to " << target.username << "@" << target.host << ":"
        << target.port;
    LOG(INFO) << "Client " << clientId << ": " << oss.str();
    emitToClient(clientId, "ssh_connection_event",
                 {{"ok", true}, {"message", oss.str()}});
    return;
  }

  closeQuietly(pending->client);
  if (pending->cancelled) {
    LOG(INFO) << "Connection attempt for " << clientId << " was cancelled";
    if (!pending->notified.exchange(true)) {
      emitToClient(clientId, "ssh_connection_event",
                   {{"ok", false}, {"message", CANCELLED_MESSAGE}});
    }
    return;
  }
  LOG(WARNING) << "Failed to connect " << clientId << " to "
               << target.username << "@" << target.host << ":" << target.port
               << ": " << failure;
  if (!pending->notified.exchange(true)) {
    emitToClient(clientId, "ssh_connection_event",
                 {{"ok", false}, {"message", "Connection failed: " + failure}});
  }
}

shared_ptr<PendingConnection> RemoteSessionController::cancelPendingConnection(
    const string& clientId) {
  shared_ptr<PendingConnection> pending;
  {
    lock_guard<mutex> guard(pendingMutex);
    auto it = pendingConnections.find(clientId);
    if (it == pendingConnections.end()) {
      return pending;
    }
    pending = it->second;
    pendingConnections.erase(it);
    pending->cancelled = true;
  }
  closeQuietly(pending->client);
  return pending;
}

void RemoteSessionController::disconnect(const string& clientId) {
  auto pending = cancelPendingConnection(clientId);
  if (pending.get() != NULL) {
    if (!pending->notified.exchange(true)) {
      emitToClient(clientId, "ssh_connection_event",
                   {{"ok", false}, {"message", CANCELLED_MESSAGE}});
    }
    return;
  }
  closeSession(clientId, true);
}

void RemoteSessionController::closeSession(const string& clientId,
                                           bool notify) {
  shared_ptr<RemoteSession> session;
  {
    lock_guard<mutex> guard(sessionsMutex);
    auto it = sessions.find(clientId);
    if (it == sessions.end()) {
      return;
    }
    session = it->second;
    sessions.erase(it);
  }

  stopActiveCommand(session, CONNECTION_CLOSED_COMMAND_MESSAGE, true);
  bool shellWasActive = stopSessionShell(session);
  if (notify && shellWasActive) {
    emitToClient(clientId, "ssh_shell_event",
                 {{"ok", true},
                  {"active", false},
                  {"message", SHELL_STOPPED_MESSAGE}});
  }
  closeQuietly(session->client);
  LOG(INFO) << "Closed remote session for " << clientId;
  if (notify) {
    emitToClient(clientId, "ssh_disconnected",
                 {{"message", "SSH connection closed."}});
  }
}

void RemoteSessionController::clientDisconnected(const string& clientId) {
  auto pending = cancelPendingConnection(clientId);
  if (pending.get() != NULL) {
    pending->notified = true;
  }
  closeSession(clientId, false);
}

void RemoteSessionController::shutdown() {
  set<string> clientIds;
  {
    lock_guard<mutex> guard(pendingMutex);
    for (auto& it : pendingConnections) {
      clientIds.insert(it.first);
    }
  }
  {
    lock_guard<mutex> guard(sessionsMutex);
    for (auto& it : sessions) {
      clientIds.insert(it.first);
    }
  }
  for (const string& clientId : clientIds) {
    clientDisconnected(clientId);
  }
  // ThreadPool joins its workers on destruction
  connectPool.reset();
  relayTasks.joinAll();
  // A connect that finished during the drain may have promoted a session
  clientIds.clear();
  {
    lock_guard<mutex> guard(sessionsMutex);
    for (auto& it : sessions) {
      clientIds.insert(it.first);
    }
  }
  for (const string& clientId : clientIds) {
    closeSession(clientId, false);
  }
  relayTasks.joinAll();
}

void RemoteSessionController::runCommand(const string& clientId,
                                         const string& rawCommand) {
  string command = trim(rawCommand);
  if (command.empty()) {
    emitToClient(clientId, "ssh_output",
                 {{"ok", false}, {"message", "No command provided."}});
    return;
  }
  if (!isAvailable()) {
    emitToClient(clientId, "ssh_output",
                 {{"ok", false},
                  {"message", UNSUPPORTED_MESSAGE},
                  {"command", command}});
    return;
  }
  auto session = getSession(clientId);
  if (session.get() == NULL) {
    emitToClient(clientId, "ssh_output",
                 {{"ok", false},
                  {"message", NO_CONNECTION_MESSAGE},
                  {"command", command}});
    return;
  }

  shared_ptr<ActiveCommand> activeCommand;
  {
    lock_guard<mutex> guard(session->commandMutex);
    if (session->activeCommand.get() != NULL) {
      emitToClient(clientId, "ssh_output",
                   {{"ok", false},
                    {"message",
                     "A previous command is still running. Try again when "
                     "it finishes."},
                    {"command", command}});
      return;
    }
    shared_ptr<RemoteChannel> channel;
    try {
      channel = session->client->execCommand(command);
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Failed to run remote command for " << clientId << ": "
                   << ex.what();
      emitToClient(clientId, "ssh_output",
                   {{"ok", false},
                    {"message", string("Failed to run command: ") + ex.what()},
                    {"command", command}});
      return;
    }
    activeCommand = make_shared<ActiveCommand>(command, channel);
    session->activeCommand = activeCommand;
  }

  emitToClient(clientId, "ssh_output",
               {{"ok", true}, {"command", command}, {"state", "started"}});
  relayTasks.spawn("cmd-relay", [this, clientId, session, activeCommand]() {
    relayCommandOutput(clientId, session, activeCommand);
  });
}

void RemoteSessionController::relayCommandOutput(
    const string& clientId, shared_ptr<RemoteSession> session,
    shared_ptr<ActiveCommand> activeCommand) {
  const string& command = activeCommand->command;
  auto channel = activeCommand->channel;
  optional<int> exitStatus;
  string errorMessage;

  auto forwardOutput = [&]() {
    string out = sanitizeTerminalOutput(drainStream(channel.get(), false));
    if (!out.empty()) {
      emitToClient(clientId, "ssh_output",
                   {{"ok", true},
                    {"output", out},
                    {"state", "stream"},
                    {"command", command}});
    }
    string err = sanitizeTerminalOutput(drainStream(channel.get(), true));
    if (!err.empty()) {
      emitToClient(clientId, "ssh_output",
                   {{"ok", false},
                    {"error_output", err},
                    {"state", "stream"},
                    {"command", command}});
    }
  };

  try {
    while (!activeCommand->stopRequested) {
      forwardOutput();
      if (channel->isClosed()) {
        break;
      }
      if (channel->exitStatusReady()) {
        // Output that raced the exit notice
        forwardOutput();
        try {
          exitStatus = channel->exitStatus();
        } catch (const std::exception& ex) {
          errorMessage =
              string("Failed to read command exit status: ") + ex.what();
        }
        break;
      }
      this_thread::sleep_for(chrono::milliseconds(RELAY_POLL_INTERVAL_MS));
    }
  } catch (const std::exception& ex) {
    if (!activeCommand->stopRequested) {
      LOG(ERROR) << "Unexpected error while running remote command for "
                 << clientId << ": " << ex.what();
      errorMessage = "Unexpected error while running the command.";
    }
  }

  closeQuietly(channel);
  {
    lock_guard<mutex> guard(session->commandMutex);
    if (session->activeCommand == activeCommand) {
      session->activeCommand.reset();
    }
  }

  json payload = {{"state", "finished"}, {"command", command}};
  auto termination = activeCommand->getTermination();
  if (termination) {
    payload["ok"] = !termination->second;
    payload["message"] = termination->first;
  } else if (exitStatus) {
    payload["ok"] = (*exitStatus == 0);
    payload["exit_status"] = *exitStatus;
    if (*exitStatus == 0) {
      payload["message"] = "Command completed.";
    } else {
      payload["message"] = "Command completed with exit status " +
                           to_string(*exitStatus) + ".";
    }
  } else if (!errorMessage.empty()) {
    payload["ok"] = false;
    payload["message"] = errorMessage;
  } else {
    payload["ok"] = true;
    payload["message"] = "Command completed.";
  }
  emitToClient(clientId, "ssh_output", payload);
}

void RemoteSessionController::stopActiveCommand(
    shared_ptr<RemoteSession> session, const string& message, bool error) {
  shared_ptr<ActiveCommand> activeCommand;
  {
    lock_guard<mutex> guard(session->commandMutex);
    activeCommand = session->activeCommand;
  }
  if (activeCommand.get() == NULL) {
    return;
  }
  activeCommand->terminate(message, error);
  closeQuietly(activeCommand->channel);
}

void RemoteSessionController::sendCommandInput(const string& clientId,
                                               const string& data) {
  auto session = getSession(clientId);
  if (session.get() == NULL) {
    emitToClient(clientId, "ssh_output",
                 {{"ok", false},
                  {"message", NO_CONNECTION_MESSAGE},
                  {"state", "input_error"}});
    return;
  }
  shared_ptr<ActiveCommand> activeCommand;
  {
    lock_guard<mutex> guard(session->commandMutex);
    activeCommand = session->activeCommand;
  }
  if (activeCommand.get() == NULL) {
    emitToClient(clientId, "ssh_output",
                 {{"ok", false},
                  {"message", "No command is currently running."},
                  {"state", "input_error"}});
    return;
  }
  try {
    activeCommand->channel->write(data);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Failed to write to remote command for " << clientId
                 << ": " << ex.what();
    stopActiveCommand(
        session,
        "Failed to send input to the command; it has been terminated.", true);
  }
}

void RemoteSessionController::startShell(const string& clientId) {
  if (!isAvailable()) {
    emitToClient(clientId, "ssh_shell_event",
                 {{"ok", false},
                  {"active", false},
                  {"message", UNSUPPORTED_MESSAGE}});
    return;
  }
  auto session = getSession(clientId);
  if (session.get() == NULL) {
    emitToClient(clientId, "ssh_shell_event",
                 {{"ok", false},
                  {"active", false},
                  {"message", NO_CONNECTION_MESSAGE}});
    return;
  }

  {
    lock_guard<mutex> guard(session->shellMutex);
    if (session->shellChannel.get() != NULL &&
        session->shellStop.get() != NULL && !session->shellStop->load() &&
        !session->shellChannel->isClosed()) {
      emitToClient(clientId, "ssh_shell_event",
                   {{"ok", true},
                    {"active", true},
                    {"message", "Interactive shell is already active."}});
      return;
    }
  }

  shared_ptr<RemoteChannel> channel;
  try {
    channel = session->client->invokeShell();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Failed to open interactive shell for " << clientId << ": "
                 << ex.what();
    emitToClient(
        clientId, "ssh_shell_event",
        {{"ok", false},
         {"active", false},
         {"message", string("Failed to start interactive shell: ") +
                         ex.what()}});
    return;
  }

  auto stop = make_shared<atomic<bool>>(false);
  shared_ptr<RemoteChannel> staleChannel;
  shared_ptr<atomic<bool>> staleStop;
  {
    lock_guard<mutex> guard(session->shellMutex);
    staleChannel = session->shellChannel;
    staleStop = session->shellStop;
    session->shellChannel = channel;
    session->shellStop = stop;
  }
  if (staleStop.get() != NULL) {
    *staleStop = true;
  }
  if (staleChannel.get() != NULL) {
    closeQuietly(staleChannel);
  }

  emitToClient(clientId, "ssh_shell_event",
               {{"ok", true},
                {"active", true},
                {"message", "Interactive shell started."}});
  relayTasks.spawn("shell-relay", [this, clientId, session, channel, stop]() {
    relayShellOutput(clientId, session, channel, stop);
  });
}

void RemoteSessionController::relayShellOutput(
    const string& clientId, shared_ptr<RemoteSession> session,
    shared_ptr<RemoteChannel> channel, shared_ptr<atomic<bool>> stop) {
  while (!stop->load()) {
    try {
      string out = sanitizeTerminalOutput(drainStream(channel.get(), false));
      if (!out.empty()) {
        emitToClient(clientId, "ssh_shell_output",
                     {{"output", out}, {"isError", false}});
      }
      string err = sanitizeTerminalOutput(drainStream(channel.get(), true));
      if (!err.empty()) {
        emitToClient(clientId, "ssh_shell_output",
                     {{"output", err}, {"isError", true}});
      }
      if (channel->isClosed() || channel->exitStatusReady()) {
        if (stopShellIfCurrent(session, channel)) {
          emitToClient(clientId, "ssh_shell_event",
                       {{"ok", false},
                        {"active", false},
                        {"message", "Interactive shell session ended."}});
        }
        return;
      }
    } catch (const std::exception& ex) {
      if (stop->load()) {
        return;
      }
      LOG(ERROR) << "Error reading interactive shell for " << clientId << ": "
                 << ex.what();
      if (stopShellIfCurrent(session, channel)) {
        emitToClient(clientId, "ssh_shell_event",
                     {{"ok", false},
                      {"active", false},
                      {"message", "Error while reading interactive shell "
                                  "output."}});
      }
      return;
    }
    this_thread::sleep_for(chrono::milliseconds(RELAY_POLL_INTERVAL_MS));
  }
}

bool RemoteSessionController::stopSessionShell(
    shared_ptr<RemoteSession> session) {
  shared_ptr<RemoteChannel> channel;
  shared_ptr<atomic<bool>> stop;
  {
    lock_guard<mutex> guard(session->shellMutex);
    channel.swap(session->shellChannel);
    stop.swap(session->shellStop);
  }
  if (stop.get() != NULL) {
    *stop = true;
  }
  if (channel.get() != NULL) {
    closeQuietly(channel);
    return true;
  }
  return false;
}

bool RemoteSessionController::stopShellIfCurrent(
    shared_ptr<RemoteSession> session, shared_ptr<RemoteChannel> channel) {
  shared_ptr<atomic<bool>> stop;
  {
    lock_guard<mutex> guard(session->shellMutex);
    if (session->shellChannel != channel) {
      return false;
    }
    session->shellChannel.reset();
    stop.swap(session->shellStop);
  }
  if (stop.get() != NULL) {
    *stop = true;
  }
  closeQuietly(channel);
  return true;
}

void RemoteSessionController::shellInput(const string& clientId,
                                         const string& data) {
  auto session = getSession(clientId);
  if (session.get() == NULL) {
    emitToClient(clientId, "ssh_shell_event",
                 {{"ok", false},
                  {"active", false},
                  {"message", NO_CONNECTION_MESSAGE}});
    return;
  }
  shared_ptr<RemoteChannel> channel;
  shared_ptr<atomic<bool>> stop;
  {
    lock_guard<mutex> guard(session->shellMutex);
    channel = session->shellChannel;
    stop = session->shellStop;
  }
  if (channel.get() == NULL || stop.get() == NULL || stop->load()) {
    emitToClient(clientId, "ssh_shell_event",
                 {{"ok", false},
                  {"active", false},
                  {"message", "Interactive shell has not been started."}});
    return;
  }
  try {
    channel->write(data);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Failed to write to interactive shell for " << clientId
                 << ": " << ex.what();
    stopShellIfCurrent(session, channel);
    emitToClient(clientId, "ssh_shell_event",
                 {{"ok", false},
                  {"active", false},
                  {"message",
                   "Failed to send data to the interactive shell; it has "
                   "been closed."}});
  }
}

void RemoteSessionController::stopShell(const string& clientId) {
  auto session = getSession(clientId);
  if (session.get() == NULL) {
    return;
  }
  if (stopSessionShell(session)) {
    emitToClient(clientId, "ssh_shell_event",
                 {{"ok", true},
                  {"active", false},
                  {"message", SHELL_STOPPED_MESSAGE}});
  }
}
}  // namespace gm
