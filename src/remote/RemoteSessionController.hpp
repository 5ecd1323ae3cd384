#ifndef __GM_REMOTE_SESSION_CONTROLLER_H__
#define __GM_REMOTE_SESSION_CONTROLLER_H__

#include "BackgroundTasks.hpp"
#include "EventSink.hpp"
#include "RemoteClient.hpp"

namespace gm {
/**
 * @brief The single in-flight command on a remote session.
 */
class ActiveCommand {
 public:
  ActiveCommand(const string& _command, shared_ptr<RemoteChannel> _channel)
      : command(_command), channel(_channel), stopRequested(false) {}

  /**
   * @brief Records why the command is being killed. The first caller wins
   * and its message replaces the exit status in the finished event.
   */
  void terminate(const string& message, bool error) {
    {
      lock_guard<mutex> guard(terminationMutex);
      if (!terminationMessage) {
        terminationMessage = message;
        terminatedWithError = error;
      }
    }
    stopRequested = true;
  }

  optional<pair<string, bool>> getTermination() {
    lock_guard<mutex> guard(terminationMutex);
    if (!terminationMessage) {
      return nullopt;
    }
    return make_pair(*terminationMessage, terminatedWithError);
  }

  const string command;
  shared_ptr<RemoteChannel> channel;
  atomic<bool> stopRequested;

 protected:
  mutex terminationMutex;
  optional<string> terminationMessage;
  bool terminatedWithError = false;
};

/**
 * @brief One authenticated connection owned by a single client. The command
 * slot and the shell slot have separate locks so both can run at once.
 */
struct RemoteSession {
  explicit RemoteSession(shared_ptr<RemoteClient> _client) : client(_client) {}

  shared_ptr<RemoteClient> client;

  mutex commandMutex;
  shared_ptr<ActiveCommand> activeCommand;

  mutex shellMutex;
  shared_ptr<RemoteChannel> shellChannel;
  shared_ptr<atomic<bool>> shellStop;
};

struct PendingConnection {
  explicit PendingConnection(shared_ptr<RemoteClient> _client)
      : client(_client), cancelled(false), notified(false) {}

  shared_ptr<RemoteClient> client;
  atomic<bool> cancelled;
  // Set by whoever sends the client a message about this attempt
  atomic<bool> notified;
};

/**
 * @brief Per-client remote shell state machine: connect, one command at a
 * time, an optional interactive shell, and disconnect. Every reply is
 * emitted to the client's room.
 */
class RemoteSessionController {
 public:
  /**
   * @param factory may be null, which makes remote access unavailable.
   */
  RemoteSessionController(shared_ptr<EventSink> _sink,
                          shared_ptr<RemoteClientFactory> _factory,
                          bool _enabled = true,
                          int _timeoutSeconds = DEFAULT_REMOTE_TIMEOUT);
  ~RemoteSessionController();

  bool isAvailable() const { return factory.get() != NULL && enabled; }

  /** @param port digits, or empty for 22. */
  void connect(const string& clientId, const string& host,
               const string& username, const optional<string>& password,
               const string& port);
  void disconnect(const string& clientId);

  void runCommand(const string& clientId, const string& command);
  void sendCommandInput(const string& clientId, const string& data);

  void startShell(const string& clientId);
  void shellInput(const string& clientId, const string& data);
  void stopShell(const string& clientId);

  /** @brief The client's transport went away. Nothing is emitted. */
  void clientDisconnected(const string& clientId);

  void shutdown();

  bool hasSession(const string& clientId);
  bool hasPendingConnection(const string& clientId);

 protected:
  shared_ptr<RemoteSession> getSession(const string& clientId);
  shared_ptr<PendingConnection> cancelPendingConnection(
      const string& clientId);
  void establishConnection(const string& clientId,
                           shared_ptr<PendingConnection> pending,
                           const RemoteTarget& target);
  void closeSession(const string& clientId, bool notify);

  void stopActiveCommand(shared_ptr<RemoteSession> session,
                         const string& message, bool error);
  bool stopSessionShell(shared_ptr<RemoteSession> session);
  bool stopShellIfCurrent(shared_ptr<RemoteSession> session,
                          shared_ptr<RemoteChannel> channel);

  void relayCommandOutput(const string& clientId,
                          shared_ptr<RemoteSession> session,
                          shared_ptr<ActiveCommand> activeCommand);
  void relayShellOutput(const string& clientId,
                        shared_ptr<RemoteSession> session,
                        shared_ptr<RemoteChannel> channel,
                        shared_ptr<atomic<bool>> stop);

  void emitToClient(const string& clientId, const string& event,
                    const json& payload);

  shared_ptr<EventSink> sink;
  shared_ptr<RemoteClientFactory> factory;
  bool enabled;
  int timeoutSeconds;

  // Lock order: pendingMutex before sessionsMutex
  mutex pendingMutex;
  map<string, shared_ptr<PendingConnection>> pendingConnections;
  mutex sessionsMutex;
  map<string, shared_ptr<RemoteSession>> sessions;

  BackgroundTasks relayTasks;
  // Declared last so it drains before the maps above go away
  unique_ptr<ThreadPool> connectPool;
};
}  // namespace gm

#endif  // __GM_REMOTE_SESSION_CONTROLLER_H__
