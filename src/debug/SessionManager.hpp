#ifndef __GM_SESSION_MANAGER_H__
#define __GM_SESSION_MANAGER_H__

#include "DebugSession.hpp"

namespace gm {
/**
 * @brief What happens to a debug session when its last client detaches.
 */
enum class OrphanPolicy {
  // Keep it running so a client can reattach by pid
  RETAIN,
  // Remove and kill it right away
  DESTROY,
};

OrphanPolicy orphanPolicyFromString(const string& s);

/**
 * @brief Registry of debug sessions and the clients subscribed to them.
 *
 * A client follows at most one session. The registry lock is never held
 * while a process is started or killed.
 */
class SessionManager {
 public:
  typedef vector<pair<shared_ptr<DebugSession>, set<string>>> Snapshot;

  SessionManager(shared_ptr<DebugSessionFactory> _factory,
                 OrphanPolicy _orphanPolicy = OrphanPolicy::RETAIN);

  /** @throws std::runtime_error when gdb cannot be started. */
  shared_ptr<DebugSession> addNewDebugSession(const string& gdbCommand,
                                              const string& miVersion,
                                              const string& clientId);
  /** @throws std::runtime_error when no session has that pid. */
  shared_ptr<DebugSession> connectClientToDebugSession(pid_t pid,
                                                       const string& clientId);
  shared_ptr<DebugSession> debugSessionFromClientId(const string& clientId);
  void disconnectClient(const string& clientId);

  /** @returns false if the session was already gone. */
  bool removeDebugSession(shared_ptr<DebugSession> session);
  bool removeDebugSessionByPid(pid_t pid);
  void removeAll();

  Snapshot snapshot();
  json getDashboardData();
  int numSessions();

  OrphanPolicy getOrphanPolicy() { return orphanPolicy; }

 protected:
  // Returns sessions orphaned by the detach that must be terminated
  vector<shared_ptr<DebugSession>> detachClientLocked(const string& clientId);
  void terminateQuietly(shared_ptr<DebugSession> session);

  shared_ptr<DebugSessionFactory> factory;
  OrphanPolicy orphanPolicy;
  recursive_mutex managerMutex;
  map<shared_ptr<DebugSession>, set<string>> sessionClients;
};
}  // namespace gm

#endif  // __GM_SESSION_MANAGER_H__
