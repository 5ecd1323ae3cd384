#include "SessionManager.hpp"

namespace gm {
OrphanPolicy orphanPolicyFromString(const string& s) {
  string lower = s;
  transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
  if (lower == "retain") {
    return OrphanPolicy::RETAIN;
  }
  if (lower == "destroy") {
    return OrphanPolicy::DESTROY;
  }
  throw std::runtime_error("Unknown orphan policy: " + s);
}

SessionManager::SessionManager(shared_ptr<DebugSessionFactory> _factory,
                               OrphanPolicy _orphanPolicy)
    : factory(_factory), orphanPolicy(_orphanPolicy) {}

shared_ptr<DebugSession> SessionManager::addNewDebugSession(
    const string& gdbCommand, const string& miVersion,
    const string& clientId) {
  auto session = factory->create(gdbCommand, miVersion);
  vector<shared_ptr<DebugSession>> orphans;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    orphans = detachClientLocked(clientId);
    sessionClients[session].insert(clientId);
  }
  for (auto& orphan : orphans) {
    terminateQuietly(orphan);
  }
  LOG(INFO) << "Started debug session " << session->getPid() << " for "
            << clientId;
  return session;
}

shared_ptr<DebugSession> SessionManager::connectClientToDebugSession(
    pid_t pid, const string& clientId) {
  shared_ptr<DebugSession> target;
  vector<shared_ptr<DebugSession>> orphans;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    for (auto& it : sessionClients) {
      if (it.first->getPid() == pid) {
        target = it.first;
        break;
      }
    }
    if (target.get() == NULL) {
      throw std::runtime_error("Could not find debug session with pid " +
                               to_string(pid));
    }
    auto& clients = sessionClients[target];
    if (clients.find(clientId) == clients.end()) {
      // The client is not in target, so the detach never drops target
      orphans = detachClientLocked(clientId);
      sessionClients[target].insert(clientId);
    }
  }
  for (auto& orphan : orphans) {
    terminateQuietly(orphan);
  }
  LOG(INFO) << "Client " << clientId << " attached to debug session " << pid;
  return target;
}

shared_ptr<DebugSession> SessionManager::debugSessionFromClientId(
    const string& clientId) {
  lock_guard<recursive_mutex> guard(managerMutex);
  for (auto& it : sessionClients) {
    if (it.second.find(clientId) != it.second.end()) {
      return it.first;
    }
  }
  return shared_ptr<DebugSession>();
}

vector<shared_ptr<DebugSession>> SessionManager::detachClientLocked(
    const string& clientId) {
  vector<shared_ptr<DebugSession>> orphans;
  auto it = sessionClients.begin();
  while (it != sessionClients.end()) {
    if (it->second.erase(clientId) && it->second.empty() &&
        orphanPolicy == OrphanPolicy::DESTROY) {
      orphans.push_back(it->first);
      it = sessionClients.erase(it);
    } else {
      ++it;
    }
  }
  return orphans;
}

void SessionManager::disconnectClient(const string& clientId) {
  vector<shared_ptr<DebugSession>> orphans;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    orphans = detachClientLocked(clientId);
  }
  for (auto& orphan : orphans) {
    LOG(INFO) << "Removing orphaned debug session " << orphan->getPid();
    terminateQuietly(orphan);
  }
}

bool SessionManager::removeDebugSession(shared_ptr<DebugSession> session) {
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    if (sessionClients.erase(session) == 0) {
      return false;
    }
  }
  LOG(INFO) << "Removing debug session " << session->getPid();
  terminateQuietly(session);
  return true;
}

bool SessionManager::removeDebugSessionByPid(pid_t pid) {
  shared_ptr<DebugSession> target;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    for (auto& it : sessionClients) {
      if (it.first->getPid() == pid) {
        target = it.first;
        break;
      }
    }
  }
  if (target.get() == NULL) {
    return false;
  }
  return removeDebugSession(target);
}

void SessionManager::removeAll() {
  map<shared_ptr<DebugSession>, set<string>> toRemove;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    toRemove.swap(sessionClients);
  }
  for (auto& it : toRemove) {
    terminateQuietly(it.first);
  }
}

SessionManager::Snapshot SessionManager::snapshot() {
  lock_guard<recursive_mutex> guard(managerMutex);
  Snapshot s;
  for (auto& it : sessionClients) {
    s.push_back(make_pair(it.first, it.second));
  }
  return s;
}

json SessionManager::getDashboardData() {
  json sessions = json::array();
  for (auto& it : snapshot()) {
    json clientIds = json::array();
    for (const string& clientId : it.second) {
      clientIds.push_back(clientId);
    }
    sessions.push_back({{"pid", it.first->getPid()},
                        {"start_time", it.first->getStartTime()},
                        {"command", it.first->getCommand()},
                        {"client_ids", clientIds}});
  }
  return sessions;
}

int SessionManager::numSessions() {
  lock_guard<recursive_mutex> guard(managerMutex);
  return int(sessionClients.size());
}

void SessionManager::terminateQuietly(shared_ptr<DebugSession> session) {
  try {
    session->terminate();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Error terminating debug session " << session->getPid()
                 << ": " << ex.what();
  }
}
}  // namespace gm
