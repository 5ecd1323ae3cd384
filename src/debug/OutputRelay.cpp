#include "OutputRelay.hpp"

namespace gm {
const char* OutputRelay::GDB_KILLED_MESSAGE =
    "The underlying gdb process has been killed. This tab will no longer "
    "function as expected.";

OutputRelay::OutputRelay(shared_ptr<SessionManager> _manager,
                         shared_ptr<EventSink> _sink, int _intervalMs)
    : manager(_manager), sink(_sink), intervalMs(_intervalMs), running(false) {}

void OutputRelay::broadcast(const set<string>& clientIds, const string& event,
                            const json& payload) {
  for (const string& clientId : clientIds) {
    sink->emit(clientId, event, payload);
  }
}

void OutputRelay::tick() {
  auto sessions = manager->snapshot();
  set<shared_ptr<DebugSession>> sessionsToRemove;

  for (auto& it : sessions) {
    optional<json> response;
    try {
      response = it.first->pollResponse();
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Lost gdb process " << it.first->getPid() << ": "
                   << ex.what();
      json fatal = json::array();
      fatal.push_back({{"message", nullptr},
                       {"type", "console"},
                       {"payload", GDB_KILLED_MESSAGE},
                       {"stream", "stderr"}});
      broadcast(it.second, "gdb_response", fatal);
      sessionsToRemove.insert(it.first);
      continue;
    }
    if (response) {
      broadcast(it.second, "gdb_response", *response);
    }
  }

  for (auto& it : sessions) {
    if (sessionsToRemove.count(it.first)) {
      // Its subscribers already got the fatal notice
      continue;
    }
    try {
      auto userOutput = it.first->readPty(PtyKind::USER);
      if (userOutput) {
        broadcast(it.second, "user_pty_response", *userOutput);
      }
      auto programOutput = it.first->readPty(PtyKind::PROGRAM);
      if (programOutput) {
        broadcast(it.second, "program_pty_response", *programOutput);
      }
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Pty failure on debug session " << it.first->getPid()
                   << ": " << ex.what();
      sessionsToRemove.insert(it.first);
      broadcast(it.second, "fatal_server_error", {{"message", ex.what()}});
    }
  }

  for (auto& session : sessionsToRemove) {
    manager->removeDebugSession(session);
  }
}

void OutputRelay::waitForOutput(const SessionManager::Snapshot& sessions) {
  fd_set rfds;
  FD_ZERO(&rfds);
  int maxFd = -1;
  for (auto& it : sessions) {
    for (int fd : it.first->pollFds()) {
      if (fd >= 0 && fd < FD_SETSIZE) {
        FD_SET(fd, &rfds);
        maxFd = max(maxFd, fd);
      }
    }
  }
  timeval tv;
  tv.tv_sec = intervalMs / 1000;
  tv.tv_usec = (intervalMs % 1000) * 1000;
  if (maxFd < 0) {
    this_thread::sleep_for(chrono::milliseconds(intervalMs));
    return;
  }
  if (select(maxFd + 1, &rfds, NULL, NULL, &tv) < 0) {
    // A session closed its fds between the snapshot and the select
    VLOG(2) << "relay select failed: " << strerror(GetErrno());
    this_thread::sleep_for(chrono::milliseconds(intervalMs));
  }
}

void OutputRelay::run() {
  el::Helpers::setThreadName("output-relay");
  LOG(INFO) << "Output relay started";
  while (running) {
    waitForOutput(manager->snapshot());
    if (!running) {
      break;
    }
    tick();
  }
  LOG(INFO) << "Output relay stopped";
}

void OutputRelay::startIfNeeded() {
  lock_guard<mutex> guard(threadMutex);
  if (relayThread.get() != NULL) {
    return;
  }
  running = true;
  relayThread.reset(new thread(&OutputRelay::run, this));
}

void OutputRelay::stop() {
  lock_guard<mutex> guard(threadMutex);
  running = false;
  if (relayThread.get() != NULL && relayThread->joinable()) {
    relayThread->join();
  }
}
}  // namespace gm
