#ifndef __GM_FAKE_DEBUG_SESSION_H__
#define __GM_FAKE_DEBUG_SESSION_H__

#include <tuple>

#include "DebugSession.hpp"
#include "TestHeaders.hpp"

namespace gm {
/**
 * A debug session without a process behind it. Output is queued by the test
 * and failures are injected by call count.
 */
class FakeDebugSession : public DebugSession {
 public:
  FakeDebugSession(pid_t _pid, const string& _command)
      : DebugSession(shared_ptr<ProcessIoController>(), shared_ptr<Pty>(),
                     shared_ptr<Pty>(), _pid, _command),
        pollCount(0),
        failPollOnCall(0),
        failPtyRead(false),
        terminateCount(0) {}

  virtual optional<json> pollResponse() {
    lock_guard<mutex> guard(fakeMutex);
    pollCount++;
    if (failPollOnCall > 0 && pollCount >= failPollOnCall) {
      throw std::runtime_error("gdb went away");
    }
    if (responses.empty()) {
      return nullopt;
    }
    json response = responses.front();
    responses.pop_front();
    return response;
  }

  virtual optional<string> readPty(PtyKind kind) {
    lock_guard<mutex> guard(fakeMutex);
    if (failPtyRead) {
      throw std::runtime_error("pty read failed");
    }
    string& pending = kind == PtyKind::USER ? userOutput : programOutput;
    if (pending.empty()) {
      return nullopt;
    }
    string out;
    out.swap(pending);
    return out;
  }

  virtual void writePty(PtyKind kind, const string& data) {
    lock_guard<mutex> guard(fakeMutex);
    if (kind == PtyKind::USER) {
      userInput += data;
    } else {
      programInput += data;
    }
  }

  virtual void setWinsize(PtyKind kind, int rows, int cols) {
    lock_guard<mutex> guard(fakeMutex);
    if (rows <= 0 || cols <= 0) {
      throw std::runtime_error("Invalid window size");
    }
    winsizes.push_back(make_tuple(kind, rows, cols));
  }

  virtual void writeMi(const string& command) {
    lock_guard<mutex> guard(fakeMutex);
    miCommands.push_back(command);
  }

  virtual vector<int> pollFds() { return {}; }

  virtual void terminate() { terminateCount++; }

  void queueResponse(const json& response) {
    lock_guard<mutex> guard(fakeMutex);
    responses.push_back(response);
  }

  void queuePtyOutput(PtyKind kind, const string& data) {
    lock_guard<mutex> guard(fakeMutex);
    (kind == PtyKind::USER ? userOutput : programOutput) += data;
  }

  int pollCount;
  // Throw from the Nth poll onwards, 0 never throws
  int failPollOnCall;
  bool failPtyRead;
  atomic<int> terminateCount;

  string userInput;
  string programInput;
  vector<string> miCommands;
  vector<tuple<PtyKind, int, int>> winsizes;

 protected:
  mutex fakeMutex;
  deque<json> responses;
  string userOutput;
  string programOutput;
};

class FakeDebugSessionFactory : public DebugSessionFactory {
 public:
  FakeDebugSessionFactory() : nextPid(1000), failCreate(false) {}

  virtual shared_ptr<DebugSession> create(const string& gdbCommand,
                                          const string& miVersion) {
    lock_guard<mutex> guard(factoryMutex);
    if (failCreate) {
      throw std::runtime_error("could not start " + gdbCommand);
    }
    auto session = make_shared<FakeDebugSession>(nextPid++, gdbCommand);
    launches.push_back(make_pair(gdbCommand, miVersion));
    created.push_back(session);
    return session;
  }

  shared_ptr<FakeDebugSession> session(int i) {
    lock_guard<mutex> guard(factoryMutex);
    return created.at(i);
  }

  pid_t nextPid;
  bool failCreate;
  vector<pair<string, string>> launches;

 protected:
  mutex factoryMutex;
  vector<shared_ptr<FakeDebugSession>> created;
};
}  // namespace gm

#endif  // __GM_FAKE_DEBUG_SESSION_H__
