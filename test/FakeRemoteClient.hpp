#ifndef __GM_FAKE_REMOTE_CLIENT_H__
#define __GM_FAKE_REMOTE_CLIENT_H__

#include "RemoteClient.hpp"
#include "TestHeaders.hpp"

namespace gm {
class FakeRemoteChannel : public RemoteChannel {
 public:
  FakeRemoteChannel()
      : closed(false), exitReady(false), exitCode(0), failWrites(false),
        failReads(false), closeCount(0) {}

  virtual int readStdout(string* out, int maxBytes) {
    return take(&stdoutData, out, maxBytes);
  }

  virtual int readStderr(string* out, int maxBytes) {
    return take(&stderrData, out, maxBytes);
  }

  virtual void write(const string& data) {
    lock_guard<mutex> guard(channelMutex);
    if (failWrites || closed) {
      throw std::runtime_error("Channel write failed");
    }
    written += data;
  }

  virtual bool isClosed() { return closed; }

  virtual bool exitStatusReady() {
    lock_guard<mutex> guard(channelMutex);
    return exitReady && stdoutData.empty() && stderrData.empty();
  }

  virtual int exitStatus() { return exitCode; }

  virtual void close() {
    closed = true;
    closeCount++;
  }

  void pushStdout(const string& data) {
    lock_guard<mutex> guard(channelMutex);
    stdoutData += data;
  }

  void pushStderr(const string& data) {
    lock_guard<mutex> guard(channelMutex);
    stderrData += data;
  }

  // The remote process exited with `code`
  void finish(int code) {
    lock_guard<mutex> guard(channelMutex);
    exitCode = code;
    exitReady = true;
  }

  string getWritten() {
    lock_guard<mutex> guard(channelMutex);
    return written;
  }

  atomic<bool> closed;
  atomic<bool> exitReady;
  atomic<int> exitCode;
  atomic<bool> failWrites;
  atomic<bool> failReads;
  atomic<int> closeCount;

 protected:
  int take(string* source, string* out, int maxBytes) {
    lock_guard<mutex> guard(channelMutex);
    if (failReads) {
      throw std::runtime_error("Channel read failed");
    }
    int n = min(int(source->length()), maxBytes);
    out->append(*source, 0, n);
    source->erase(0, n);
    return n;
  }

  mutex channelMutex;
  string stdoutData;
  string stderrData;
  string written;
};

struct FakeConnectBehavior {
  // Wait in connect() until release() or close()
  bool block = false;
  // Thrown from connect() when set
  optional<string> failure;
  // A close() during a blocked connect still lets it succeed
  bool succeedAfterClose = false;
};

class FakeRemoteClient : public RemoteClient {
 public:
  explicit FakeRemoteClient(const FakeConnectBehavior& _behavior)
      : behavior(_behavior),
        connecting(false),
        connectFinished(false),
        released(false),
        closed(false),
        failExec(false),
        failShell(false) {}

  virtual void connect(const RemoteTarget& _target) {
    {
      lock_guard<mutex> guard(clientMutex);
      target = _target;
    }
    connecting = true;
    if (behavior.block) {
      unique_lock<mutex> lock(clientMutex);
      cv.wait(lock, [this]() { return released || closed; });
    }
    connectFinished = true;
    if (closed && !behavior.succeedAfterClose) {
      throw std::runtime_error("Connection closed");
    }
    if (behavior.failure) {
      throw std::runtime_error(*behavior.failure);
    }
  }

  virtual shared_ptr<RemoteChannel> execCommand(const string& command) {
    lock_guard<mutex> guard(clientMutex);
    if (failExec) {
      throw std::runtime_error("exec refused");
    }
    commands.push_back(command);
    auto channel = make_shared<FakeRemoteChannel>();
    commandChannels.push_back(channel);
    return channel;
  }

  virtual shared_ptr<RemoteChannel> invokeShell() {
    lock_guard<mutex> guard(clientMutex);
    if (failShell) {
      throw std::runtime_error("shell refused");
    }
    auto channel = make_shared<FakeRemoteChannel>();
    shellChannels.push_back(channel);
    return channel;
  }

  virtual void close() {
    {
      lock_guard<mutex> guard(clientMutex);
      closed = true;
    }
    cv.notify_all();
  }

  void release() {
    {
      lock_guard<mutex> guard(clientMutex);
      released = true;
    }
    cv.notify_all();
  }

  RemoteTarget getTarget() {
    lock_guard<mutex> guard(clientMutex);
    return target;
  }

  shared_ptr<FakeRemoteChannel> commandChannel(int i) {
    lock_guard<mutex> guard(clientMutex);
    if (i >= int(commandChannels.size())) {
      return shared_ptr<FakeRemoteChannel>();
    }
    return commandChannels[i];
  }

  shared_ptr<FakeRemoteChannel> shellChannel(int i) {
    lock_guard<mutex> guard(clientMutex);
    if (i >= int(shellChannels.size())) {
      return shared_ptr<FakeRemoteChannel>();
    }
    return shellChannels[i];
  }

  FakeConnectBehavior behavior;
  atomic<bool> connecting;
  atomic<bool> connectFinished;
  bool released;
  atomic<bool> closed;
  atomic<bool> failExec;
  atomic<bool> failShell;

 protected:
  mutex clientMutex;
  condition_variable cv;
  RemoteTarget target;
  vector<string> commands;
  vector<shared_ptr<FakeRemoteChannel>> commandChannels;
  vector<shared_ptr<FakeRemoteChannel>> shellChannels;
};

/**
 * Hands out FakeRemoteClients. Queued behaviors are used in order, then the
 * default behavior.
 */
class FakeRemoteClientFactory : public RemoteClientFactory {
 public:
  virtual shared_ptr<RemoteClient> create() {
    lock_guard<mutex> guard(factoryMutex);
    FakeConnectBehavior behavior = defaultBehavior;
    if (!queuedBehaviors.empty()) {
      behavior = queuedBehaviors.front();
      queuedBehaviors.pop_front();
    }
    auto client = make_shared<FakeRemoteClient>(behavior);
    created.push_back(client);
    return client;
  }

  void queueBehavior(const FakeConnectBehavior& behavior) {
    lock_guard<mutex> guard(factoryMutex);
    queuedBehaviors.push_back(behavior);
  }

  shared_ptr<FakeRemoteClient> client(int i) {
    lock_guard<mutex> guard(factoryMutex);
    if (i >= int(created.size())) {
      return shared_ptr<FakeRemoteClient>();
    }
    return created[i];
  }

  int numCreated() {
    lock_guard<mutex> guard(factoryMutex);
    return int(created.size());
  }

  FakeConnectBehavior defaultBehavior;

 protected:
  mutex factoryMutex;
  deque<FakeConnectBehavior> queuedBehaviors;
  vector<shared_ptr<FakeRemoteClient>> created;
};
}  // namespace gm

#endif  // __GM_FAKE_REMOTE_CLIENT_H__
