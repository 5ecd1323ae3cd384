#ifndef __GM_LIBSSH2_CLIENT_H__
#define __GM_LIBSSH2_CLIENT_H__

#include <libssh2.h>

#include "RemoteClient.hpp"
#include "TcpSocketHandler.hpp"

namespace gm {
/**
 * @brief libssh2 state shared by a client and the channels it opened.
 * Every libssh2 call on the session happens under `ioMutex`.
 */
struct Libssh2Connection {
  Libssh2Connection() : session(NULL), sockFd(-1), closed(false) {}

  LIBSSH2_SESSION* session;
  int sockFd;
  atomic<bool> closed;
  recursive_mutex ioMutex;
};

class Libssh2Channel : public RemoteChannel {
 public:
  Libssh2Channel(shared_ptr<Libssh2Connection> _connection,
                 LIBSSH2_CHANNEL* _channel);
  virtual ~Libssh2Channel() { close(); }

  virtual int readStdout(string* out, int maxBytes);
  virtual int readStderr(string* out, int maxBytes);
  virtual void write(const string& data);
  virtual bool isClosed();
  virtual bool exitStatusReady();
  virtual int exitStatus();
  virtual void close();

 protected:
  int readStream(int streamId, string* out, int maxBytes);
  void throwIfUnusable();

  shared_ptr<Libssh2Connection> connection;
  LIBSSH2_CHANNEL* channel;
  atomic<bool> closed;
};

class Libssh2Client : public RemoteClient {
 public:
  Libssh2Client();
  virtual ~Libssh2Client() { close(); }

  virtual void connect(const RemoteTarget& target);
  virtual shared_ptr<RemoteChannel> execCommand(const string& command);
  virtual shared_ptr<RemoteChannel> invokeShell();
  virtual void close();

 protected:
  LIBSSH2_CHANNEL* openPtyChannel();
  void teardown();
  string lastError();

  shared_ptr<Libssh2Connection> connection;
  shared_ptr<TcpSocketHandler> socketHandler;
  // Guards the connecting flag and the fd handoff between connect and close
  mutex stateMutex;
  bool connecting;
  int timeoutSeconds;
};

class Libssh2ClientFactory : public RemoteClientFactory {
 public:
  virtual shared_ptr<RemoteClient> create() {
    return shared_ptr<RemoteClient>(new Libssh2Client());
  }
};
}  // namespace gm

#endif  // __GM_LIBSSH2_CLIENT_H__
