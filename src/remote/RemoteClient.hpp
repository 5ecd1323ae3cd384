#ifndef __GM_REMOTE_CLIENT_H__
#define __GM_REMOTE_CLIENT_H__

#include "Headers.hpp"

namespace gm {
struct RemoteTarget {
  string host;
  int port = DEFAULT_SSH_PORT;
  string username;
  optional<string> password;
  // Applies to each of the connect, banner and auth phases
  int timeoutSeconds = DEFAULT_REMOTE_TIMEOUT;
};

/**
 * @brief One execution or shell channel on a remote connection.
 *
 * Reads never block: they return the number of bytes appended to `out`, or
 * 0 when nothing is pending. Transport failures are thrown as
 * std::runtime_error. `close()` never throws and may be called from any
 * thread, including while another thread is reading.
 */
class RemoteChannel {
 public:
  virtual ~RemoteChannel() {}

  virtual int readStdout(string* out, int maxBytes) = 0;
  virtual int readStderr(string* out, int maxBytes) = 0;
  virtual void write(const string& data) = 0;

  virtual bool isClosed() = 0;
  /** @brief True once the remote side reported the process exit. */
  virtual bool exitStatusReady() = 0;
  virtual int exitStatus() = 0;

  virtual void close() = 0;
};

/**
 * @brief An authenticated remote connection that opens pty backed channels.
 */
class RemoteClient {
 public:
  virtual ~RemoteClient() {}

  /**
   * @brief Blocks until the connection is authenticated.
   * @throws std::runtime_error with a readable reason. A concurrent `close()`
   * makes a pending connect fail promptly.
   */
  virtual void connect(const RemoteTarget& target) = 0;

  virtual shared_ptr<RemoteChannel> execCommand(const string& command) = 0;
  virtual shared_ptr<RemoteChannel> invokeShell() = 0;

  /** @brief Idempotent; never throws. */
  virtual void close() = 0;
};

class RemoteClientFactory {
 public:
  virtual ~RemoteClientFactory() {}

  virtual shared_ptr<RemoteClient> create() = 0;
};
}  // namespace gm

#endif  // __GM_REMOTE_CLIENT_H__
