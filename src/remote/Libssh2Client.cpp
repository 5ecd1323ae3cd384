#include "Libssh2Client.hpp"

namespace gm {
namespace {
once_flag libssh2InitFlag;

void initLibssh2() {
  call_once(libssh2InitFlag, []() {
    int rc = libssh2_init(0);
    if (rc != 0) {
      STFATAL << "libssh2_init failed: " << rc;
    }
  });
}

// libssh2 keeps one blocking flag per session. Channel setup and writes run
// in blocking mode (bounded by the session timeout), reads stay non-blocking.
class BlockingScope {
 public:
  explicit BlockingScope(LIBSSH2_SESSION* _session) : session(_session) {
    libssh2_session_set_blocking(session, 1);
  }
  ~BlockingScope() { libssh2_session_set_blocking(session, 0); }

 private:
  LIBSSH2_SESSION* session;
};

string sessionError(LIBSSH2_SESSION* session) {
  char* errmsg = NULL;
  int errlen = 0;
  libssh2_session_last_error(session, &errmsg, &errlen, 0);
  if (errmsg == NULL || errlen == 0) {
    return "unknown ssh error";
  }
  return string(errmsg, errlen);
}
}  // namespace

Libssh2Channel::Libssh2Channel(shared_ptr<Libssh2Connection> _connection,
                               LIBSSH2_CHANNEL* _channel)
    : connection(_connection), channel(_channel), closed(false) {}

void Libssh2Channel::throwIfUnusable() {
  if (closed || connection->closed) {
    throw std::runtime_error("Channel is closed");
  }
}

int Libssh2Channel::readStream(int streamId, string* out, int maxBytes) {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  throwIfUnusable();
  string buf(maxBytes, '\0');
  ssize_t rc = libssh2_channel_read_ex(channel, streamId, &buf[0], maxBytes);
  if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
    return 0;
  }
  if (rc < 0) {
    throw std::runtime_error(sessionError(connection->session));
  }
  out->append(buf, 0, rc);
  return int(rc);
}

int Libssh2Channel::readStdout(string* out, int maxBytes) {
  return readStream(0, out, maxBytes);
}

int Libssh2Channel::readStderr(string* out, int maxBytes) {
  return readStream(SSH_EXTENDED_DATA_STDERR, out, maxBytes);
}

void Libssh2Channel::write(const string& data) {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  throwIfUnusable();
  BlockingScope blocking(connection->session);
  size_t pos = 0;
  while (pos < data.length()) {
    ssize_t rc =
        libssh2_channel_write(channel, data.c_str() + pos, data.length() - pos);
    if (rc < 0) {
      throw std::runtime_error(sessionError(connection->session));
    }
    pos += rc;
  }
}

bool Libssh2Channel::isClosed() { return closed || connection->closed; }

bool Libssh2Channel::exitStatusReady() {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  // close() and teardown() free the channel under the same lock
  if (isClosed()) {
    return false;
  }
  // exit-status always precedes the remote close
  return libssh2_channel_eof(channel) == 1 &&
         libssh2_channel_wait_closed(channel) == 0;
}

int Libssh2Channel::exitStatus() {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  throwIfUnusable();
  return libssh2_channel_get_exit_status(channel);
}

void Libssh2Channel::close() {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  if (closed.exchange(true)) {
    return;
  }
  if (connection->closed || connection->session == NULL) {
    // libssh2_session_free already released the channel
    return;
  }
  BlockingScope blocking(connection->session);
  int rc = libssh2_channel_close(channel);
  if (rc != 0) {
    VLOG(1) << "Error closing ssh channel: " << sessionError(connection->session);
  }
  libssh2_channel_free(channel);
}

Libssh2Client::Libssh2Client()
    : connection(new Libssh2Connection()),
      connecting(false),
      timeoutSeconds(DEFAULT_REMOTE_TIMEOUT) {}

void Libssh2Client::connect(const RemoteTarget& target) {
  initLibssh2();
  {
    lock_guard<mutex> guard(stateMutex);
    if (connection->closed) {
      throw std::runtime_error("Connection cancelled");
    }
    if (connecting || connection->session != NULL) {
      throw std::runtime_error("Client is already connected");
    }
    connecting = true;
    timeoutSeconds = target.timeoutSeconds;
    socketHandler.reset(new TcpSocketHandler(timeoutSeconds));
  }

  string failure;
  SocketEndpoint endpoint;
  endpoint.set_name(target.host);
  endpoint.set_port(target.port);
  int fd = socketHandler->connect(endpoint);
  if (fd < 0) {
    failure = strerror(GetErrno());
  }

  {
    lock_guard<mutex> guard(stateMutex);
    connection->sockFd = fd;
    if (failure.empty() && connection->closed) {
      failure = "Connection cancelled";
    }
  }

  if (failure.empty()) {
    lock_guard<recursive_mutex> ioGuard(connection->ioMutex);
    LIBSSH2_SESSION* session = libssh2_session_init();
    if (session == NULL) {
      failure = "Could not allocate an ssh session";
    } else {
      connection->session = session;
      libssh2_session_set_blocking(session, 1);
      libssh2_session_set_timeout(session, long(timeoutSeconds) * 1000);
      if (libssh2_session_handshake(session, fd) != 0) {
        failure = lastError();
      } else if (connection->closed) {
        failure = "Connection cancelled";
      } else {
        int rc;
        if (target.password) {
          rc = libssh2_userauth_password(session, target.username.c_str(),
                                         target.password->c_str());
        } else {
          // Only the "none" method is attempted without a password
          libssh2_userauth_list(session, target.username.c_str(),
                                target.username.length());
          rc = libssh2_userauth_authenticated(session) ? 0 : -1;
        }
        if (rc != 0) {
          failure = "Authentication failed: " + lastError();
        } else {
          libssh2_session_set_blocking(session, 0);
        }
      }
    }
  }

  bool cancelled;
  {
    lock_guard<mutex> guard(stateMutex);
    connecting = false;
    cancelled = connection->closed;
  }
  if (cancelled && failure.empty()) {
    failure = "Connection cancelled";
  }
  if (!failure.empty()) {
    teardown();
    throw std::runtime_error(failure);
  }
  LOG(INFO) << "Connected to " << target.username << "@" << target.host << ":"
            << target.port;
}

LIBSSH2_CHANNEL* Libssh2Client::openPtyChannel() {
  if (connection->closed || connection->session == NULL) {
    throw std::runtime_error("Not connected");
  }
  BlockingScope blocking(connection->session);
  LIBSSH2_CHANNEL* channel = libssh2_channel_open_session(connection->session);
  if (channel == NULL) {
    throw std::runtime_error(lastError());
  }
  if (libssh2_channel_request_pty(channel, "xterm") != 0) {
    string error = lastError();
    libssh2_channel_free(channel);
    throw std::runtime_error(error);
  }
  return channel;
}

shared_ptr<RemoteChannel> Libssh2Client::execCommand(const string& command) {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  LIBSSH2_CHANNEL* channel = openPtyChannel();
  {
    BlockingScope blocking(connection->session);
    if (libssh2_channel_exec(channel, command.c_str()) != 0) {
      string error = lastError();
      libssh2_channel_free(channel);
      throw std::runtime_error(error);
    }
  }
  return shared_ptr<RemoteChannel>(new Libssh2Channel(connection, channel));
}

shared_ptr<RemoteChannel> Libssh2Client::invokeShell() {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  LIBSSH2_CHANNEL* channel = openPtyChannel();
  {
    BlockingScope blocking(connection->session);
    if (libssh2_channel_shell(channel) != 0) {
      string error = lastError();
      libssh2_channel_free(channel);
      throw std::runtime_error(error);
    }
  }
  return shared_ptr<RemoteChannel>(new Libssh2Channel(connection, channel));
}

void Libssh2Client::close() {
  {
    lock_guard<mutex> guard(stateMutex);
    connection->closed = true;
    if (connection->sockFd >= 0) {
      // Unblocks a handshake or auth running on another thread
      ::shutdown(connection->sockFd, SHUT_RDWR);
    }
    if (connecting) {
      // The connecting thread tears down once it notices
      return;
    }
  }
  teardown();
}

void Libssh2Client::teardown() {
  lock_guard<recursive_mutex> guard(connection->ioMutex);
  connection->closed = true;
  if (connection->session != NULL) {
    libssh2_session_set_blocking(connection->session, 0);
    libssh2_session_disconnect(connection->session, "Normal shutdown");
    libssh2_session_free(connection->session);
    connection->session = NULL;
  }
  lock_guard<mutex> stateGuard(stateMutex);
  if (connection->sockFd >= 0) {
    socketHandler->close(connection->sockFd);
    connection->sockFd = -1;
  }
}

string Libssh2Client::lastError() {
  if (connection->session == NULL) {
    return "no ssh session";
  }
  return sessionError(connection->session);
}
}  // namespace gm
