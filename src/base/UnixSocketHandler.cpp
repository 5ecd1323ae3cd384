#include "UnixSocketHandler.hpp"

namespace gm {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n <= 0) {
    VLOG(4) << "socket select timeout";
    return false;
  }
  if (!FD_ISSET(fd, &input)) {
    STFATAL << "FD_ISSET is false but we should have data by now.";
  }
  VLOG(4) << "socket " << fd << " has data";
  return true;
}

bool UnixSocketHandler::hasData(int fd) { return waitForData(fd, 0, 0); }

shared_ptr<recursive_mutex> UnixSocketHandler::socketMutex(int fd) {
  if (fd <= 0) {
    STFATAL << "Invalid socket: " << fd;
  }
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  auto m = socketMutex(fd);
  if (m.get() == NULL) {
    VLOG(1) << "Read from closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*m);
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading socket " << fd << ": "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  auto m = socketMutex(fd);
  if (m.get() == NULL) {
    VLOG(1) << "Write to closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
  const char *data = (const char *)buf;
  time_t giveUpAt = time(NULL) + WRITE_RETRY_SECONDS;
  size_t sent = 0;
  while (sent < count) {
    ssize_t w;
    {
      lock_guard<recursive_mutex> guard(*m);
#ifdef MSG_NOSIGNAL
      w = ::send(fd, data + sent, count - sent, MSG_NOSIGNAL);
#else
      w = ::write(fd, data + sent, count - sent);
#endif
    }
    if (w >= 0) {
      sent += w;
      continue;
    }
    if ((errno != EAGAIN && errno != EWOULDBLOCK) || time(NULL) > giveUpAt) {
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

int UnixSocketHandler::accept(int sockFd) {
  sockaddr_storage client;
  socklen_t c = sizeof(client);
  int clientSock = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = errno;
  if (clientSock >= 0) {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    addToActiveSockets(clientSock);
    initSocket(clientSock);
    VLOG(3) << "Socket " << sockFd << " accepted client " << clientSock;
    return clientSock;
  }
  if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
    LOG(WARNING) << "accept() failed: " << strerror(acceptErrno);
  }
  errno = acceptErrno;
  return -1;
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

int UnixSocketHandler::finishConnect(int fd, int timeoutSeconds) {
  fd_set writable;
  FD_ZERO(&writable);
  FD_SET(fd, &writable);
  timeval tv;
  tv.tv_sec = timeoutSeconds;
  tv.tv_usec = 0;
  int rc = select(fd + 1, NULL, &writable, NULL, &tv);
  if (rc <= 0 || !FD_ISSET(fd, &writable)) {
    return ETIMEDOUT;
  }
  int soError = 0;
  socklen_t len = sizeof(soError);
  FATAL_FAIL(::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len));
  return soError;
}

void UnixSocketHandler::initSocket(int fd) {
#ifndef MSG_NOSIGNAL
  {
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  setBlocking(fd, false);
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  int flag = 1;
  FATAL_FAIL(
      setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
}

void UnixSocketHandler::setBlocking(int sockFd, bool blocking) {
  int opts = fcntl(sockFd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  if (blocking) {
    opts &= (~O_NONBLOCK);
  } else {
    opts |= O_NONBLOCK;
  }
  FATAL_FAIL_UNLESS_EINVAL(fcntl(sockFd, F_SETFL, opts));
}
}  // namespace gm
