#ifndef __GM_UNIX_SOCKET_HANDLER__
#define __GM_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace gm {
/**
 * @brief POSIX socket implementation shared by the TCP and pipe handlers.
 * Every tracked fd owns a mutex so reads and writes on one socket are serial.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /** @brief select() on a single fd for up to sec/usec. */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Retries on EAGAIN for about five seconds before giving up. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void close(int fd);

 protected:
  static const int WRITE_RETRY_SECONDS = 5;

  void addToActiveSockets(int fd);
  /** @returns null once the fd is closed. */
  shared_ptr<recursive_mutex> socketMutex(int fd);
  /** @brief Non-blocking mode and SIGPIPE suppression. */
  virtual void initSocket(int fd);
  /** @brief initSocket plus SO_REUSEADDR for listeners. */
  virtual void initServerSocket(int fd);
  void setBlocking(int sockFd, bool blocking);
  /**
   * @brief Waits for a non-blocking connect() in progress.
   * @returns 0 on success, otherwise the errno that ended the attempt.
   */
  int finishConnect(int fd, int timeoutSeconds);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace gm

#endif  // __GM_UNIX_SOCKET_HANDLER__
