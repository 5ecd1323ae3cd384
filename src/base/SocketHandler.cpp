#include "SocketHandler.hpp"

namespace gm {
namespace {
// A transfer stalls once no byte moved for this many seconds
const int STALL_SECONDS = 10;

class StallClock {
 public:
  explicit StallClock(bool _enabled)
      : enabled(_enabled), lastProgress(time(NULL)) {}

  void progressed() { lastProgress = time(NULL); }

  void throwIfStalled(const char* direction) const {
    if (enabled && time(NULL) > lastProgress + STALL_SECONDS) {
      throw std::runtime_error(string("Socket stalled during ") + direction);
    }
  }

 private:
  bool enabled;
  time_t lastProgress;
};

inline bool wouldBlock(int e) { return e == EAGAIN || e == EWOULDBLOCK; }
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  char* out = (char*)buf;
  StallClock clock(timeout);
  size_t done = 0;
  while (done < count) {
    if (!waitOnSocketData(fd)) {
      clock.throwIfStalled("read");
      continue;
    }
    ssize_t n = read(fd, out + done, count - done);
    if (n > 0) {
      done += n;
      clock.progressed();
      continue;
    }
    if (n == 0) {
      VLOG(1) << "Peer closed fd " << fd << " mid-read";
      throw std::runtime_error("Connection closed by peer");
    }
    int readErrno = errno;
    if (!wouldBlock(readErrno)) {
      VLOG(1) << "read on fd " << fd << " failed: " << strerror(readErrno);
      throw std::runtime_error("Failed a call to readAll");
    }
    clock.throwIfStalled("read");
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  const char* in = (const char*)buf;
  StallClock clock(timeout);
  size_t done = 0;
  while (done < count) {
    clock.throwIfStalled("write");
    ssize_t n = write(fd, in + done, count - done);
    if (n > 0) {
      done += n;
      clock.progressed();
      continue;
    }
    if (n == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    }
    int writeErrno = errno;
    if (!wouldBlock(writeErrno)) {
      LOG(WARNING) << "write on fd " << fd
                   << " failed: " << strerror(writeErrno);
      throw std::runtime_error("Failed a call to writeAll");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}
}  // namespace gm
