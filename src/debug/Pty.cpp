#include "Pty.hpp"

namespace gm {
#define PTY_READ_SIZE (20 * 1024)

Pty::Pty(int _masterFd, int _slaveFd, const string& _name)
    : masterFd(_masterFd), slaveFd(_slaveFd), name(_name) {}

Pty::~Pty() { close(); }

shared_ptr<Pty> Pty::open(bool echo) {
  int master, slave;
  char slaveName[1024];
  if (openpty(&master, &slave, slaveName, NULL, NULL) == -1) {
    // Usually fd or pty exhaustion; the caller reports it to the client
    throw std::runtime_error(string("Could not open a pty: ") +
                             strerror(errno));
  }
  auto pty = shared_ptr<Pty>(new Pty(master, slave, string(slaveName)));
  if (!echo) {
    termios attributes;
    if (tcgetattr(slave, &attributes) == -1) {
      throw std::runtime_error(string("Could not read pty attributes: ") +
                               strerror(errno));
    }
    attributes.c_lflag &= ~(ECHO);
    if (tcsetattr(slave, TCSANOW, &attributes) == -1) {
      throw std::runtime_error(string("Could not disable pty echo: ") +
                               strerror(errno));
    }
  }
  VLOG(1) << "Opened pty " << slaveName << " master fd " << master;
  return pty;
}

optional<string> Pty::read() {
  lock_guard<recursive_mutex> guard(ptyMutex);
  if (masterFd < 0) {
    throw std::runtime_error("Tried to read from a closed pty");
  }
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(masterFd, &rfd);
  timeval tv;
  tv.tv_sec = 0;
  tv.tv_usec = 0;
  int rc = select(masterFd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return nullopt;
    }
    throw std::runtime_error(string("select on pty failed: ") +
                             strerror(GetErrno()));
  }
  if (rc == 0 || !FD_ISSET(masterFd, &rfd)) {
    return nullopt;
  }
  string buf(PTY_READ_SIZE, '\0');
  ssize_t bytesRead = ::read(masterFd, &buf[0], PTY_READ_SIZE);
  if (bytesRead < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return nullopt;
    }
    throw std::runtime_error(string("Error reading pty: ") +
                             strerror(localErrno));
  }
  if (bytesRead == 0) {
    throw std::runtime_error("Pty closed");
  }
  buf.resize(bytesRead);
  return buf;
}

void Pty::write(const string& data) {
  lock_guard<recursive_mutex> guard(ptyMutex);
  if (masterFd < 0) {
    throw std::runtime_error("Tried to write to a closed pty");
  }
  size_t pos = 0;
  while (pos < data.length()) {
    ssize_t w = ::write(masterFd, data.c_str() + pos, data.length() - pos);
    if (w < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EINTR) {
        this_thread::sleep_for(chrono::milliseconds(1));
        continue;
      }
      throw std::runtime_error(string("Error writing pty: ") +
                               strerror(localErrno));
    }
    pos += w;
  }
}

void Pty::setWinsize(int rows, int cols) {
  lock_guard<recursive_mutex> guard(ptyMutex);
  if (rows <= 0 || cols <= 0 || rows > 0xffff || cols > 0xffff) {
    throw std::runtime_error("Invalid window size");
  }
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) < 0) {
    throw std::runtime_error(string("Could not resize pty: ") +
                             strerror(GetErrno()));
  }
}

void Pty::close() {
  lock_guard<recursive_mutex> guard(ptyMutex);
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
  if (slaveFd >= 0) {
    ::close(slaveFd);
    slaveFd = -1;
  }
}
}  // namespace gm
