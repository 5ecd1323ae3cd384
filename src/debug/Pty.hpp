#ifndef __GM_PTY_H__
#define __GM_PTY_H__

#include "Headers.hpp"

namespace gm {
/**
 * @brief Master side of a pseudo-terminal.
 *
 * A pty made by `open()` also keeps its slave end open so the master never
 * reports EIO while nobody else holds the slave.
 */
class Pty {
 public:
  /** @brief Adopts a master fd, e.g. the one returned by forkpty. */
  Pty(int _masterFd, int _slaveFd, const string& _name);
  virtual ~Pty();

  /** @brief Allocates a fresh master/slave pair. */
  static shared_ptr<Pty> open(bool echo);

  /**
   * @brief Non-blocking read of whatever is pending.
   * @returns nullopt when nothing is available.
   * @throws std::runtime_error when the pty is broken (e.g. EIO after the
   * child exits).
   */
  optional<string> read();
  void write(const string& data);
  void setWinsize(int rows, int cols);

  int getFd() { return masterFd; }
  /** @brief Path of the slave device; empty for adopted masters. */
  const string& getName() { return name; }

  void close();

 protected:
  int masterFd;
  int slaveFd;
  string name;
  recursive_mutex ptyMutex;
};
}  // namespace gm

#endif  // __GM_PTY_H__
