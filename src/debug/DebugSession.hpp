#ifndef __GM_DEBUG_SESSION_H__
#define __GM_DEBUG_SESSION_H__

#include "ProcessIoController.hpp"
#include "Pty.hpp"

namespace gm {
enum class PtyKind { USER, PROGRAM };

/**
 * @brief One gdb process with its MI controller and two ptys: the user pty
 * gdb itself runs on, and the pty handed to the debugged program.
 *
 * Handles are shared by every subscribed client. Mutation goes through
 * SessionManager.
 */
class DebugSession {
 public:
  DebugSession(shared_ptr<ProcessIoController> _controller,
               shared_ptr<Pty> _userPty, shared_ptr<Pty> _programPty,
               pid_t _pid, const string& _command);
  virtual ~DebugSession() {}

  virtual optional<json> pollResponse();
  virtual optional<string> readPty(PtyKind kind);
  virtual void writePty(PtyKind kind, const string& data);
  virtual void setWinsize(PtyKind kind, int rows, int cols);
  virtual void writeMi(const string& command);
  /** @brief Descriptors the relay loop waits on. */
  virtual vector<int> pollFds();
  virtual void terminate();

  pid_t getPid() const { return pid; }
  const string& getCommand() const { return command; }
  const string& getStartTime() const { return startTime; }

 protected:
  shared_ptr<Pty> ptyFor(PtyKind kind);

  shared_ptr<ProcessIoController> controller;
  shared_ptr<Pty> userPty;
  shared_ptr<Pty> programPty;
  pid_t pid;
  string command;
  string startTime;
};

class DebugSessionFactory {
 public:
  virtual ~DebugSessionFactory() {}

  /** @throws std::runtime_error when the process cannot be started. */
  virtual shared_ptr<DebugSession> create(const string& gdbCommand,
                                          const string& miVersion) = 0;
};

/**
 * @brief Starts gdb on a fresh pty with an extra MI ui and a separate
 * inferior tty.
 */
class GdbDebugSessionFactory : public DebugSessionFactory {
 public:
  virtual shared_ptr<DebugSession> create(const string& gdbCommand,
                                          const string& miVersion);

  /** @brief The shell command line used to launch gdb. */
  static string buildLaunchCommand(const string& gdbCommand,
                                   const string& miVersion,
                                   const string& miPtyName,
                                   const string& programPtyName);
};
}  // namespace gm

#endif  // __GM_DEBUG_SESSION_H__
