#ifndef __GM_GDB_MI_CONTROLLER_H__
#define __GM_GDB_MI_CONTROLLER_H__

#include "ProcessIoController.hpp"
#include "Pty.hpp"

namespace gm {
/**
 * @brief Talks GDB/MI over the pty that gdb attached with `new-ui`.
 *
 * Output lines are split into records of the form
 * `{type, message, payload, token, stream}`. Result and async records keep
 * their payload as the raw MI text after the first comma; stream records
 * carry the decoded C string.
 */
class GdbMiController : public ProcessIoController {
 public:
  GdbMiController(shared_ptr<Pty> _miPty, pid_t _pid);
  virtual ~GdbMiController() { terminate(); }

  virtual optional<json> pollResponse();
  virtual void write(const string& command);
  virtual int getFd() { return miPty->getFd(); }
  virtual pid_t getPid() { return pid; }
  virtual void terminate();

  /** @brief Parses one complete MI output line. */
  static optional<json> parseRecord(const string& line);
  /** @brief Decodes a quoted MI C string such as `"a\nb"`. */
  static string unescapeCString(const string& quoted);

 protected:
  void checkProcess();

  shared_ptr<Pty> miPty;
  pid_t pid;
  bool exited;
  string partialLine;
  recursive_mutex controllerMutex;
};
}  // namespace gm

#endif  // __GM_GDB_MI_CONTROLLER_H__
