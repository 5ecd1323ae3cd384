#include "DebugSession.hpp"

#include "GdbMiController.hpp"
#include "TerminalSanitizer.hpp"

namespace gm {
namespace {
string currentTimestamp() {
  time_t now = time(NULL);
  tm localNow;
  localtime_r(&now, &localNow);
  char buf[64];
  strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &localNow);
  return string(buf);
}

string shellQuote(const string& s) {
  string quoted = "'";
  for (char c : s) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "'";
  return quoted;
}
}  // namespace

DebugSession::DebugSession(shared_ptr<ProcessIoController> _controller,
                           shared_ptr<Pty> _userPty,
                           shared_ptr<Pty> _programPty, pid_t _pid,
                           const string& _command)
    : controller(_controller),
      userPty(_userPty),
      programPty(_programPty),
      pid(_pid),
      command(_command),
      startTime(currentTimestamp()) {}

shared_ptr<Pty> DebugSession::ptyFor(PtyKind kind) {
  return kind == PtyKind::USER ? userPty : programPty;
}

optional<json> DebugSession::pollResponse() {
  return controller->pollResponse();
}

optional<string> DebugSession::readPty(PtyKind kind) {
  auto raw = ptyFor(kind)->read();
  if (!raw) {
    return nullopt;
  }
  return dropInvalidUtf8(*raw);
}

void DebugSession::writePty(PtyKind kind, const string& data) {
  ptyFor(kind)->write(data);
}

void DebugSession::setWinsize(PtyKind kind, int rows, int cols) {
  ptyFor(kind)->setWinsize(rows, cols);
}

void DebugSession::writeMi(const string& miCommand) {
  controller->write(miCommand);
}

vector<int> DebugSession::pollFds() {
  return {controller->getFd(), userPty->getFd(), programPty->getFd()};
}

void DebugSession::terminate() {
  controller->terminate();
  userPty->close();
  programPty->close();
}

string GdbDebugSessionFactory::buildLaunchCommand(
    const string& gdbCommand, const string& miVersion,
    const string& miPtyName, const string& programPtyName) {
  vector<string> startupCommands = {
      "new-ui " + miVersion + " " + miPtyName,
      "set inferior-tty " + programPtyName,
      "set pagination off",
  };
  string launch = "exec " + gdbCommand;
  for (const string& startupCommand : startupCommands) {
    launch += " " + shellQuote("-iex=" + startupCommand);
  }
  return launch;
}

shared_ptr<DebugSession> GdbDebugSessionFactory::create(
    const string& gdbCommand, const string& miVersion) {
  if (trim(gdbCommand).empty()) {
    throw std::runtime_error("No gdb command given");
  }
  if (miVersion.find_first_not_of(
          "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789") !=
      string::npos) {
    throw std::runtime_error("Invalid mi version: " + miVersion);
  }
  auto programPty = Pty::open(true);
  auto miPty = Pty::open(false);
  string launch = buildLaunchCommand(gdbCommand, miVersion, miPty->getName(),
                                     programPty->getName());
  LOG(INFO) << "Launching gdb: " << launch;

  int masterFd;
  pid_t pid = forkpty(&masterFd, NULL, NULL, NULL);
  if (pid < 0) {
    throw std::runtime_error(string("forkpty failed: ") +
                             strerror(GetErrno()));
  }
  if (pid == 0) {
    // Child: restore default SIGCHLD so gdb can wait on its inferiors
    signal(SIGCHLD, SIG_DFL);
    setenv("GDBMUX_VERSION", GM_VERSION, 1);
    execl("/bin/sh", "sh", "-c", launch.c_str(), (char*)NULL);
    _exit(127);
  }

  VLOG(1) << "gdb started with pid " << pid << " on pty fd " << masterFd;
  auto userPty = make_shared<Pty>(masterFd, -1, "");
  auto controller = make_shared<GdbMiController>(miPty, pid);
  return make_shared<DebugSession>(controller, userPty, programPty, pid,
                                   gdbCommand);
}
}  // namespace gm
