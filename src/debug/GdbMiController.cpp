#include "GdbMiController.hpp"

#include "TerminalSanitizer.hpp"

namespace gm {
GdbMiController::GdbMiController(shared_ptr<Pty> _miPty, pid_t _pid)
    : miPty(_miPty), pid(_pid), exited(false) {}

void GdbMiController::checkProcess() {
  if (exited) {
    throw std::runtime_error("gdb process " + to_string(pid) +
                             " is no longer running");
  }
  int status;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == pid || (rc < 0 && GetErrno() == ECHILD)) {
    exited = true;
    LOG(INFO) << "gdb process " << pid << " exited";
    throw std::runtime_error("gdb process " + to_string(pid) +
                             " is no longer running");
  }
}

optional<json> GdbMiController::pollResponse() {
  lock_guard<recursive_mutex> guard(controllerMutex);
  checkProcess();
  auto raw = miPty->read();
  if (!raw) {
    return nullopt;
  }
  partialLine += *raw;

  json records = json::array();
  size_t start = 0;
  while (true) {
    size_t end = partialLine.find('\n', start);
    if (end == string::npos) {
      break;
    }
    string line = dropInvalidUtf8(partialLine.substr(start, end - start));
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto record = parseRecord(line);
    if (record) {
      records.push_back(*record);
    }
    start = end + 1;
  }
  partialLine.erase(0, start);

  if (records.empty()) {
    return nullopt;
  }
  return records;
}

void GdbMiController::write(const string& command) {
  lock_guard<recursive_mutex> guard(controllerMutex);
  checkProcess();
  string line = command;
  if (line.empty() || line.back() != '\n') {
    line += "\n";
  }
  miPty->write(line);
}

void GdbMiController::terminate() {
  lock_guard<recursive_mutex> guard(controllerMutex);
  if (!exited) {
    exited = true;
    if (::kill(pid, SIGKILL) == 0) {
      int status;
      while (waitpid(pid, &status, 0) < 0 && GetErrno() == EINTR) {
      }
    }
    LOG(INFO) << "Terminated gdb process " << pid;
  }
  miPty->close();
}

optional<json> GdbMiController::parseRecord(const string& rawLine) {
  string line = trim(rawLine);
  if (line.empty() || line == "(gdb)") {
    return nullopt;
  }

  json record = {{"type", "output"},
                 {"message", nullptr},
                 {"payload", line},
                 {"token", nullptr},
                 {"stream", "stdout"}};

  size_t pos = 0;
  while (pos < line.length() && isdigit((unsigned char)line[pos])) {
    pos++;
  }
  if (pos == line.length()) {
    return record;
  }
  char marker = line[pos];

  switch (marker) {
    case '~':
    case '@':
    case '&': {
      if (pos != 0) {
        return record;
      }
      record["type"] =
          marker == '~' ? "console" : (marker == '@' ? "target" : "log");
      record["payload"] = dropInvalidUtf8(unescapeCString(line.substr(1)));
      return record;
    }
    case '^':
    case '*':
    case '=': {
      record["type"] = marker == '^' ? "result" : "notify";
      if (pos > 0) {
        try {
          record["token"] = stoll(line.substr(0, pos));
        } catch (const std::out_of_range&) {
          // gdb echoes whatever digits the client sent
          VLOG(1) << "MI token out of range: " << line.substr(0, pos);
        }
      }
      string rest = line.substr(pos + 1);
      size_t comma = rest.find(',');
      if (comma == string::npos) {
        record["message"] = rest;
        record["payload"] = nullptr;
      } else {
        record["message"] = rest.substr(0, comma);
        record["payload"] = rest.substr(comma + 1);
      }
      return record;
    }
    default:
      return record;
  }
}

string GdbMiController::unescapeCString(const string& quoted) {
  if (quoted.length() < 2 || quoted.front() != '"' || quoted.back() != '"') {
    return quoted;
  }
  string s;
  for (size_t i = 1; i + 1 < quoted.length(); i++) {
    char c = quoted[i];
    if (c != '\\' || i + 2 >= quoted.length()) {
      s.push_back(c);
      continue;
    }
    char next = quoted[++i];
    switch (next) {
      case 'n':
        s.push_back('\n');
        break;
      case 't':
        s.push_back('\t');
        break;
      case 'r':
        s.push_back('\r');
        break;
      case 'e':
        s.push_back('\x1b');
        break;
      case '"':
        s.push_back('"');
        break;
      case '\\':
        s.push_back('\\');
        break;
      default:
        if (next >= '0' && next <= '7') {
          // Octal escape, up to three digits
          int value = next - '0';
          for (int a = 0; a < 2 && i + 2 < quoted.length() &&
                          quoted[i + 1] >= '0' && quoted[i + 1] <= '7';
               a++) {
            value = value * 8 + (quoted[++i] - '0');
          }
          s.push_back(char(value));
        } else {
          s.push_back('\\');
          s.push_back(next);
        }
        break;
    }
  }
  return s;
}
}  // namespace gm
