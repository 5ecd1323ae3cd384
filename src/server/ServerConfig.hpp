#ifndef __GM_SERVER_CONFIG_H__
#define __GM_SERVER_CONFIG_H__

#include "Headers.hpp"
#include "SessionManager.hpp"

namespace gm {
/**
 * @brief Settings for gdbmux-server. Defaults are filled in here, the INI
 * file is applied by loadIni and command line flags are applied last by the
 * caller.
 */
struct ServerConfig {
  int port = 5000;
  string bindIp = "127.0.0.1";
  // When set, listen on this unix socket instead of tcp
  string pipePath;

  string gdbPath = "gdb";
  // Full gdb command line, takes precedence over gdbPath
  string gdbCommand;
  string miVersion = "mi2";
  OrphanPolicy orphanPolicy = OrphanPolicy::RETAIN;

  bool sshEnabled = true;
  int sshTimeout = DEFAULT_REMOTE_TIMEOUT;

  string token;
  vector<string> allowPaths;

  int verbose = 0;
  bool silent = false;
  string logSize = "20971520";
  string logDir = GetTempDirectory();

  /** @throws std::runtime_error when the file is missing or malformed. */
  void loadIni(const string& path);

  string effectiveGdbCommand() const {
    return gdbCommand.empty() ? gdbPath : gdbCommand;
  }
};
}  // namespace gm

#endif  // __GM_SERVER_CONFIG_H__
