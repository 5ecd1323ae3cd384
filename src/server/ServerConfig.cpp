#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace gm {
namespace {
int parseIntValue(const char* section, const char* key, const char* value) {
  try {
    return stoi(value);
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for [") + section + "] " +
                             key + ": " + value);
  }
}
}  // namespace

void ServerConfig::loadIni(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  const char* portString = ini.GetValue("Networking", "port", NULL);
  if (portString) {
    port = parseIntValue("Networking", "port", portString);
  }
  const char* bindIpPtr = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIpPtr) {
    bindIp = string(bindIpPtr);
  }
  const char* pipe = ini.GetValue("Networking", "pipe", NULL);
  if (pipe) {
    pipePath = string(pipe);
  }

  const char* gdbPathPtr = ini.GetValue("Gdb", "gdb_path", NULL);
  if (gdbPathPtr) {
    gdbPath = string(gdbPathPtr);
  }
  const char* gdbCommandPtr = ini.GetValue("Gdb", "gdb_command", NULL);
  if (gdbCommandPtr) {
    gdbCommand = string(gdbCommandPtr);
  }
  const char* mi = ini.GetValue("Gdb", "mi_version", NULL);
  if (mi) {
    miVersion = string(mi);
  }
  const char* policy = ini.GetValue("Gdb", "orphan_policy", NULL);
  if (policy) {
    orphanPolicy = orphanPolicyFromString(policy);
  }

  sshEnabled = ini.GetBoolValue("Ssh", "enabled", sshEnabled);
  const char* timeout = ini.GetValue("Ssh", "timeout", NULL);
  if (timeout) {
    sshTimeout = parseIntValue("Ssh", "timeout", timeout);
  }

  const char* tokenPtr = ini.GetValue("Auth", "token", NULL);
  if (tokenPtr) {
    token = string(tokenPtr);
  }
  const char* paths = ini.GetValue("Auth", "allow_paths", NULL);
  if (paths) {
    allowPaths.clear();
    for (auto& p : split(paths, ',')) {
      string trimmed = trim(p);
      if (!trimmed.empty()) {
        allowPaths.push_back(trimmed);
      }
    }
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = atoi(vlevel);
  }
  const char* silentPtr = ini.GetValue("Debug", "silent", NULL);
  if (silentPtr && atoi(silentPtr) != 0) {
    silent = true;
  }
  // make sure logSize is a string of int value
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    logSize = string(logsize);
  }
  const char* logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir) {
    logDir = string(logdir);
  }
}
}  // namespace gm
