#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace cmux {
namespace {
bool parseFlag(const string& key, const char* value) {
  string lower = toLower(trim(value));
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw ConfigurationError("Invalid value for " + key + ": '" + value + "'");
}
}  // namespace

AccessMode parseAccessMode(const string& name) {
  string lower = toLower(trim(name));
  if (lower == "full" || lower == "allowall") {
    return AccessMode::Full;
  }
  if (lower == "notifications") {
    return AccessMode::Notifications;
  }
  throw ConfigurationError("Invalid access mode '" + name +
                           "' (expected full or notifications)");
}

string accessModeName(AccessMode mode) {
  return mode == AccessMode::Full ? "full" : "notifications";
}

void ServerConfig::loadIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw ConfigurationError("Invalid config file: " + filename);
  }

  const char* socketValue = ini.GetValue("Server", "socket", NULL);
  if (socketValue) {
    socketPath = trim(socketValue);
  }
  const char* accessValue = ini.GetValue("Server", "access_mode", NULL);
  if (accessValue) {
    accessMode = parseAccessMode(accessValue);
  }
  const char* engineValue = ini.GetValue("Server", "engine", NULL);
  if (engineValue) {
    engine = trim(engineValue);
  }
  const char* shellValue = ini.GetValue("Server", "shell", NULL);
  if (shellValue) {
    shell = trim(shellValue);
  }
  const char* debugValue = ini.GetValue("Server", "debug_commands", NULL);
  if (debugValue) {
    debugCommands = parseFlag("debug_commands", debugValue);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = atoi(vlevel);
  }
  // read silent setting
  const char* silentValue = ini.GetValue("Debug", "silent", NULL);
  if (silentValue && atoi(silentValue) != 0) {
    silent = true;
  }
  // read log file size limit
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxlogsize is a string of int value
    maxlogsize = to_string(atoi(logsize));
  }
}

void ServerConfig::applyEnvironment() {
  const char* envSocket = ::getenv("CMUX_SOCKET_PATH");
  if (envSocket && string(envSocket).length()) {
    socketPath = envSocket;
  }
}

void ServerConfig::validate() const {
  if (socketPath.empty()) {
    throw ConfigurationError(
        "No control socket configured: you must enable the control socket "
        "with --socket, CMUX_SOCKET_PATH or the [Server] socket setting");
  }
}
}  // namespace cmux
