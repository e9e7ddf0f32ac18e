#ifndef __CMUX_SERVER_CONFIG__
#define __CMUX_SERVER_CONFIG__

#include "Headers.hpp"
#include "SessionError.hpp"

namespace cmux {
enum class AccessMode {
  // Every command
  Full,
  // Only the notification commands plus ping and help
  Notifications,
};

/** @throws ConfigurationError for anything but "full" or "notifications". */
AccessMode parseAccessMode(const string& name);
string accessModeName(AccessMode mode);

/**
 * @brief Settings of the cmuxd daemon.
 *
 * Values come from, in increasing precedence: built-in defaults, the config
 * file, the CMUX_SOCKET_PATH environment variable (socket only) and the
 * command line.
 */
struct ServerConfig {
  string socketPath;
  AccessMode accessMode = AccessMode::Full;
  string engine = "headless";
  // Shell for the pty engine; empty means $SHELL or /bin/sh
  string shell;
  bool debugCommands = false;
  int verbose = 0;
  bool silent = false;
  bool logToStdout = false;
  string maxlogsize = "20971520";

  /**
   * @brief Reads the [Server] and [Debug] sections of an ini file.
   * @throws ConfigurationError if the file cannot be loaded or holds an
   * invalid value.
   */
  void loadIniFile(const string& filename);

  /** @brief Applies CMUX_SOCKET_PATH if it is set and non-empty. */
  void applyEnvironment();

  /**
   * @brief Checks the settings that must hold before anything is bound.
   * @throws ConfigurationError when no control socket is configured.
   */
  void validate() const;
};
}  // namespace cmux

#endif  // __CMUX_SERVER_CONFIG__
