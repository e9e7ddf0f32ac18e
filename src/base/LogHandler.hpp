#ifndef __CMUX_LOG_HANDLER__
#define __CMUX_LOG_HANDLER__

#include "Headers.hpp"

namespace cmux {
/**
 * @brief Where and how much a cmux binary logs.
 */
struct LogSettings {
  string directory;
  // Log files are named <prefix>-<timestamp>_<pid>.log
  string prefix;
  bool logToStdout = false;
  bool redirectStderr = false;
  int verbose = 0;
  // Disables every logger except "stdout"
  bool silent = false;
  string maxlogsize = "20971520";
};

/**
 * @brief Configures easylogging++ for the cmux binaries.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging from `argc/argv`.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies the settings to `defaultConf`, creates the log file,
   * reconfigures the default logger and installs size based rotation.
   * @return The path of the new log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const LogSettings &settings);

  /**
   * @brief Rotation callback: keeps the full log as `<name>.1`, replacing the
   * previous backup.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages. Used
   * for user facing output.
   */
  static void setupStdoutLogger();

  /** @brief Uninstalls the rotation callback before exit. */
  static void teardown();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new, private log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace cmux
#endif  // __CMUX_LOG_HANDLER__
