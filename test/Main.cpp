#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      cmux::LogHandler::setupLogHandler(&argc, &argv);
  cmux::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  cmux::HandleTerminate();

  string logDirectory = makeTempDirectory("cmux_test");
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  LogSettings settings;
  settings.directory = logDirectory;
  settings.prefix = "log";
  settings.logToStdout = false;
  settings.redirectStderr = true;
  cmux::LogHandler::setupLogFiles(&defaultConf, settings);

  int result = Catch::Session().run(argc, argv);

  cmux::LogHandler::teardown();
  FATAL_FAIL(fs::remove_all(logDirectory.c_str()));
  return result;
}
