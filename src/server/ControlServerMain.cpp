#include <cxxopts.hpp>

#include "CommandDispatcher.hpp"
#include "ControlServer.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "ServerConfig.hpp"
#include "Session.hpp"
#include "TerminalEngine.hpp"

using namespace cmux;

namespace {
ControlServer *activeServer = NULL;

void ShutdownSignalHandler(int signum) {
  if (activeServer) {
    activeServer->shutdown();
  }
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  cmux::HandleTerminate();

  cxxopts::Options options("cmuxd",
                           "Terminal session daemon with a control socket");
  ServerConfig config;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "Path of the control socket",
         cxxopts::value<string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<string>()->default_value(""))  //
        ("engine", "Terminal engine: headless, pty or none",
         cxxopts::value<string>())  //
        ("shell", "Shell started by the pty engine",
         cxxopts::value<string>())  //
        ("access-mode", "Control socket access: full or notifications",
         cxxopts::value<string>())                                   //
        ("debug", "Enable test and diagnostic commands")             //
        ("logtostdout", "log to stdout")                             //
        ("logdir", "Directory for log files",                        //
         cxxopts::value<string>()->default_value(GetTempDirectory()))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "cmuxd version " << CMUX_VERSION << endl;
      exit(0);
    }

    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      config.loadIniFile(cfgfilename);
    }
    config.applyEnvironment();

    // Command line options take precedence over the config file
    if (result.count("socket")) {
      config.socketPath = result["socket"].as<string>();
    }
    if (result.count("engine")) {
      config.engine = result["engine"].as<string>();
    }
    if (result.count("shell")) {
      config.shell = result["shell"].as<string>();
    }
    if (result.count("access-mode")) {
      config.accessMode = parseAccessMode(result["access-mode"].as<string>());
    }
    if (result.count("debug")) {
      config.debugCommands = true;
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }
    config.validate();

    LogSettings logSettings;
    logSettings.directory = result["logdir"].as<string>();
    logSettings.prefix = "cmuxd";
    logSettings.logToStdout = config.logToStdout;
    logSettings.redirectStderr = true;
    logSettings.verbose = config.verbose;
    logSettings.silent = config.silent;
    logSettings.maxlogsize = config.maxlogsize;
    LogHandler::setupLogFiles(&defaultConf, logSettings);
  } catch (const cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const ConfigurationError &ce) {
    CLOG(ERROR, "stdout") << "cmuxd: " << ce.what() << endl;
    exit(1);
  }

  // set thread name
  el::Helpers::setThreadName("cmuxd-main");
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  shared_ptr<TerminalEngine> engine;
  try {
    engine = createTerminalEngine(config.engine, config.shell);
  } catch (const ConfigurationError &ce) {
    CLOG(ERROR, "stdout") << "cmuxd: " << ce.what() << endl;
    LogHandler::teardown();
    exit(1);
  }
  LOG(INFO) << "Starting cmuxd " << CMUX_VERSION << " (engine "
            << (engine.get() ? engine->getName() : string("none"))
            << ", access " << accessModeName(config.accessMode)
            << (config.debugCommands ? ", debug commands" : "") << ")";

  shared_ptr<Session> session(new Session(engine));
  shared_ptr<CommandDispatcher> dispatcher(
      new CommandDispatcher(session, config.accessMode, config.debugCommands));
  shared_ptr<SocketHandler> pipeSocketHandler(new PipeSocketHandler());
  SocketEndpoint endpoint;
  endpoint.set_name(config.socketPath);

  int exitCode = 0;
  {
    ControlServer server(pipeSocketHandler, endpoint, dispatcher);
    try {
      server.listen();
    } catch (const std::runtime_error &re) {
      CLOG(ERROR, "stdout") << "cmuxd: " << re.what() << endl;
      LOG(ERROR) << "Could not listen on " << endpoint << ": " << re.what();
      exitCode = 1;
    }
    if (exitCode == 0) {
      activeServer = &server;
      ::signal(SIGINT, ShutdownSignalHandler);
      ::signal(SIGTERM, ShutdownSignalHandler);
      ::signal(SIGPIPE, SIG_IGN);
      server.run();
      activeServer = NULL;
    }
  }

  session->shutdown();
  LOG(INFO) << "cmuxd exiting with status " << exitCode;
  // Uninstall log rotation callback
  LogHandler::teardown();
  return exitCode;
}
