#include <cxxopts.hpp>

#include "ControlClient.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"

using namespace cmux;

namespace {
// key=value, where a value that parses as JSON (numbers, booleans, null,
// arrays) keeps its type and anything else is a string
void addField(json* command, const string& argument) {
  auto equals = argument.find('=');
  if (equals == string::npos || equals == 0) {
    throw cxxopts::OptionParseException("Expected key=value, got '" +
                                        argument + "'");
  }
  string key = argument.substr(0, equals);
  string value = argument.substr(equals + 1);
  json parsed = json::parse(value, nullptr, false);
  if (parsed.is_discarded() || parsed.is_object()) {
    (*command)[key] = value;
  } else {
    (*command)[key] = parsed;
  }
}
}  // namespace

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  cmux::HandleTerminate();
  ::signal(SIGINT, cmux::InterruptSignalHandler);

  cxxopts::Options options("cmux", "Command line client for cmuxd");
  try {
    options.positional_help("<command> [key=value...]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "Path of the control socket",
         cxxopts::value<string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("command", "Command to send", cxxopts::value<string>())  //
        ("args", "Command fields", cxxopts::value<vector<string>>())  //
        ;
    options.parse_positional({"command", "args"});
    auto result = options.parse(argc, argv);

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "cmux version " << CMUX_VERSION << endl;
      exit(0);
    }
    if (result.count("help") || !result.count("command")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(result.count("help") ? 0 : 1);
    }

    // The client only logs to stderr, and only when asked to
    defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");
    defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput,
                            result["verbose"].as<int>() ? "true" : "false");
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Loggers::setVerboseLevel(result["verbose"].as<int>());

    string socketPath = result["socket"].as<string>();
    if (socketPath.empty()) {
      const char* envSocket = ::getenv("CMUX_SOCKET_PATH");
      if (envSocket) {
        socketPath = envSocket;
      }
    }
    if (socketPath.empty()) {
      CLOG(ERROR, "stdout")
          << "cmux: no socket given (use --socket or CMUX_SOCKET_PATH)"
          << endl;
      exit(2);
    }

    json command;
    command["type"] = result["command"].as<string>();
    if (result.count("args")) {
      for (const auto& argument : result["args"].as<vector<string>>()) {
        addField(&command, argument);
      }
    }

    SocketEndpoint endpoint;
    endpoint.set_name(socketPath);
    ControlClient client(
        shared_ptr<SocketHandler>(new PipeSocketHandler()), endpoint);
    if (!client.connect()) {
      CLOG(ERROR, "stdout") << "cmux: cannot connect to " << socketPath
                            << ": " << strerror(GetErrno()) << endl;
      exit(2);
    }
    auto welcome = client.hello();
    if (!welcome || !welcome->value("ok", false)) {
      CLOG(ERROR, "stdout") << "cmux: handshake failed"
                            << (welcome ? ": " + welcome->dump() : string())
                            << endl;
      exit(2);
    }
    auto response = client.request(command);
    if (!response) {
      CLOG(ERROR, "stdout") << "cmux: the server closed the connection"
                            << endl;
      exit(1);
    }
    CLOG(INFO, "stdout") << response->dump() << endl;
    exit(response->value("ok", false) ? 0 : 1);
  } catch (const cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const json::exception& je) {
    CLOG(ERROR, "stdout") << "cmux: malformed response: " << je.what() << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(ERROR, "stdout") << "cmux: " << re.what() << endl;
    exit(1);
  }
}
