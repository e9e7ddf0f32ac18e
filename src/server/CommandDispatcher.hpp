#ifndef __CMUX_COMMAND_DISPATCHER__
#define __CMUX_COMMAND_DISPATCHER__

#include "Headers.hpp"
#include "InputInjector.hpp"
#include "JsonLib.hpp"
#include "ServerConfig.hpp"
#include "Session.hpp"

namespace cmux {
/**
 * @brief Maps control protocol commands onto the session.
 *
 * A request is a JSON object whose `type` names the command. The response to
 * a successful command is an object with `type` set to the command name and
 * `ok` set to true, plus the command's result fields. A failed command yields
 * `{"type":"error","ok":false,"kind":...,"message":...,"command":...}`.
 *
 * Missing or ill-typed required fields throw ProtocolError, which the caller
 * must treat as a framing failure.
 */
class CommandDispatcher {
 public:
  typedef function<json(const json &)> Handler;

  CommandDispatcher(shared_ptr<Session> _session, AccessMode _accessMode,
                    bool _debugCommands);

  /**
   * @brief Runs one command.
   * @throws ProtocolError if the request is not a well formed command.
   */
  json dispatch(const json &request);

  /** @brief The handshake reply. */
  json welcome() const;

  /** @brief Whether the command exists and is usable with this setup. */
  bool isAllowed(const string &command) const;

  /** @brief Names of the commands usable with this setup, sorted. */
  vector<string> availableCommands() const;

  static json errorResponse(ErrorKind kind, const string &message,
                            const string &command);

 protected:
  struct Command {
    Handler handler;
    bool debugOnly;
  };

  void add(const string &name, bool debugOnly, Handler handler);
  void registerWorkspaceCommands();
  void registerSurfaceCommands();
  void registerNotificationCommands();
  void registerDebugCommands();
  void registerInputCommands();

  shared_ptr<Session> session;
  InputInjector injector;
  AccessMode accessMode;
  bool debugCommands;
  map<string, Command> commands;
};
}  // namespace cmux

#endif  // __CMUX_COMMAND_DISPATCHER__
