#ifndef __CMUX_CONTROL_CONNECTION__
#define __CMUX_CONTROL_CONNECTION__

#include "CommandDispatcher.hpp"
#include "Headers.hpp"
#include "LineBuffer.hpp"
#include "SocketHandler.hpp"

namespace cmux {
/**
 * @brief One client of the control socket.
 *
 * The server speaks only after the client's hello. Every inbound line is one
 * JSON object; every accepted line gets exactly one response line, in order.
 * A line that cannot be trusted (bad JSON, not an object, a missing or
 * ill-typed field, a first message that is not a hello) closes the connection
 * without a response.
 */
class ControlConnection {
 public:
  enum class State { Connected, Handshaking, Ready, Closed };

  ControlConnection(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
                    shared_ptr<CommandDispatcher> _dispatcher);

  /**
   * @brief Processes one complete line.
   * @return The response line, if one should be sent.
   */
  optional<string> handleLine(const string &line);

  /**
   * @brief Serves the socket until the client leaves, a framing error
   * occurs or `halt` becomes true. Closes the socket before returning.
   */
  void run(const atomic<bool> *halt);

  State getState() const { return state; }
  int getSocketFd() const { return socketFd; }

 protected:
  optional<string> handleHello(const json &message);

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  shared_ptr<CommandDispatcher> dispatcher;
  LineBuffer lineBuffer;
  atomic<State> state;
};

string connectionStateName(ControlConnection::State state);
}  // namespace cmux

#endif  // __CMUX_CONTROL_CONNECTION__
