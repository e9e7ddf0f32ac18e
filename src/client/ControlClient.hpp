#ifndef __CMUX_CONTROL_CLIENT__
#define __CMUX_CONTROL_CLIENT__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "LineBuffer.hpp"
#include "SocketHandler.hpp"

namespace cmux {
/**
 * @brief Client side of the control protocol: one socket, requests answered
 * in order.
 */
class ControlClient {
 public:
  ControlClient(shared_ptr<SocketHandler> _socketHandler,
                const SocketEndpoint& _endpoint);
  ~ControlClient();

  /** @return false if the socket could not be reached. */
  bool connect();

  /**
   * @brief Sends hello and waits for the reply.
   * @return The reply, or nullopt if the server closed the connection.
   */
  optional<json> hello(int version = PROTOCOL_VERSION);

  /**
   * @brief Sends one command and waits for its response.
   * @return The response, or nullopt if the server closed the connection.
   */
  optional<json> request(const json& command);

  /** @brief Writes a raw line (a newline is appended). */
  void writeLine(const string& line);
  /** @brief Writes raw bytes, without framing. */
  void writeRaw(const string& data);

  /**
   * @brief Waits for the next response line.
   * @return The line, or nullopt once the server has closed the connection.
   * @throws std::runtime_error if nothing arrives within the timeout.
   */
  optional<string> readLine(int timeoutSeconds = 5);

  void close();
  bool isConnected() const { return socketFd >= 0; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  int socketFd;
  LineBuffer lineBuffer;
};
}  // namespace cmux

#endif  // __CMUX_CONTROL_CLIENT__
