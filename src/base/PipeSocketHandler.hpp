#ifndef __CMUX_PIPE_SOCKET_HANDLER__
#define __CMUX_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace cmux {
/**
 * @brief Unix-domain stream sockets addressed by a filesystem path (the
 * endpoint name).
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket at the endpoint path.
   * @return The connected fd, or -1 with errno set.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint path. A stale socket file at the
   * path is replaced; the new one is only accessible by the owner.
   * @throws std::runtime_error if the path is too long or cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening fd and removes the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace cmux

#endif  // __CMUX_PIPE_SOCKET_HANDLER__
