#ifndef __CMUX_CONTROL_SERVER__
#define __CMUX_CONTROL_SERVER__

#include "CommandDispatcher.hpp"
#include "ControlConnection.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace cmux {
/**
 * @brief Accepts control clients on a local socket and serves each on its own
 * thread.
 */
class ControlServer {
 public:
  ControlServer(shared_ptr<SocketHandler> _socketHandler,
                const SocketEndpoint &_endpoint,
                shared_ptr<CommandDispatcher> _dispatcher);
  ~ControlServer();

  /**
   * @brief Binds the endpoint.
   * @throws std::runtime_error if the socket cannot be bound.
   */
  void listen();

  /**
   * @brief Accept loop. Returns after shutdown(), once every connection
   * thread has finished.
   */
  void run();

  /** @brief Signals the accept loop and every connection to stop. */
  void shutdown() { halt = true; }

  bool isListening() const { return listening; }

  /** @brief Connections whose threads have not been reaped yet. */
  size_t getConnectionCount();

 protected:
  void acceptNewConnection(int listenFd);
  /** @brief Joins and forgets connections that have closed. */
  void reapClosedConnections();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<CommandDispatcher> dispatcher;
  /** @brief Live connections and the threads that serve them. */
  vector<pair<shared_ptr<ControlConnection>, shared_ptr<thread>>> connections;
  std::mutex connectionMutex;
  atomic<bool> halt;
  atomic<bool> listening;
};
}  // namespace cmux

#endif  // __CMUX_CONTROL_SERVER__
