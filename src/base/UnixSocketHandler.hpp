#ifndef __CMUX_UNIX_SOCKET_HANDLER__
#define __CMUX_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace cmux {
/**
 * @brief SocketHandler over non-blocking POSIX stream sockets, with one mutex
 * per descriptor so a connection's reads and writes are serialized.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes, retrying on EAGAIN for up to 5 seconds. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /**
   * @brief Accepts a pending connection on the provided listening socket.
   * @return The client fd, or -1 when nothing was pending.
   */
  virtual int accept(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);

 protected:
  /**
   * @brief Starts tracking a descriptor and gives it its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Makes the descriptor non-blocking and disables SIGPIPE.
   */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace cmux

#endif  // __CMUX_UNIX_SOCKET_HANDLER__
