#include "SocketHandler.hpp"

namespace cmux {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

size_t SocketHandler::readSome(int fd, void* buf, size_t count) {
  ssize_t bytesRead = read(fd, buf, count);
  if (bytesRead == 0) {
    throw std::runtime_error("Connection closed by peer");
  }
  if (bytesRead < 0) {
    auto localErrno = errno;
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return 0;
    }
    VLOG(1) << "Failed a call to readSome: " << strerror(localErrno);
    throw std::runtime_error("Failed a call to readSome");
  }
  return size_t(bytesRead);
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        VLOG(2) << "Got EAGAIN, waiting...";
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}
}  // namespace cmux
