#include "ControlClient.hpp"

namespace cmux {
#define BUF_SIZE (16 * 1024)

ControlClient::ControlClient(shared_ptr<SocketHandler> _socketHandler,
                             const SocketEndpoint& _endpoint)
    : socketHandler(_socketHandler), endpoint(_endpoint), socketFd(-1) {}

ControlClient::~ControlClient() { close(); }

bool ControlClient::connect() {
  socketFd = socketHandler->connect(endpoint);
  if (socketFd < 0) {
    LOG(INFO) << "Could not connect to " << endpoint << ": "
              << strerror(GetErrno());
    return false;
  }
  return true;
}

optional<json> ControlClient::hello(int version) {
  json message;
  message["type"] = "hello";
  message["version"] = version;
  return request(message);
}

optional<json> ControlClient::request(const json& command) {
  writeLine(command.dump());
  auto line = readLine();
  if (!line) {
    return nullopt;
  }
  return json::parse(*line);
}

void ControlClient::writeLine(const string& line) {
  if (socketFd < 0) {
    throw std::runtime_error("Not connected");
  }
  socketHandler->writeLine(socketFd, line);
}

void ControlClient::writeRaw(const string& data) {
  if (socketFd < 0) {
    throw std::runtime_error("Not connected");
  }
  socketHandler->writeAllOrThrow(socketFd, data.data(), data.length(), true);
}

optional<string> ControlClient::readLine(int timeoutSeconds) {
  if (socketFd < 0) {
    return nullopt;
  }
  time_t startTime = time(NULL);
  char buf[BUF_SIZE];
  while (true) {
    auto line = lineBuffer.nextLine();
    if (line) {
      return line;
    }
    if (time(NULL) > startTime + timeoutSeconds) {
      throw std::runtime_error("Timed out waiting for a response");
    }
    if (!socketHandler->waitForData(socketFd, 0, 100000)) {
      continue;
    }
    try {
      size_t bytesRead = socketHandler->readSome(socketFd, buf, BUF_SIZE);
      lineBuffer.append(buf, bytesRead);
    } catch (const ProtocolError&) {
      throw;
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Server closed the connection: " << re.what();
      close();
      return nullopt;
    }
  }
}

void ControlClient::close() {
  if (socketFd >= 0) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}
}  // namespace cmux
