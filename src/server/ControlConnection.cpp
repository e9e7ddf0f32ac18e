#include "ControlConnection.hpp"

namespace cmux {
#define BUF_SIZE (16 * 1024)

string connectionStateName(ControlConnection::State state) {
  switch (state) {
    case ControlConnection::State::Connected:
      return "connected";
    case ControlConnection::State::Handshaking:
      return "handshaking";
    case ControlConnection::State::Ready:
      return "ready";
    case ControlConnection::State::Closed:
      return "closed";
  }
  return "unknown";
}

ControlConnection::ControlConnection(
    shared_ptr<SocketHandler> _socketHandler, int _socketFd,
    shared_ptr<CommandDispatcher> _dispatcher)
    : socketHandler(_socketHandler),
      socketFd(_socketFd),
      dispatcher(_dispatcher),
      state(State::Connected) {}

optional<string> ControlConnection::handleLine(const string &line) {
  if (state == State::Closed) {
    return nullopt;
  }
  try {
    json message;
    try {
      message = json::parse(line);
    } catch (const json::parse_error &pe) {
      throw ProtocolError(string("Malformed JSON: ") + pe.what());
    }
    if (!message.is_object()) {
      throw ProtocolError("Message is not a JSON object");
    }

    if (state == State::Connected) {
      return handleHello(message);
    }

    auto type = message.find("type");
    if (type != message.end() && type->is_string() && *type == "hello") {
      return CommandDispatcher::errorResponse(ErrorKind::InvalidState,
                                              "Handshake already completed",
                                              "hello")
          .dump();
    }
    return dispatcher->dispatch(message).dump();
  } catch (const ProtocolError &pe) {
    LOG(INFO) << "Closing control connection " << socketFd << ": "
              << pe.what();
    state = State::Closed;
    return nullopt;
  }
}

optional<string> ControlConnection::handleHello(const json &message) {
  state = State::Handshaking;
  auto type = message.find("type");
  if (type == message.end() || !type->is_string() || *type != "hello") {
    throw ProtocolError("Expected hello as the first message");
  }
  auto version = message.find("version");
  if (version == message.end() || !version->is_number_integer()) {
    throw ProtocolError("hello without an integer version");
  }
  int64_t clientVersion = version->get<int64_t>();
  if (clientVersion != PROTOCOL_VERSION) {
    LOG(WARNING) << "Client " << socketFd << " speaks protocol "
                 << clientVersion << ", expected " << PROTOCOL_VERSION;
    state = State::Closed;
    return CommandDispatcher::errorResponse(
               ErrorKind::ProtocolError,
               "Mismatched protocol version: client " +
                   to_string(clientVersion) + ", server " +
                   to_string(PROTOCOL_VERSION),
               "hello")
        .dump();
  }
  state = State::Ready;
  VLOG(1) << "Control connection " << socketFd << " is ready";
  return dispatcher->welcome().dump();
}

void ControlConnection::run(const atomic<bool> *halt) {
  el::Helpers::setThreadName("control-" + to_string(socketFd));
  char buf[BUF_SIZE];
  while (!(*halt) && state != State::Closed) {
    if (!socketHandler->waitForData(socketFd, 0, 10000)) {
      continue;
    }
    try {
      size_t bytesRead = socketHandler->readSome(socketFd, buf, BUF_SIZE);
      if (bytesRead == 0) {
        continue;
      }
      lineBuffer.append(buf, bytesRead);
      while (state != State::Closed) {
        auto line = lineBuffer.nextLine();
        if (!line) {
          break;
        }
        auto response = handleLine(*line);
        if (response) {
          socketHandler->writeLine(socketFd, *response);
        }
      }
    } catch (const ProtocolError &pe) {
      LOG(INFO) << "Closing control connection " << socketFd << ": "
                << pe.what();
      state = State::Closed;
    } catch (const std::runtime_error &re) {
      VLOG(1) << "Control connection " << socketFd << " ended: " << re.what();
      state = State::Closed;
    }
  }
  state = State::Closed;
  socketHandler->close(socketFd);
}
}  // namespace cmux
