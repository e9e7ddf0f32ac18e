#include "ControlServer.hpp"

namespace cmux {
ControlServer::ControlServer(shared_ptr<SocketHandler> _socketHandler,
                             const SocketEndpoint &_endpoint,
                             shared_ptr<CommandDispatcher> _dispatcher)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      dispatcher(_dispatcher),
      halt(false),
      listening(false) {}

ControlServer::~ControlServer() {
  shutdown();
  lock_guard<std::mutex> guard(connectionMutex);
  for (auto &it : connections) {
    if (it.second->joinable()) {
      it.second->join();
    }
  }
  connections.clear();
}

void ControlServer::listen() {
  socketHandler->listen(endpoint);
  listening = true;
}

void ControlServer::run() {
  LOG(INFO) << "Control server running on " << endpoint;
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverFds = socketHandler->getEndpointFds(endpoint);
  for (int i : serverFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!halt) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    reapClosedConnections();
    if (numFdsSet == 0) {
      continue;
    }
    for (int i : serverFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }

  LOG(INFO) << "Control server stopping";
  socketHandler->stopListening(endpoint);
  listening = false;
  lock_guard<std::mutex> guard(connectionMutex);
  for (auto &it : connections) {
    it.second->join();
  }
  connections.clear();
}

size_t ControlServer::getConnectionCount() {
  lock_guard<std::mutex> guard(connectionMutex);
  return connections.size();
}

void ControlServer::reapClosedConnections() {
  lock_guard<std::mutex> guard(connectionMutex);
  for (auto it = connections.begin(); it != connections.end();) {
    if (it->first->getState() == ControlConnection::State::Closed) {
      // A closed connection returns from run() without reading again
      it->second->join();
      VLOG(1) << "Reaped control connection " << it->first->getSocketFd();
      it = connections.erase(it);
    } else {
      ++it;
    }
  }
}

void ControlServer::acceptNewConnection(int listenFd) {
  int clientFd = socketHandler->accept(listenFd);
  if (clientFd < 0) {
    return;
  }
  LOG(INFO) << "New control connection on fd " << clientFd;
  shared_ptr<ControlConnection> connection(
      new ControlConnection(socketHandler, clientFd, dispatcher));
  lock_guard<std::mutex> guard(connectionMutex);
  connections.push_back(make_pair(
      connection, shared_ptr<thread>(new thread(
                      [connection, this]() { connection->run(&halt); }))));
}
}  // namespace cmux
