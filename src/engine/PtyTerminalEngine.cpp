#include "PtyTerminalEngine.hpp"

namespace cmux {
PtyTerminalEngine::PtyTerminalEngine(const string &_shell)
    : shell(_shell.empty() ? defaultShell() : _shell), halt(false) {
  pollThread.reset(new thread(&PtyTerminalEngine::pollLoop, this));
}

PtyTerminalEngine::~PtyTerminalEngine() { shutdown(); }

string PtyTerminalEngine::defaultShell() {
  const char *envShell = ::getenv("SHELL");
  if (envShell != NULL && string(envShell).length()) {
    return string(envShell);
  }
  return "/bin/sh";
}

void PtyTerminalEngine::attach(const string &surfaceId, PanelType type) {
  lock_guard<std::mutex> guard(engineMutex);
  panelTypes[surfaceId] = type;
  if (type != TERMINAL_PANEL) {
    return;
  }
  shared_ptr<PtyTerminal> terminal(new PtyTerminal());
  terminal->start(shell);
  terminals[surfaceId] = terminal;
  LOG(INFO) << "Started " << shell << " for surface " << surfaceId;
}

void PtyTerminalEngine::detach(const string &surfaceId) {
  lock_guard<std::mutex> guard(engineMutex);
  panelTypes.erase(surfaceId);
  auto it = terminals.find(surfaceId);
  if (it == terminals.end()) {
    return;
  }
  it->second->stop();
  terminals.erase(it);
  VLOG(1) << "Stopped terminal for surface " << surfaceId;
}

string PtyTerminalEngine::readText(const string &surfaceId) {
  lock_guard<std::mutex> guard(engineMutex);
  return findTerminal(surfaceId)->getText();
}

void PtyTerminalEngine::sendText(const string &surfaceId, const string &text) {
  lock_guard<std::mutex> guard(engineMutex);
  auto terminal = findTerminal(surfaceId);
  if (!terminal->isRunning()) {
    throw SessionError(ErrorKind::InvalidState,
                       "Terminal for surface " + surfaceId + " has exited");
  }
  try {
    terminal->appendData(text);
  } catch (const std::runtime_error &ex) {
    throw SessionError(ErrorKind::InvalidState, ex.what());
  }
}

bool PtyTerminalEngine::isPortalHosted(const string &surfaceId, bool visible) {
  lock_guard<std::mutex> guard(engineMutex);
  auto it = terminals.find(surfaceId);
  return visible && it != terminals.end() && it->second->isRunning();
}

void PtyTerminalEngine::shutdown() {
  halt = true;
  if (pollThread.get()) {
    pollThread->join();
    pollThread.reset();
  }
  lock_guard<std::mutex> guard(engineMutex);
  for (auto &it : terminals) {
    it.second->stop();
  }
  terminals.clear();
  panelTypes.clear();
}

shared_ptr<PtyTerminal> PtyTerminalEngine::findTerminal(
    const string &surfaceId) {
  auto typeIt = panelTypes.find(surfaceId);
  if (typeIt == panelTypes.end()) {
    throw SessionError(ErrorKind::NotFound,
                       "No terminal attached to surface " + surfaceId);
  }
  if (typeIt->second != TERMINAL_PANEL) {
    throw SessionError(ErrorKind::InvalidState,
                       "Surface " + surfaceId + " is not a terminal");
  }
  return terminals[surfaceId];
}

void PtyTerminalEngine::pollLoop() {
  el::Helpers::setThreadName("pty-poll");
  while (!halt) {
    fd_set rfd;
    FD_ZERO(&rfd);
    int maxFd = -1;
    {
      lock_guard<std::mutex> guard(engineMutex);
      for (auto &it : terminals) {
        if (it.second->isRunning()) {
          int fd = it.second->getMasterFd();
          FD_SET(fd, &rfd);
          maxFd = max(maxFd, fd);
        }
      }
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    if (maxFd < 0) {
      select(0, NULL, NULL, NULL, &tv);
      continue;
    }
    int n = select(maxFd + 1, &rfd, NULL, NULL, &tv);
    if (n <= 0) {
      // Timeout, or a terminal was detached while we waited
      continue;
    }

    vector<string> drawn;
    vector<string> exited;
    {
      lock_guard<std::mutex> guard(engineMutex);
      for (auto &it : terminals) {
        auto terminal = it.second;
        if (!terminal->isRunning() ||
            !FD_ISSET(terminal->getMasterFd(), &rfd)) {
          continue;
        }
        string newChars = terminal->poll();
        if (!newChars.empty()) {
          drawn.push_back(it.first);
        }
        if (!terminal->isRunning()) {
          exited.push_back(it.first);
        }
      }
    }
    // Callbacks run without engineMutex: the session calls detach from them
    for (const auto &surfaceId : drawn) {
      reportDraw(surfaceId);
    }
    for (const auto &surfaceId : exited) {
      reportExit(surfaceId);
    }
  }
}
}  // namespace cmux
