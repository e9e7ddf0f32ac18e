#include "HeadlessTerminalEngine.hpp"

namespace cmux {
void HeadlessTerminalEngine::attach(const string &surfaceId, PanelType type) {
  lock_guard<std::mutex> guard(engineMutex);
  Screen screen;
  screen.type = type;
  screens[surfaceId] = screen;
}

void HeadlessTerminalEngine::detach(const string &surfaceId) {
  lock_guard<std::mutex> guard(engineMutex);
  screens.erase(surfaceId);
}

string HeadlessTerminalEngine::readText(const string &surfaceId) {
  lock_guard<std::mutex> guard(engineMutex);
  return findTerminal(surfaceId)->text;
}

void HeadlessTerminalEngine::sendText(const string &surfaceId,
                                      const string &text) {
  bool drew = false;
  bool exited = false;
  {
    lock_guard<std::mutex> guard(engineMutex);
    Screen *screen = findTerminal(surfaceId);
    for (char c : text) {
      if (c == '\x04') {
        if (screen->pendingLine.empty()) {
          exited = true;
          break;
        }
        continue;
      }
      if (c == '\r' || c == '\n') {
        screen->text.append(1, '\n');
        screen->pendingLine.clear();
      } else if (c == '\x7f' || c == '\b') {
        if (!screen->pendingLine.empty() && !screen->text.empty()) {
          screen->pendingLine.pop_back();
          screen->text.pop_back();
        }
      } else {
        screen->text.append(1, c);
        screen->pendingLine.append(1, c);
      }
      drew = true;
    }
    if (screen->text.length() > MAX_SCREEN_CHARS) {
      screen->text.erase(0, screen->text.length() - MAX_SCREEN_CHARS);
    }
    // The pending line is always a suffix of the visible text
    if (screen->pendingLine.length() > screen->text.length()) {
      screen->pendingLine.erase(
          0, screen->pendingLine.length() - screen->text.length());
    }
  }
  if (drew) {
    reportDraw(surfaceId);
  }
  if (exited) {
    VLOG(1) << "Headless terminal " << surfaceId << " got end of input";
    reportExit(surfaceId);
  }
}

bool HeadlessTerminalEngine::isPortalHosted(const string &surfaceId,
                                            bool visible) {
  lock_guard<std::mutex> guard(engineMutex);
  auto it = screens.find(surfaceId);
  return visible && it != screens.end() && it->second.type == TERMINAL_PANEL;
}

void HeadlessTerminalEngine::shutdown() {
  lock_guard<std::mutex> guard(engineMutex);
  stopped = true;
  screens.clear();
}

HeadlessTerminalEngine::Screen *HeadlessTerminalEngine::findTerminal(
    const string &surfaceId) {
  if (stopped) {
    throw SessionError(ErrorKind::Unsupported, "Terminal engine is stopped");
  }
  auto it = screens.find(surfaceId);
  if (it == screens.end()) {
    throw SessionError(ErrorKind::NotFound,
                       "No terminal attached to surface " + surfaceId);
  }
  if (it->second.type != TERMINAL_PANEL) {
    throw SessionError(ErrorKind::InvalidState,
                       "Surface " + surfaceId + " is not a terminal");
  }
  return &(it->second);
}
}  // namespace cmux
