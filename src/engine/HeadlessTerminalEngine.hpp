#ifndef __CMUX_HEADLESS_TERMINAL_ENGINE__
#define __CMUX_HEADLESS_TERMINAL_ENGINE__

#include "TerminalEngine.hpp"

namespace cmux {
/**
 * @brief An in-memory terminal: input is echoed into a scrollback buffer and
 * every change is reported as a draw. An end-of-transmission character (^D)
 * on an empty input line ends the terminal, like a shell would.
 */
class HeadlessTerminalEngine : public TerminalEngine {
 public:
  HeadlessTerminalEngine() {}
  virtual ~HeadlessTerminalEngine() {}

  virtual string getName() const { return "headless"; }
  virtual void attach(const string &surfaceId, PanelType type);
  virtual void detach(const string &surfaceId);
  virtual string readText(const string &surfaceId);
  virtual void sendText(const string &surfaceId, const string &text);
  virtual bool isPortalHosted(const string &surfaceId, bool visible);
  virtual void shutdown();

 protected:
  struct Screen {
    PanelType type;
    string text;
    // Bytes typed since the last line break
    string pendingLine;
  };

  Screen *findTerminal(const string &surfaceId);

  std::mutex engineMutex;
  map<string, Screen> screens;
  bool stopped = false;
};
}  // namespace cmux

#endif  // __CMUX_HEADLESS_TERMINAL_ENGINE__
