#ifndef __CMUX_PTY_TERMINAL_ENGINE__
#define __CMUX_PTY_TERMINAL_ENGINE__

#include "PtyTerminal.hpp"
#include "TerminalEngine.hpp"

namespace cmux {
/**
 * @brief Backs every terminal surface with a real shell on a pseudo-terminal.
 *
 * One poll thread multiplexes all pty master fds with select(), appends
 * output to each terminal's scrollback and reports a draw per read. When a
 * shell exits the surface is reported through the exit callback.
 */
class PtyTerminalEngine : public TerminalEngine {
 public:
  explicit PtyTerminalEngine(const string &_shell);
  virtual ~PtyTerminalEngine();

  virtual string getName() const { return "pty"; }
  virtual void attach(const string &surfaceId, PanelType type);
  virtual void detach(const string &surfaceId);
  virtual string readText(const string &surfaceId);
  virtual void sendText(const string &surfaceId, const string &text);
  virtual bool isPortalHosted(const string &surfaceId, bool visible);
  virtual void shutdown();

  /** @brief The shell used when none is configured: $SHELL or /bin/sh. */
  static string defaultShell();

 protected:
  void pollLoop();
  shared_ptr<PtyTerminal> findTerminal(const string &surfaceId);

  string shell;
  std::mutex engineMutex;
  map<string, shared_ptr<PtyTerminal>> terminals;
  map<string, PanelType> panelTypes;
  atomic<bool> halt;
  shared_ptr<thread> pollThread;
};
}  // namespace cmux

#endif  // __CMUX_PTY_TERMINAL_ENGINE__
