#include "TerminalEngine.hpp"

#include "HeadlessTerminalEngine.hpp"
#include "PtyTerminalEngine.hpp"

namespace cmux {
shared_ptr<TerminalEngine> createTerminalEngine(const string &name,
                                                const string &shell) {
  string lower = toLower(trim(name));
  if (lower == "headless") {
    return shared_ptr<TerminalEngine>(new HeadlessTerminalEngine());
  }
  if (lower == "pty") {
    return shared_ptr<TerminalEngine>(new PtyTerminalEngine(shell));
  }
  if (lower == "none") {
    return shared_ptr<TerminalEngine>();
  }
  throw ConfigurationError("Unknown terminal engine '" + name +
                           "' (expected headless, pty or none)");
}
}  // namespace cmux
