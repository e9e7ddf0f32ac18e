#ifndef __CMUX_INPUT_INJECTOR__
#define __CMUX_INPUT_INJECTOR__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Session.hpp"

namespace cmux {
struct KeyCombo {
  bool command = false;
  bool control = false;
  bool option = false;
  bool shift = false;
  // Lower case key name: a single character or a named key such as "enter"
  string key;
};

/**
 * @brief Parses a combo such as "cmd+shift+d" or "ctrl+c". Modifiers are
 * cmd/command/super, ctrl/control, opt/option/alt and shift.
 * @throws SessionError(InvalidArgument) for a malformed combo.
 */
KeyCombo parseKeyCombo(const string &combo);

/** @brief Expands the escapes \n, \r, \t and \\ of typed text. */
string unescapeText(const string &text);

/** @brief Single-quotes a path for a POSIX shell. */
string shellQuote(const string &path);

/**
 * @brief Simulated keyboard and drop input.
 *
 * Shortcuts bound by the application act on the session directly (splits,
 * workspaces, focus movement); everything else is translated to the bytes a
 * terminal would receive and sent through the terminal engine.
 */
class InputInjector {
 public:
  explicit InputInjector(Session *_session) : session(_session) {}

  /**
   * @brief Types text into a surface (the focused one by default).
   * @return The surface that received the text.
   */
  string type(const optional<string> &surfaceRef, const string &text);

  /**
   * @brief Performs a key combo.
   * @return A description of what happened: `action` plus the affected ids.
   * @throws SessionError(Unsupported) for an unbound command/option combo.
   */
  json shortcut(const string &combo);

  /**
   * @brief Drops files onto a terminal, which types their quoted paths.
   * @return The surface that received the drop.
   */
  string fileDrop(const optional<string> &surfaceRef,
                  const vector<string> &paths);

 protected:
  json applicationShortcut(const KeyCombo &combo);
  string terminalBytes(const KeyCombo &combo);

  Session *session;
};
}  // namespace cmux

#endif  // __CMUX_INPUT_INJECTOR__
