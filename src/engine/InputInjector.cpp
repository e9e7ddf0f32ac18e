#include "InputInjector.hpp"

namespace cmux {
namespace {
const map<string, string> NAMED_KEYS = {
    {"enter", "\r"},      {"return", "\r"},    {"tab", "\t"},
    {"escape", "\x1b"},   {"esc", "\x1b"},     {"backspace", "\x7f"},
    {"delete", "\x7f"},   {"space", " "},      {"up", "\x1b[A"},
    {"down", "\x1b[B"},   {"right", "\x1b[C"}, {"left", "\x1b[D"},
};

SessionError badCombo(const string &combo, const string &reason) {
  return SessionError(ErrorKind::InvalidArgument,
                      "Invalid key combo '" + combo + "': " + reason);
}

bool isArrow(const string &key) {
  return key == "left" || key == "right" || key == "up" || key == "down";
}

json focusResult(const optional<FocusChange> &change) {
  json result;
  result["action"] = "focus";
  result["moved"] = bool(change);
  if (change) {
    result["surface"] = change->current;
  }
  return result;
}
}  // namespace

KeyCombo parseKeyCombo(const string &combo) {
  KeyCombo result;
  vector<string> tokens = split(toLower(trim(combo)), '+');
  if (tokens.empty()) {
    throw badCombo(combo, "empty");
  }
  for (size_t i = 0; i + 1 < tokens.size(); i++) {
    string modifier = trim(tokens[i]);
    if (modifier == "cmd" || modifier == "command" || modifier == "super") {
      result.command = true;
    } else if (modifier == "ctrl" || modifier == "control") {
      result.control = true;
    } else if (modifier == "opt" || modifier == "option" || modifier == "alt") {
      result.option = true;
    } else if (modifier == "shift") {
      result.shift = true;
    } else {
      throw badCombo(combo, "unknown modifier '" + modifier + "'");
    }
  }
  result.key = trim(tokens.back());
  if (result.key.empty()) {
    throw badCombo(combo, "missing key");
  }
  if (result.key.length() > 1 &&
      NAMED_KEYS.find(result.key) == NAMED_KEYS.end()) {
    throw badCombo(combo, "unknown key '" + result.key + "'");
  }
  return result;
}

string unescapeText(const string &text) {
  string result;
  for (size_t i = 0; i < text.length(); i++) {
    if (text[i] != '\\' || i + 1 == text.length()) {
      result.append(1, text[i]);
      continue;
    }
    char next = text[++i];
    switch (next) {
      case 'n':
        result.append(1, '\n');
        break;
      case 'r':
        result.append(1, '\r');
        break;
      case 't':
        result.append(1, '\t');
        break;
      case '\\':
        result.append(1, '\\');
        break;
      default:
        result.append(1, '\\');
        result.append(1, next);
        break;
    }
  }
  return result;
}

string shellQuote(const string &path) {
  string quoted = "'";
  for (char c : path) {
    if (c == '\'') {
      quoted.append("'\\''");
    } else {
      quoted.append(1, c);
    }
  }
  quoted.append("'");
  return quoted;
}

string InputInjector::type(const optional<string> &surfaceRef,
                           const string &text) {
  return session->sendText(surfaceRef, unescapeText(text));
}

json InputInjector::shortcut(const string &combo) {
  KeyCombo keyCombo = parseKeyCombo(combo);
  if (keyCombo.command) {
    return applicationShortcut(keyCombo);
  }
  if (keyCombo.option) {
    throw SessionError(ErrorKind::Unsupported,
                       "No binding for '" + combo + "'");
  }
  json result;
  result["action"] = "input";
  result["surface"] = session->sendText(nullopt, terminalBytes(keyCombo));
  return result;
}

string InputInjector::fileDrop(const optional<string> &surfaceRef,
                               const vector<string> &paths) {
  if (paths.empty()) {
    throw SessionError(ErrorKind::InvalidArgument, "No paths to drop");
  }
  string text;
  for (const auto &path : paths) {
    if (!text.empty()) {
      text.append(1, ' ');
    }
    text.append(shellQuote(path));
  }
  return session->sendText(surfaceRef, text);
}

json InputInjector::applicationShortcut(const KeyCombo &combo) {
  const string &key = combo.key;
  json result;
  if (!combo.control && !combo.option && key == "d") {
    auto created = session->newSplit(
        combo.shift ? SplitDirection::Down : SplitDirection::Right, nullopt);
    result["action"] = "split";
    result["surface"] = created.surfaceId;
    result["workspace"] = created.workspaceId;
    return result;
  }
  if (!combo.control && !combo.option && !combo.shift &&
      (key == "n" || key == "t")) {
    auto created = session->newWorkspace();
    result["action"] = "new_workspace";
    result["surface"] = created.surfaceId;
    result["workspace"] = created.workspaceId;
    return result;
  }
  if (!combo.control && !combo.option && key == "w") {
    if (combo.shift) {
      result["action"] = "close_workspace";
      result["workspace"] = session->closeWorkspace(nullopt);
    } else {
      result["action"] = "close_surface";
      result["surface"] = session->closeSurface(nullopt);
    }
    return result;
  }
  if (combo.option && !combo.control && !combo.shift && isArrow(key)) {
    return focusResult(session->focusDirection(parseSplitDirection(key)));
  }
  if (!combo.control && !combo.option && !combo.shift && key.length() == 1 &&
      key[0] >= '1' && key[0] <= '9') {
    auto workspaces = session->listWorkspaces();
    // cmd+9 always selects the last workspace
    size_t index =
        key[0] == '9' ? workspaces.size() - 1 : size_t(key[0] - '1');
    result["action"] = "select_workspace";
    result["workspace"] = session->selectWorkspace(to_string(index));
    return result;
  }
  throw SessionError(ErrorKind::Unsupported,
                     "No binding for command shortcut '" + key + "'");
}

string InputInjector::terminalBytes(const KeyCombo &combo) {
  auto named = NAMED_KEYS.find(combo.key);
  if (named != NAMED_KEYS.end()) {
    if (combo.control) {
      throw SessionError(ErrorKind::Unsupported,
                         "No control sequence for '" + combo.key + "'");
    }
    return named->second;
  }
  char c = combo.key[0];
  if (combo.control) {
    if (c >= 'a' && c <= 'z') {
      return string(1, char(c - 'a' + 1));
    }
    switch (c) {
      case '@':
      case ' ':
        return string(1, '\0');
      case '[':
        return "\x1b";
      case '\\':
        return "\x1c";
      case ']':
        return "\x1d";
      default:
        throw SessionError(ErrorKind::Unsupported,
                           string("No control sequence for '") + c + "'");
    }
  }
  if (combo.shift && c >= 'a' && c <= 'z') {
    c = char(c - 'a' + 'A');
  }
  return string(1, c);
}
}  // namespace cmux
