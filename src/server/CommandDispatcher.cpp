#include "CommandDispatcher.hpp"

namespace cmux {
namespace {
const set<string> NOTIFICATION_MODE_COMMANDS = {
    "ping", "help", "notify_surface", "list_notifications",
    "clear_notifications"};

optional<string> optionalRef(const json &request, const string &key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return nullopt;
  }
  if (it->is_string()) {
    return it->get<string>();
  }
  if (it->is_number_integer()) {
    return to_string(it->get<int64_t>());
  }
  throw ProtocolError("Field '" + key + "' must be a string or an integer");
}

string requiredRef(const json &request, const string &key) {
  auto value = optionalRef(request, key);
  if (!value) {
    throw ProtocolError("Missing required field '" + key + "'");
  }
  return *value;
}

optional<string> optionalString(const json &request, const string &key) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_string()) {
    throw ProtocolError("Field '" + key + "' must be a string");
  }
  return it->get<string>();
}

string requiredString(const json &request, const string &key) {
  auto value = optionalString(request, key);
  if (!value) {
    throw ProtocolError("Missing required field '" + key + "'");
  }
  return *value;
}

json optionalJson(const optional<string> &value) {
  return value ? json(*value) : json();
}

json workspaceJson(const WorkspaceInfo &info) {
  json j;
  j["index"] = info.index;
  j["id"] = info.id;
  j["title"] = info.title;
  j["selected"] = info.selected;
  j["surfaces"] = info.numSurfaces;
  j["created_at"] = int64_t(info.createdAt);
  return j;
}

json surfaceListJson(const vector<SurfaceInfo> &surfaces) {
  json list = json::array();
  for (const auto &surface : surfaces) {
    json j;
    j["index"] = surface.index;
    j["id"] = surface.id;
    j["type"] = panelTypeName(surface.type);
    j["focused"] = surface.focused;
    list.push_back(j);
  }
  return list;
}

json notificationJson(const Notification &notification) {
  json j;
  j["id"] = notification.id;
  j["surface"] = notification.surfaceId;
  j["workspace"] = notification.workspaceId;
  j["title"] = notification.title;
  j["kind"] = notification.kind;
  j["body"] = notification.body;
  j["is_read"] = notification.isRead;
  j["created_at"] = int64_t(notification.createdAt);
  return j;
}

json focusJson(const FocusChange &change) {
  json j;
  j["surface"] = change.current;
  j["previous"] = optionalJson(change.previous);
  return j;
}

json createdJson(const CreatedSurface &created) {
  json j;
  j["workspace"] = created.workspaceId;
  j["surface"] = created.surfaceId;
  return j;
}

optional<bool> parseAppFocusValue(const json &request) {
  auto it = request.find("value");
  if (it == request.end()) {
    throw ProtocolError("Missing required field 'value'");
  }
  if (it->is_null()) {
    return nullopt;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_string()) {
    string value = toLower(it->get<string>());
    if (value == "active" || value == "true" || value == "1") {
      return true;
    }
    if (value == "inactive" || value == "false" || value == "0") {
      return false;
    }
    if (value == "clear" || value == "none" || value == "null") {
      return nullopt;
    }
    throw SessionError(ErrorKind::InvalidArgument,
                       "Invalid app focus value '" + value +
                           "' (expected active, inactive or clear)");
  }
  throw ProtocolError("Field 'value' must be a boolean, a string or null");
}
}  // namespace

CommandDispatcher::CommandDispatcher(shared_ptr<Session> _session,
                                     AccessMode _accessMode,
                                     bool _debugCommands)
    : session(_session),
      injector(_session.get()),
      accessMode(_accessMode),
      debugCommands(_debugCommands) {
  registerWorkspaceCommands();
  registerSurfaceCommands();
  registerNotificationCommands();
  registerDebugCommands();
  registerInputCommands();

  add("ping", false, [](const json &) {
    json result;
    result["pong"] = true;
    return result;
  });
  add("help", false, [this](const json &) {
    json result;
    result["commands"] = availableCommands();
    return result;
  });
}

json CommandDispatcher::dispatch(const json &request) {
  if (!request.is_object()) {
    throw ProtocolError("Command must be a JSON object");
  }
  string command = requiredString(request, "type");
  auto it = commands.find(command);
  if (it == commands.end()) {
    return errorResponse(ErrorKind::InvalidArgument,
                         "Unknown command '" + command + "'", command);
  }
  if (!isAllowed(command)) {
    string reason = it->second.debugOnly && !debugCommands
                        ? "debug commands are disabled"
                        : "not permitted in " + accessModeName(accessMode) +
                              " access mode";
    return errorResponse(ErrorKind::Unsupported,
                         "Command '" + command + "' is unavailable: " + reason,
                         command);
  }

  VLOG(1) << "Dispatching " << command;
  try {
    json result = it->second.handler(request);
    if (result.is_null()) {
      result = json::object();
    }
    result["type"] = command;
    result["ok"] = true;
    return result;
  } catch (const ProtocolError &) {
    throw;
  } catch (const SessionError &se) {
    VLOG(1) << "Command " << command << " failed: " << se.what();
    return errorResponse(se.getKind(), se.what(), command);
  } catch (const json::exception &je) {
    throw ProtocolError(string("Malformed field: ") + je.what());
  }
}

json CommandDispatcher::welcome() const {
  json welcome;
  welcome["type"] = "welcome";
  welcome["ok"] = true;
  welcome["version"] = PROTOCOL_VERSION;
  welcome["server"] = "cmuxd";
  welcome["server_version"] = CMUX_VERSION;
  welcome["debug"] = debugCommands;
  welcome["access_mode"] = accessModeName(accessMode);
  return welcome;
}

bool CommandDispatcher::isAllowed(const string &command) const {
  auto it = commands.find(command);
  if (it == commands.end()) {
    return false;
  }
  if (it->second.debugOnly && !debugCommands) {
    return false;
  }
  if (accessMode == AccessMode::Notifications) {
    return NOTIFICATION_MODE_COMMANDS.find(command) !=
           NOTIFICATION_MODE_COMMANDS.end();
  }
  return true;
}

vector<string> CommandDispatcher::availableCommands() const {
  vector<string> names;
  for (const auto &it : commands) {
    if (isAllowed(it.first)) {
      names.push_back(it.first);
    }
  }
  return names;
}

json CommandDispatcher::errorResponse(ErrorKind kind, const string &message,
                                      const string &command) {
  json error;
  error["type"] = "error";
  error["ok"] = false;
  error["kind"] = errorKindName(kind);
  error["message"] = message;
  if (!command.empty()) {
    error["command"] = command;
  }
  return error;
}

void CommandDispatcher::add(const string &name, bool debugOnly,
                            Handler handler) {
  if (commands.find(name) != commands.end()) {
    STFATAL << "Command registered twice: " << name;
  }
  commands[name] = {handler, debugOnly};
}

void CommandDispatcher::registerWorkspaceCommands() {
  add("list_workspaces", false, [this](const json &) {
    json list = json::array();
    for (const auto &info : session->listWorkspaces()) {
      list.push_back(workspaceJson(info));
    }
    json result;
    result["workspaces"] = list;
    return result;
  });
  add("current_workspace", false, [this](const json &) {
    json result;
    result["workspace"] = workspaceJson(session->currentWorkspace());
    return result;
  });
  add("new_workspace", false, [this](const json &) {
    return createdJson(session->newWorkspace());
  });
  add("select_workspace", false, [this](const json &request) {
    json result;
    result["workspace"] = session->selectWorkspace(requiredRef(request, "id"));
    return result;
  });
  add("close_workspace", false, [this](const json &request) {
    json result;
    result["selected"] = session->closeWorkspace(optionalRef(request, "id"));
    return result;
  });
}

void CommandDispatcher::registerSurfaceCommands() {
  add("new_split", false, [this](const json &request) {
    SplitDirection direction =
        parseSplitDirection(requiredString(request, "direction"));
    return createdJson(
        session->newSplit(direction, optionalRef(request, "id")));
  });
  add("new_surface", false, [this](const json &request) {
    auto typeName = optionalString(request, "panel_type");
    PanelType type = typeName ? parsePanelType(*typeName) : TERMINAL_PANEL;
    json result = createdJson(
        session->newSurface(type, optionalRef(request, "id")));
    result["panel_type"] = panelTypeName(type);
    return result;
  });
  add("close_surface", false, [this](const json &request) {
    json result;
    result["surface"] = session->closeSurface(optionalRef(request, "id"));
    return result;
  });
  Handler focusHandler = [this](const json &request) {
    return focusJson(session->focusSurface(requiredRef(request, "id")));
  };
  add("focus_surface", false, focusHandler);
  add("focus_pane", false, focusHandler);
  add("focus_direction", false, [this](const json &request) {
    SplitDirection direction =
        parseSplitDirection(requiredString(request, "direction"));
    auto change = session->focusDirection(direction);
    json result;
    result["moved"] = bool(change);
    result["surface"] = optionalJson(session->getFocusedSurface());
    return result;
  });
  add("list_panes", false, [this](const json &request) {
    json result;
    result["panes"] =
        surfaceListJson(session->listSurfaces(optionalRef(request, "workspace")));
    return result;
  });
  add("list_surfaces", false, [this](const json &request) {
    json result;
    result["surfaces"] =
        surfaceListJson(session->listSurfaces(optionalRef(request, "workspace")));
    return result;
  });
  add("surface_health", false, [this](const json &request) {
    json list = json::array();
    for (const auto &health :
         session->surfaceHealth(optionalRef(request, "workspace"))) {
      json j;
      j["index"] = health.index;
      j["id"] = health.id;
      j["type"] = panelTypeName(health.type);
      j["in_window"] = health.inWindow;
      j["portal"] = health.portal;
      j["view_depth"] = health.viewDepth;
      list.push_back(j);
    }
    json result;
    result["surfaces"] = list;
    return result;
  });
  add("layout", false, [this](const json &request) {
    return session->layout(optionalRef(request, "workspace"));
  });
  add("render_stats", true, [this](const json &request) {
    SurfaceMetrics metrics = session->renderStats(optionalRef(request, "id"));
    json result;
    result["surface"] = metrics.id;
    result["drawCount"] = metrics.drawCount;
    return result;
  });
  add("read_terminal_text", false, [this](const json &request) {
    json result;
    result["text"] = session->readText(optionalRef(request, "id"));
    return result;
  });
}

void CommandDispatcher::registerNotificationCommands() {
  add("notify_surface", false, [this](const json &request) {
    string title = requiredString(request, "title");
    string kind = optionalString(request, "kind").value_or("info");
    string body = optionalString(request, "body").value_or("");
    json result;
    result["notification"] =
        session->notifySurface(optionalRef(request, "id"), title, kind, body);
    return result;
  });
  add("list_notifications", false, [this](const json &) {
    json list = json::array();
    for (const auto &notification : session->listNotifications()) {
      list.push_back(notificationJson(notification));
    }
    json result;
    result["notifications"] = list;
    return result;
  });
  add("clear_notifications", false, [this](const json &) {
    json result;
    result["cleared"] = session->clearNotifications();
    return result;
  });
  add("focus_notification", false, [this](const json &request) {
    return focusJson(session->focusNotification(requiredRef(request, "id")));
  });
}

void CommandDispatcher::registerDebugCommands() {
  add("reset_flash_counts", true, [this](const json &) {
    session->resetFlashCounts();
    return json::object();
  });
  add("flash_count", true, [this](const json &request) {
    json result;
    result["count"] = session->flashCount(requiredRef(request, "id"));
    return result;
  });
  add("trigger_flash", true, [this](const json &request) {
    json result;
    result["count"] = session->triggerFlash(requiredRef(request, "id"));
    return result;
  });
  add("overlay_hit_gate", true, [this](const json &request) {
    PointerEventKind eventKind =
        parsePointerEventKind(requiredString(request, "event_kind"));
    json result;
    result["capture"] = session->overlayHitGate(eventKind);
    result["drag"] = dragPasteboardKindName(session->getDragPasteboard());
    return result;
  });
  auto seedHandler = [this](DragPasteboardKind kind) {
    return [this, kind](const json &) {
      session->seedDragPasteboard(kind);
      json result;
      result["drag"] = dragPasteboardKindName(kind);
      return result;
    };
  };
  add("clear_drag_pasteboard", true, seedHandler(EMPTY_PASTEBOARD));
  add("seed_drag_pasteboard_fileurl", true, seedHandler(FILE_URL));
  add("seed_drag_pasteboard_tabtransfer", true, seedHandler(TAB_TRANSFER));
  add("seed_drag_pasteboard_sidebar_reorder", true,
      seedHandler(SIDEBAR_REORDER));
  add("bonsplit_underflow_count", true, [this](const json &) {
    json result;
    result["count"] = session->getDiagnostics().getSplitUnderflows();
    return result;
  });
  add("reset_bonsplit_underflow_count", true, [this](const json &) {
    session->getDiagnostics().resetSplitUnderflows();
    json result;
    result["count"] = 0;
    return result;
  });
  add("activate_app", false, [this](const json &) {
    session->activateApp();
    json result;
    result["app_focused"] = session->isAppFocused();
    return result;
  });
  add("set_app_focus", true, [this](const json &request) {
    session->setAppFocusOverride(parseAppFocusValue(request));
    json result;
    auto value = session->getAppFocusOverride();
    result["override"] = value ? json(*value) : json();
    result["app_focused"] = session->isAppFocused();
    return result;
  });
  add("is_app_focused", false, [this](const json &) {
    json result;
    result["app_focused"] = session->isAppFocused();
    return result;
  });
}

void CommandDispatcher::registerInputCommands() {
  add("simulate_type", true, [this](const json &request) {
    json result;
    result["surface"] = injector.type(optionalRef(request, "id"),
                                      requiredString(request, "text"));
    return result;
  });
  add("simulate_shortcut", true, [this](const json &request) {
    return injector.shortcut(requiredString(request, "combo"));
  });
  add("simulate_file_drop", true, [this](const json &request) {
    vector<string> paths;
    auto it = request.find("paths");
    if (it == request.end()) {
      throw ProtocolError("Missing required field 'paths'");
    }
    if (it->is_string()) {
      paths.push_back(it->get<string>());
    } else if (it->is_array()) {
      for (const auto &path : *it) {
        if (!path.is_string()) {
          throw ProtocolError("Field 'paths' must hold strings");
        }
        paths.push_back(path.get<string>());
      }
    } else {
      throw ProtocolError("Field 'paths' must be a string or an array");
    }
    json result;
    result["surface"] = injector.fileDrop(optionalRef(request, "id"), paths);
    return result;
  });
}
}  // namespace cmux
