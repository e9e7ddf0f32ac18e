#include "CommandDispatcher.hpp"
#include "HeadlessTerminalEngine.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

namespace {
shared_ptr<Session> newSession() {
  return shared_ptr<Session>(
      new Session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine())));
}

json command(const string& type, json fields = json::object()) {
  fields["type"] = type;
  return fields;
}
}  // namespace

TEST_CASE("Responses carry the command type", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, false);
  json response = dispatcher.dispatch(command("ping"));
  REQUIRE(response["type"] == "ping");
  REQUIRE(response["ok"] == true);
  REQUIRE(response["pong"] == true);

  json welcome = dispatcher.welcome();
  REQUIRE(welcome["type"] == "welcome");
  REQUIRE(welcome["version"] == PROTOCOL_VERSION);
  REQUIRE(welcome["debug"] == false);
}

TEST_CASE("Split, focus and close over commands", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, true);
  json panes = dispatcher.dispatch(command("list_panes"))["panes"];
  REQUIRE(panes.size() == 1);
  string original = panes[0]["id"];

  json split = dispatcher.dispatch(command("new_split", {{"direction", "right"}}));
  REQUIRE(split["ok"] == true);
  string created = split["surface"];

  panes = dispatcher.dispatch(command("list_panes"))["panes"];
  REQUIRE(panes.size() == 2);
  REQUIRE(panes[0]["id"] == original);
  REQUIRE(panes[1]["id"] == created);
  REQUIRE(panes[1]["focused"] == true);

  json focused = dispatcher.dispatch(command("focus_pane", {{"id", 1}}));
  REQUIRE(focused["surface"] == created);

  json typed = dispatcher.dispatch(
      command("simulate_shortcut", {{"combo", "ctrl+d"}}));
  REQUIRE(typed["ok"] == true);

  panes = dispatcher.dispatch(command("list_surfaces"))["surfaces"];
  REQUIRE(panes.size() == 1);
  REQUIRE(panes[0]["id"] == original);
  REQUIRE(dispatcher.dispatch(command("bonsplit_underflow_count"))["count"] ==
          0);
}

TEST_CASE("Failed commands become error responses", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, false);

  json response = dispatcher.dispatch(command("focus_surface", {{"id", "x"}}));
  REQUIRE(response["type"] == "error");
  REQUIRE(response["ok"] == false);
  REQUIRE(response["kind"] == "not_found");
  REQUIRE(response["command"] == "focus_surface");
  REQUIRE(response["message"].is_string());

  response = dispatcher.dispatch(command("close_workspace"));
  REQUIRE(response["kind"] == "invalid_state");

  response = dispatcher.dispatch(command("new_split", {{"direction", "diagonal"}}));
  REQUIRE(response["kind"] == "invalid_argument");

  response = dispatcher.dispatch(command("teleport"));
  REQUIRE(response["kind"] == "invalid_argument");

  // Debug commands are hidden unless enabled
  response = dispatcher.dispatch(command("bonsplit_underflow_count"));
  REQUIRE(response["kind"] == "unsupported");
}

TEST_CASE("Missing or ill-typed fields are protocol errors",
          "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, true);
  REQUIRE_THROWS_AS(dispatcher.dispatch(command("new_split")), ProtocolError);
  REQUIRE_THROWS_AS(
      dispatcher.dispatch(command("new_split", {{"direction", 3}})),
      ProtocolError);
  REQUIRE_THROWS_AS(dispatcher.dispatch(command("flash_count")),
                    ProtocolError);
  REQUIRE_THROWS_AS(dispatcher.dispatch(json::array()), ProtocolError);
  REQUIRE_THROWS_AS(dispatcher.dispatch(json{{"type", 7}}), ProtocolError);
}

TEST_CASE("Notifications and flash counters", "[CommandDispatcher]") {
  auto session = newSession();
  CommandDispatcher dispatcher(session, AccessMode::Full, true);
  string first = *session->getFocusedSurface();
  dispatcher.dispatch(command("new_split", {{"direction", "down"}}));
  dispatcher.dispatch(command("reset_flash_counts"));

  json notified = dispatcher.dispatch(command(
      "notify_surface",
      {{"id", first}, {"title", "Build"}, {"kind", "info"}, {"body", "done"}}));
  string notification = notified["notification"];

  json list = dispatcher.dispatch(command("list_notifications"))["notifications"];
  REQUIRE(list.size() == 1);
  REQUIRE(list[0]["id"] == notification);
  REQUIRE(list[0]["is_read"] == false);
  REQUIRE(dispatcher.dispatch(command("flash_count", {{"id", first}}))["count"] ==
          0);

  dispatcher.dispatch(command("focus_surface", {{"id", first}}));
  list = dispatcher.dispatch(command("list_notifications"))["notifications"];
  REQUIRE(list[0]["is_read"] == true);
  REQUIRE(dispatcher.dispatch(command("flash_count", {{"id", 0}}))["count"] == 1);
  REQUIRE(dispatcher.dispatch(command("flash_count", {{"id", 1}}))["count"] == 0);
  REQUIRE(dispatcher.dispatch(command("trigger_flash", {{"id", 1}}))["count"] ==
          1);

  REQUIRE(dispatcher.dispatch(command("clear_notifications"))["cleared"] == 1);
}

TEST_CASE("Overlay hit gate over commands", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, true);
  auto gate = [&dispatcher](const string& eventKind) {
    return dispatcher
        .dispatch(command("overlay_hit_gate", {{"event_kind", eventKind}}))
        ["capture"]
        .get<bool>();
  };
  REQUIRE_FALSE(gate("none"));
  REQUIRE_FALSE(gate("none"));
  dispatcher.dispatch(command("seed_drag_pasteboard_tabtransfer"));
  REQUIRE_FALSE(gate("leftMouseDragged"));
  dispatcher.dispatch(command("seed_drag_pasteboard_sidebar_reorder"));
  REQUIRE_FALSE(gate("leftMouseDragged"));
  dispatcher.dispatch(command("seed_drag_pasteboard_fileurl"));
  REQUIRE(gate("leftMouseDragged"));
  REQUIRE_FALSE(gate("leftMouseDown"));
  dispatcher.dispatch(command("clear_drag_pasteboard"));
  REQUIRE_FALSE(gate("leftMouseDragged"));
}

TEST_CASE("App focus override", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, true);
  REQUIRE(dispatcher.dispatch(command("is_app_focused"))["app_focused"] ==
          false);
  json response = dispatcher.dispatch(command("set_app_focus", {{"value", true}}));
  REQUIRE(response["override"] == true);
  REQUIRE(response["app_focused"] == true);
  response = dispatcher.dispatch(command("set_app_focus", {{"value", nullptr}}));
  REQUIRE(response["override"].is_null());
  REQUIRE(response["app_focused"] == false);
  dispatcher.dispatch(command("activate_app"));
  response = dispatcher.dispatch(command("set_app_focus", {{"value", "inactive"}}));
  REQUIRE(response["app_focused"] == false);
  response = dispatcher.dispatch(command("set_app_focus", {{"value", "sideways"}}));
  REQUIRE(response["kind"] == "invalid_argument");
}

TEST_CASE("Surface health and render stats", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, true);
  dispatcher.dispatch(command("new_surface", {{"panel_type", "browser"}}));
  json health = dispatcher.dispatch(command("surface_health"))["surfaces"];
  REQUIRE(health.size() == 2);
  REQUIRE(health[0]["type"] == "terminal");
  REQUIRE(health[0]["in_window"] == true);
  REQUIRE(health[0]["portal"] == true);
  REQUIRE(health[0]["view_depth"] == 1);
  REQUIRE(health[1]["type"] == "browser");
  REQUIRE(health[1]["portal"] == false);

  dispatcher.dispatch(command("simulate_type", {{"id", 0}, {"text", "ls\\n"}}));
  json stats = dispatcher.dispatch(command("render_stats", {{"id", 0}}));
  REQUIRE(stats["drawCount"] == 1);
  REQUIRE(dispatcher.dispatch(command("read_terminal_text", {{"id", 0}}))
              ["text"] == "ls\n");
  json drop = dispatcher.dispatch(command(
      "simulate_file_drop", {{"id", 1}, {"paths", json::array({"/tmp/x"})}}));
  REQUIRE(drop["kind"] == "invalid_state");

  json layout = dispatcher.dispatch(command("layout"));
  REQUIRE(layout["root"]["type"] == "split");
}

TEST_CASE("Notifications access mode limits commands", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Notifications, true);
  REQUIRE(dispatcher.isAllowed("notify_surface"));
  REQUIRE_FALSE(dispatcher.isAllowed("new_split"));
  REQUIRE_FALSE(dispatcher.isAllowed("flash_count"));

  json response =
      dispatcher.dispatch(command("new_split", {{"direction", "right"}}));
  REQUIRE(response["kind"] == "unsupported");
  response = dispatcher.dispatch(command("notify_surface", {{"title", "hi"}}));
  REQUIRE(response["ok"] == true);

  json help = dispatcher.dispatch(command("help"));
  REQUIRE(help["commands"].size() == 5);
}

TEST_CASE("Workspace commands", "[CommandDispatcher]") {
  CommandDispatcher dispatcher(newSession(), AccessMode::Full, false);
  json created = dispatcher.dispatch(command("new_workspace"));
  REQUIRE(created["ok"] == true);
  json list = dispatcher.dispatch(command("list_workspaces"))["workspaces"];
  REQUIRE(list.size() == 2);
  REQUIRE(list[1]["selected"] == true);
  REQUIRE(list[1]["id"] == created["workspace"]);

  json selected = dispatcher.dispatch(command("select_workspace", {{"id", 0}}));
  REQUIRE(selected["workspace"] == list[0]["id"]);
  REQUIRE(dispatcher.dispatch(command("current_workspace"))["workspace"]["id"] ==
          list[0]["id"]);

  json closed = dispatcher.dispatch(
      command("close_workspace", {{"id", created["workspace"]}}));
  REQUIRE(closed["selected"] == list[0]["id"]);
}
