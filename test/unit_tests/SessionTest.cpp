#include "HeadlessTerminalEngine.hpp"
#include "Session.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

namespace {
ErrorKind kindOf(const function<void()>& fn) {
  try {
    fn();
  } catch (const SessionError& se) {
    return se.getKind();
  }
  FAIL("Expected a SessionError");
  return ErrorKind::ProtocolError;
}

vector<string> surfaceIds(const vector<SurfaceInfo>& surfaces) {
  vector<string> ids;
  for (const auto& surface : surfaces) {
    ids.push_back(surface.id);
  }
  return ids;
}
}  // namespace

TEST_CASE("A new session has one workspace with one focused terminal",
          "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  auto workspaces = session.listWorkspaces();
  REQUIRE(workspaces.size() == 1);
  REQUIRE(workspaces[0].selected);
  REQUIRE(workspaces[0].numSurfaces == 1);
  REQUIRE(workspaces[0].title == "Terminal 1");

  auto surfaces = session.listSurfaces(nullopt);
  REQUIRE(surfaces.size() == 1);
  REQUIRE(surfaces[0].index == 0);
  REQUIRE(surfaces[0].focused);
  REQUIRE(surfaces[0].type == TERMINAL_PANEL);
  REQUIRE(*session.getFocusedSurface() == surfaces[0].id);
  REQUIRE_FALSE(session.isAppFocused());
}

TEST_CASE("Split, focus and close the new pane", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  string original = *session.getFocusedSurface();

  CreatedSurface created = session.newSplit(SplitDirection::Right, nullopt);
  auto surfaces = session.listSurfaces(nullopt);
  REQUIRE(surfaces.size() == 2);
  REQUIRE(surfaces[0].id == original);
  REQUIRE(surfaces[1].id == created.surfaceId);

  session.focusSurface("1");
  REQUIRE(*session.getFocusedSurface() == created.surfaceId);

  SECTION("closing by command") { session.closeSurface(nullopt); }

  SECTION("ctrl+d on an empty line") {
    session.sendText(nullopt, "\x04");
  }

  surfaces = session.listSurfaces(nullopt);
  REQUIRE(surfaces.size() == 1);
  REQUIRE(surfaces[0].id == original);
  REQUIRE(*session.getFocusedSurface() == original);
  REQUIRE(session.getDiagnostics().getSplitUnderflows() == 0);
}

TEST_CASE("Split then close restores the layout", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  session.newSplit(SplitDirection::Down, nullopt);
  json before = session.layout(nullopt);

  CreatedSurface created = session.newSplit(SplitDirection::Left, "0");
  REQUIRE(session.listSurfaces(nullopt).front().id == created.surfaceId);
  session.closeSurface(created.surfaceId);

  REQUIRE(session.layout(nullopt) == before);
  REQUIRE(session.getDiagnostics().getSplitUnderflows() == 0);
}

TEST_CASE("Focus reads notifications and flashes only the target",
          "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  string first = *session.getFocusedSurface();
  string second = session.newSplit(SplitDirection::Right, nullopt).surfaceId;
  session.resetFlashCounts();

  string notification = session.notifySurface(first, "Done", "info", "");
  REQUIRE_FALSE(session.isNotificationRead(notification));
  REQUIRE(session.flashCount(first) == 0);

  FocusChange change = session.focusSurface(first);
  REQUIRE(*change.previous == second);
  REQUIRE(session.isNotificationRead(notification));
  REQUIRE(session.flashCount(first) == 1);
  REQUIRE(session.flashCount(second) == 0);

  REQUIRE(session.triggerFlash(second) == 1);
  REQUIRE(*session.getFocusedSurface() == first);
}

TEST_CASE("Focusing a notification selects its workspace", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  string firstSurface = *session.getFocusedSurface();
  string firstWorkspace = session.currentWorkspace().id;
  string notification =
      session.notifySurface(nullopt, "Bell", "attention", "ring");
  // The focused surface keeps its notification unread until focused again
  REQUIRE_FALSE(session.isNotificationRead(notification));

  CreatedSurface other = session.newWorkspace();
  REQUIRE(session.currentWorkspace().id == other.workspaceId);

  FocusChange change = session.focusNotification(notification);
  REQUIRE(change.current == firstSurface);
  REQUIRE(session.currentWorkspace().id == firstWorkspace);
  REQUIRE(session.isNotificationRead(notification));

  REQUIRE(kindOf([&] { session.focusNotification("nope"); }) ==
          ErrorKind::NotFound);
  REQUIRE(session.clearNotifications() == 1);
  REQUIRE(session.listNotifications().empty());
}

TEST_CASE("Workspaces select by index or id and remember focus",
          "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  string firstWorkspace = session.currentWorkspace().id;
  string second = session.newSplit(SplitDirection::Right, nullopt).surfaceId;
  session.focusSurface("0");
  string first = *session.getFocusedSurface();

  CreatedSurface created = session.newWorkspace();
  REQUIRE(*session.getFocusedSurface() == created.surfaceId);
  REQUIRE(session.listWorkspaces()[1].title == "Terminal 2");

  REQUIRE(session.selectWorkspace("0") == firstWorkspace);
  REQUIRE(*session.getFocusedSurface() == first);
  REQUIRE(session.selectWorkspace(created.workspaceId) == created.workspaceId);
  REQUIRE(*session.getFocusedSurface() == created.surfaceId);
  REQUIRE(session.listSurfaces(firstWorkspace).size() == 2);
  REQUIRE(surfaceIds(session.listSurfaces(string("0"))) ==
          vector<string>({first, second}));

  REQUIRE(kindOf([&] { session.selectWorkspace("7"); }) ==
          ErrorKind::NotFound);
  REQUIRE(kindOf([&] { session.selectWorkspace("not-a-workspace"); }) ==
          ErrorKind::NotFound);
}

TEST_CASE("The last workspace cannot be closed", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  REQUIRE(kindOf([&] { session.closeWorkspace(nullopt); }) ==
          ErrorKind::InvalidState);

  string firstWorkspace = session.currentWorkspace().id;
  CreatedSurface created = session.newWorkspace();
  string notification =
      session.notifySurface(created.surfaceId, "x", "info", "");

  REQUIRE(session.closeWorkspace(nullopt) == firstWorkspace);
  REQUIRE(session.listWorkspaces().size() == 1);
  REQUIRE(session.getFocusedSurface());
  // Notifications of closed surfaces go away with them
  REQUIRE(kindOf([&] { session.isNotificationRead(notification); }) ==
          ErrorKind::NotFound);
}

TEST_CASE("Closing the last surface of a workspace", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));

  SECTION("closes the workspace when others exist") {
    string firstWorkspace = session.currentWorkspace().id;
    session.newWorkspace();
    session.closeSurface(nullopt);
    REQUIRE(session.listWorkspaces().size() == 1);
    REQUIRE(session.currentWorkspace().id == firstWorkspace);
    REQUIRE(session.getFocusedSurface());
  }

  SECTION("leaves an empty workspace when it is the only one") {
    session.closeSurface(nullopt);
    REQUIRE(session.listWorkspaces().size() == 1);
    REQUIRE(session.listSurfaces(nullopt).empty());
    REQUIRE_FALSE(session.getFocusedSurface());
    REQUIRE(session.layout(nullopt)["root"].is_null());

    // A new surface becomes the root again
    CreatedSurface created = session.newSurface(TERMINAL_PANEL, nullopt);
    REQUIRE(*session.getFocusedSurface() == created.surfaceId);
    REQUIRE(session.layout(nullopt)["root"]["type"] == "leaf");
  }
}

TEST_CASE("Browser surfaces do not take input", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  CreatedSurface browser = session.newSurface(BROWSER_PANEL, nullopt);

  auto health = session.surfaceHealth(nullopt);
  REQUIRE(health.size() == 2);
  REQUIRE(health[0].type == TERMINAL_PANEL);
  REQUIRE(health[0].inWindow);
  REQUIRE(health[0].portal);
  REQUIRE(health[0].viewDepth == 1);
  REQUIRE(health[1].id == browser.surfaceId);
  REQUIRE(health[1].type == BROWSER_PANEL);
  REQUIRE_FALSE(health[1].portal);

  REQUIRE(kindOf([&] { session.sendText(browser.surfaceId, "ls\n"); }) ==
          ErrorKind::InvalidState);
  REQUIRE(kindOf([&] { session.readText(browser.surfaceId); }) ==
          ErrorKind::InvalidState);
}

TEST_CASE("Surfaces of hidden workspaces are not in the window",
          "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  string firstWorkspace = session.currentWorkspace().id;
  session.newWorkspace();
  auto health = session.surfaceHealth(firstWorkspace);
  REQUIRE(health.size() == 1);
  REQUIRE_FALSE(health[0].inWindow);
  REQUIRE_FALSE(health[0].portal);
}

TEST_CASE("Typed text is drawn and readable", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  string surface = session.sendText(nullopt, "echo hi\n");
  REQUIRE(session.readText(nullopt) == "echo hi\n");
  REQUIRE(session.renderStats(surface).drawCount == 1);
  REQUIRE(session.renderStats(nullopt).id == surface);
  REQUIRE_FALSE(session.recordDraw("gone"));
}

TEST_CASE("Focus moves between neighbors", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  string left = *session.getFocusedSurface();
  string right = session.newSplit(SplitDirection::Right, nullopt).surfaceId;

  auto change = session.focusDirection(SplitDirection::Left);
  REQUIRE(change);
  REQUIRE(change->current == left);
  REQUIRE_FALSE(session.focusDirection(SplitDirection::Left));
  REQUIRE(session.focusDirection(SplitDirection::Right)->current == right);
}

TEST_CASE("Drag gate and app focus state", "[Session]") {
  Session session(shared_ptr<TerminalEngine>());
  REQUIRE_FALSE(session.overlayHitGate(PointerEventKind::LeftMouseDragged));
  session.seedDragPasteboard(FILE_URL);
  REQUIRE(session.overlayHitGate(PointerEventKind::LeftMouseDragged));
  REQUIRE_FALSE(session.overlayHitGate(PointerEventKind::LeftMouseDown));
  // Probing the gate changes nothing
  REQUIRE(session.overlayHitGate(PointerEventKind::LeftMouseDragged));
  session.clearDragPasteboard();
  REQUIRE(session.getDragPasteboard() == EMPTY_PASTEBOARD);

  session.setAppFocusOverride(false);
  session.activateApp();
  REQUIRE_FALSE(session.isAppFocused());
  session.setAppFocusOverride(nullopt);
  REQUIRE(session.isAppFocused());
}

TEST_CASE("Engine commands fail without an engine", "[Session]") {
  Session session(shared_ptr<TerminalEngine>());
  REQUIRE(kindOf([&] { session.readText(nullopt); }) ==
          ErrorKind::Unsupported);
  REQUIRE(kindOf([&] { session.sendText(nullopt, "x"); }) ==
          ErrorKind::Unsupported);
  // Structural commands still work
  session.newSplit(SplitDirection::Down, nullopt);
  REQUIRE(session.listSurfaces(nullopt).size() == 2);
  REQUIRE_FALSE(session.surfaceHealth(nullopt)[0].portal);
}

TEST_CASE("Unknown references are not found", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  REQUIRE(kindOf([&] { session.focusSurface("5"); }) == ErrorKind::NotFound);
  REQUIRE(kindOf([&] { session.closeSurface(string("missing")); }) ==
          ErrorKind::NotFound);
  REQUIRE(kindOf([&] {
            session.newSplit(SplitDirection::Up, string("missing"));
          }) == ErrorKind::NotFound);
  REQUIRE(kindOf([&] {
            session.notifySurface(string("missing"), "t", "info", "");
          }) == ErrorKind::NotFound);
}

TEST_CASE("A shut down session rejects commands", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  session.shutdown();
  REQUIRE(kindOf([&] { session.newWorkspace(); }) == ErrorKind::InvalidState);
  REQUIRE(kindOf([&] { session.listSurfaces(nullopt); }) ==
          ErrorKind::InvalidState);
  // A second shutdown is a no-op
  session.shutdown();
}

TEST_CASE("Concurrent splits and closes never underflow", "[Session]") {
  Session session(shared_ptr<TerminalEngine>(new HeadlessTerminalEngine()));
  session.getDiagnostics().resetSplitUnderflows();
  atomic<bool> done(false);
  atomic<int> failures(0);
  atomic<int> tornReads(0);

  vector<thread> writers;
  for (int t = 0; t < 4; t++) {
    writers.emplace_back([&session, &failures, t] {
      for (int i = 0; i < 50; i++) {
        try {
          CreatedSurface created = session.newSplit(
              t % 2 ? SplitDirection::Right : SplitDirection::Down, nullopt);
          session.focusSurface(created.surfaceId);
          // A second split right after focusing the new sibling
          session.newSplit(SplitDirection::Left, created.surfaceId);
          session.closeSurface(created.surfaceId);
        } catch (const SessionError& se) {
          LOG(ERROR) << "Unexpected failure: " << se.what();
          failures++;
        }
      }
    });
  }
  thread reader([&session, &done, &tornReads] {
    while (!done) {
      auto surfaces = session.listSurfaces(nullopt);
      json layout = session.layout(nullopt);
      if (surfaces.empty() || layout["root"].is_null()) {
        tornReads++;
      }
      for (const auto& health : session.surfaceHealth(nullopt)) {
        if (health.viewDepth < 0) {
          tornReads++;
        }
      }
    }
  });
  for (auto& t : writers) {
    t.join();
  }
  done = true;
  reader.join();

  REQUIRE(failures == 0);
  REQUIRE(tornReads == 0);
  REQUIRE(session.getDiagnostics().getSplitUnderflows() == 0);
  auto surfaces = session.listSurfaces(nullopt);
  // One original surface plus one kept split per iteration
  REQUIRE(surfaces.size() == 1 + 4 * 50);
  REQUIRE(session.listWorkspaces()[0].numSurfaces == int(surfaces.size()));
}
