#include "FocusState.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

namespace {
struct FocusFixture {
  FocusFixture()
      : focus(&registry, [this](const string& surfaceId) {
          return placed.find(surfaceId) != placed.end();
        }) {
    a = registry.create(TERMINAL_PANEL);
    b = registry.create(TERMINAL_PANEL);
    placed.insert(a);
    placed.insert(b);
  }

  SurfaceRegistry registry;
  set<string> placed;
  FocusState focus;
  string a;
  string b;
};
}  // namespace

TEST_CASE("Focus marks notifications read and flashes once", "[FocusState]") {
  FocusFixture f;
  string n1 = f.focus.notify(f.a, "ws", "Build done", "info", "");
  string n2 = f.focus.notify(f.b, "ws", "Tests failed", "error", "3 failures");
  REQUIRE_FALSE(f.focus.isRead(n1));
  REQUIRE(f.focus.hasUnread(f.a));
  // Notifying never flashes
  REQUIRE(f.focus.flashCount(f.a) == 0);

  FocusChange change = f.focus.focus(f.a);
  REQUIRE_FALSE(change.previous);
  REQUIRE(change.current == f.a);
  REQUIRE(f.focus.isRead(n1));
  REQUIRE_FALSE(f.focus.isRead(n2));
  REQUIRE(f.focus.flashCount(f.a) == 1);
  REQUIRE(f.focus.flashCount(f.b) == 0);

  change = f.focus.focus(f.b);
  REQUIRE(*change.previous == f.a);
  REQUIRE(f.focus.isRead(n2));
  REQUIRE(f.focus.flashCount(f.b) == 1);
  REQUIRE(f.focus.flashCount(f.a) == 1);
}

TEST_CASE("Handing off focus does not flash", "[FocusState]") {
  FocusFixture f;
  string n = f.focus.notify(f.b, "ws", "ping", "info", "");
  f.focus.handOff(f.b);
  REQUIRE(f.focus.isFocused(f.b));
  REQUIRE(f.focus.isRead(n));
  REQUIRE(f.focus.flashCount(f.b) == 0);

  f.focus.handOff(nullopt);
  REQUIRE_FALSE(f.focus.getFocused());
}

TEST_CASE("Notifications are listed newest first", "[FocusState]") {
  FocusFixture f;
  string first = f.focus.notify(f.a, "ws", "first", "info", "");
  string second = f.focus.notify(f.a, "ws", "second", "info", "body");
  auto list = f.focus.listNotifications();
  REQUIRE(list.size() == 2);
  REQUIRE(list[0].id == second);
  REQUIRE(list[0].body == "body");
  REQUIRE(list[1].id == first);
  REQUIRE(f.focus.surfaceForNotification(first) == f.a);

  f.focus.clearNotificationsFor({f.a});
  REQUIRE(f.focus.listNotifications().empty());
  REQUIRE_THROWS_AS(f.focus.isRead(first), SessionError);
}

TEST_CASE("Unplaced surfaces cannot be focused or notified",
          "[FocusState]") {
  FocusFixture f;
  f.placed.erase(f.b);
  try {
    f.focus.notify(f.b, "ws", "title", "info", "");
    FAIL("Expected NotFound");
  } catch (const SessionError& se) {
    REQUIRE(se.getKind() == ErrorKind::NotFound);
  }
  REQUIRE_THROWS_AS(f.focus.focus(f.b), SessionError);
  REQUIRE(f.focus.listNotifications().empty());
}

TEST_CASE("Trigger flash leaves focus alone", "[FocusState]") {
  FocusFixture f;
  f.focus.handOff(f.a);
  REQUIRE(f.focus.triggerFlash(f.b) == 1);
  REQUIRE(f.focus.triggerFlash(f.b) == 2);
  REQUIRE(f.focus.isFocused(f.a));
  REQUIRE(f.focus.clearNotifications() == 0);

  f.focus.forget(f.b);
  REQUIRE(f.focus.isFocused(f.a));
  f.focus.forget(f.a);
  REQUIRE_FALSE(f.focus.getFocused());
}
