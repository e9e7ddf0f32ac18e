#include "PtyTerminalEngine.hpp"
#include "Session.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

namespace {
bool waitFor(const function<bool()>& condition) {
  for (int i = 0; i < 500; i++) {
    if (condition()) {
      return true;
    }
    this_thread::sleep_for(chrono::milliseconds(10));
  }
  return false;
}
}  // namespace

TEST_CASE("A pty terminal runs a shell", "[PtyTerminalEngine]") {
  PtyTerminalEngine engine("/bin/sh");
  atomic<int> draws(0);
  std::mutex exitMutex;
  vector<string> exits;
  engine.setDrawCallback([&draws](const string&) { draws++; });
  engine.setExitCallback([&exitMutex, &exits](const string& surfaceId) {
    lock_guard<std::mutex> guard(exitMutex);
    exits.push_back(surfaceId);
  });

  engine.attach("t1", TERMINAL_PANEL);
  engine.sendText("t1", "echo cmux-$((20+22))\n");
  REQUIRE(waitFor([&engine] {
    return engine.readText("t1").find("cmux-42") != string::npos;
  }));
  REQUIRE(draws > 0);
  REQUIRE(engine.isPortalHosted("t1", true));

  engine.sendText("t1", "exit\n");
  REQUIRE(waitFor([&exitMutex, &exits] {
    lock_guard<std::mutex> guard(exitMutex);
    return !exits.empty();
  }));
  REQUIRE(exits.front() == "t1");
  REQUIRE_FALSE(engine.isPortalHosted("t1", true));
  REQUIRE_THROWS_AS(engine.sendText("t1", "ls\n"), SessionError);

  engine.detach("t1");
  engine.shutdown();
}

TEST_CASE("A browser surface gets no pty", "[PtyTerminalEngine]") {
  PtyTerminalEngine engine("/bin/sh");
  engine.attach("b1", BROWSER_PANEL);
  REQUIRE_FALSE(engine.isPortalHosted("b1", true));
  try {
    engine.readText("b1");
    FAIL("Expected InvalidState");
  } catch (const SessionError& se) {
    REQUIRE(se.getKind() == ErrorKind::InvalidState);
  }
  engine.shutdown();
}

TEST_CASE("An exited shell closes its surface", "[PtyTerminalEngine]") {
  shared_ptr<TerminalEngine> engine(new PtyTerminalEngine("/bin/sh"));
  Session session(engine);
  string original = *session.getFocusedSurface();
  string second = session.newSplit(SplitDirection::Right, nullopt).surfaceId;

  session.sendText(second, "exit\n");
  REQUIRE(waitFor([&session] {
    return session.listSurfaces(nullopt).size() == 1;
  }));
  REQUIRE(session.listSurfaces(nullopt)[0].id == original);
  REQUIRE(*session.getFocusedSurface() == original);
  REQUIRE(session.getDiagnostics().getSplitUnderflows() == 0);
  session.shutdown();
}
