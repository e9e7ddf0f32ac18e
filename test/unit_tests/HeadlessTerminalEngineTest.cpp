#include "HeadlessTerminalEngine.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

TEST_CASE("Headless terminals echo input", "[HeadlessTerminalEngine]") {
  HeadlessTerminalEngine engine;
  vector<string> draws;
  vector<string> exits;
  engine.setDrawCallback([&draws](const string& id) { draws.push_back(id); });
  engine.setExitCallback([&exits](const string& id) { exits.push_back(id); });

  engine.attach("t1", TERMINAL_PANEL);
  REQUIRE(engine.readText("t1") == "");
  engine.sendText("t1", "echo hi\rls");
  REQUIRE(engine.readText("t1") == "echo hi\nls");
  engine.sendText("t1", "\x7f\x7f\x7f");
  REQUIRE(engine.readText("t1") == "echo hi\n");
  REQUIRE(draws.size() == 2);

  // ^D on an empty line ends the terminal
  engine.sendText("t1", "\x04");
  REQUIRE(exits == vector<string>{"t1"});
  REQUIRE(draws.size() == 2);
}

TEST_CASE("Backspace past the trimmed scrollback",
          "[HeadlessTerminalEngine]") {
  HeadlessTerminalEngine engine;
  vector<string> exits;
  engine.setExitCallback([&exits](const string& id) { exits.push_back(id); });
  engine.attach("t1", TERMINAL_PANEL);

  engine.sendText("t1", string(200 * 1024, 'x'));
  REQUIRE(engine.readText("t1").length() == MAX_SCREEN_CHARS);

  // Erases what is left on screen and nothing more
  engine.sendText("t1", string(200 * 1024, '\x7f'));
  REQUIRE(engine.readText("t1") == "");

  engine.sendText("t1", "ok");
  REQUIRE(engine.readText("t1") == "ok");
  engine.sendText("t1", "\x7f\x7f\x7f");
  REQUIRE(engine.readText("t1") == "");

  // The line is empty again, so ^D ends the terminal
  engine.sendText("t1", "\x04");
  REQUIRE(exits == vector<string>{"t1"});
}

TEST_CASE("Headless engine errors", "[HeadlessTerminalEngine]") {
  HeadlessTerminalEngine engine;
  engine.attach("b1", BROWSER_PANEL);
  try {
    engine.readText("b1");
    FAIL("Expected InvalidState");
  } catch (const SessionError& se) {
    REQUIRE(se.getKind() == ErrorKind::InvalidState);
  }
  try {
    engine.sendText("nope", "x");
    FAIL("Expected NotFound");
  } catch (const SessionError& se) {
    REQUIRE(se.getKind() == ErrorKind::NotFound);
  }

  engine.attach("t1", TERMINAL_PANEL);
  REQUIRE(engine.isPortalHosted("t1", true));
  REQUIRE_FALSE(engine.isPortalHosted("t1", false));
  REQUIRE_FALSE(engine.isPortalHosted("b1", true));
  engine.detach("t1");
  REQUIRE_FALSE(engine.isPortalHosted("t1", true));

  engine.shutdown();
  try {
    engine.readText("b1");
    FAIL("Expected Unsupported");
  } catch (const SessionError& se) {
    REQUIRE(se.getKind() == ErrorKind::Unsupported);
  }
}

TEST_CASE("Engines are created by name", "[HeadlessTerminalEngine]") {
  REQUIRE(createTerminalEngine("headless", "")->getName() == "headless");
  REQUIRE(createTerminalEngine("none", "") == nullptr);
  REQUIRE_THROWS_AS(createTerminalEngine("gpu", ""), ConfigurationError);
}
