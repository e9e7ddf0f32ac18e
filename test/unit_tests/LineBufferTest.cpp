#include "LineBuffer.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

TEST_CASE("Lines are reassembled across reads", "[LineBuffer]") {
  LineBuffer buffer;
  buffer.append("{\"type\":\"he");
  REQUIRE_FALSE(buffer.nextLine());
  REQUIRE(buffer.hasPartialLine());

  buffer.append("llo\"}\n{\"type\":");
  auto line = buffer.nextLine();
  REQUIRE(line);
  REQUIRE(*line == "{\"type\":\"hello\"}");
  REQUIRE_FALSE(buffer.nextLine());

  buffer.append("\"ping\"}\r\n\n");
  REQUIRE(*buffer.nextLine() == "{\"type\":\"ping\"}");
  // An empty line is still a line
  REQUIRE(*buffer.nextLine() == "");
  REQUIRE_FALSE(buffer.hasPartialLine());
}

TEST_CASE("Several lines in one read keep their order", "[LineBuffer]") {
  LineBuffer buffer;
  buffer.append("a\nb\nc");
  REQUIRE(*buffer.nextLine() == "a");
  REQUIRE(*buffer.nextLine() == "b");
  REQUIRE_FALSE(buffer.nextLine());
  REQUIRE(buffer.size() == 1);
  buffer.clear();
  REQUIRE(buffer.size() == 0);
}

TEST_CASE("Oversized lines are a protocol error", "[LineBuffer]") {
  LineBuffer buffer(8);
  buffer.append("12345678");
  REQUIRE_THROWS_AS(buffer.append("9"), ProtocolError);

  LineBuffer other(8);
  // A long line that arrives complete is rejected when popped
  other.append("0123456789\n");
  REQUIRE_THROWS_AS(other.nextLine(), ProtocolError);
}
