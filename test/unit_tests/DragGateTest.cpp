#include "DragGate.hpp"
#include "TestHeaders.hpp"

using namespace cmux;

TEST_CASE("Event kinds parse case-insensitively", "[DragGate]") {
  REQUIRE(parsePointerEventKind("leftMouseDragged") ==
          PointerEventKind::LeftMouseDragged);
  REQUIRE(parsePointerEventKind("LEFTMOUSEDOWN") ==
          PointerEventKind::LeftMouseDown);
  REQUIRE(parsePointerEventKind("none") == PointerEventKind::None);
  REQUIRE(pointerEventKindName(PointerEventKind::ScrollWheel) ==
          "scrollWheel");
  REQUIRE_THROWS_AS(parsePointerEventKind("doubleClick"), SessionError);
}

TEST_CASE("Only file drags in motion are captured", "[DragGate]") {
  const vector<DragPasteboardKind> kinds = {EMPTY_PASTEBOARD, TAB_TRANSFER,
                                            SIDEBAR_REORDER, FILE_URL};
  const vector<PointerEventKind> motion = {
      PointerEventKind::LeftMouseDragged, PointerEventKind::RightMouseDragged,
      PointerEventKind::OtherMouseDragged};
  const vector<PointerEventKind> other = {
      PointerEventKind::None,           PointerEventKind::LeftMouseDown,
      PointerEventKind::LeftMouseUp,    PointerEventKind::RightMouseDown,
      PointerEventKind::RightMouseUp,   PointerEventKind::OtherMouseDown,
      PointerEventKind::OtherMouseUp,   PointerEventKind::ScrollWheel};

  for (auto kind : kinds) {
    for (auto event : other) {
      INFO(dragPasteboardKindName(kind) << " " << pointerEventKindName(event));
      REQUIRE_FALSE(shouldCaptureHitTest(event, kind));
    }
    for (auto event : motion) {
      INFO(dragPasteboardKindName(kind) << " " << pointerEventKindName(event));
      REQUIRE(shouldCaptureHitTest(event, kind) == (kind == FILE_URL));
    }
  }
}

TEST_CASE("Drag session seeds and clears", "[DragGate]") {
  DragSession session;
  REQUIRE(session.get() == EMPTY_PASTEBOARD);
  session.seed(TAB_TRANSFER);
  REQUIRE(session.get() == TAB_TRANSFER);
  REQUIRE(dragPasteboardKindName(session.get()) == "tab-transfer");
  session.clear();
  REQUIRE(session.get() == EMPTY_PASTEBOARD);
}
