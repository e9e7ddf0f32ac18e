#include "DragGate.hpp"

namespace cmux {
namespace {
const vector<pair<PointerEventKind, string>> EVENT_NAMES = {
    {PointerEventKind::None, "none"},
    {PointerEventKind::LeftMouseDown, "leftMouseDown"},
    {PointerEventKind::LeftMouseUp, "leftMouseUp"},
    {PointerEventKind::RightMouseDown, "rightMouseDown"},
    {PointerEventKind::RightMouseUp, "rightMouseUp"},
    {PointerEventKind::OtherMouseDown, "otherMouseDown"},
    {PointerEventKind::OtherMouseUp, "otherMouseUp"},
    {PointerEventKind::ScrollWheel, "scrollWheel"},
    {PointerEventKind::LeftMouseDragged, "leftMouseDragged"},
    {PointerEventKind::RightMouseDragged, "rightMouseDragged"},
    {PointerEventKind::OtherMouseDragged, "otherMouseDragged"},
};
}  // namespace

PointerEventKind parsePointerEventKind(const string& name) {
  string lower = toLower(trim(name));
  for (const auto& it : EVENT_NAMES) {
    if (toLower(it.second) == lower) {
      return it.first;
    }
  }
  throw SessionError(ErrorKind::InvalidArgument,
                     "Unknown event kind: '" + name + "'");
}

string pointerEventKindName(PointerEventKind kind) {
  for (const auto& it : EVENT_NAMES) {
    if (it.first == kind) {
      return it.second;
    }
  }
  return "unknown";
}

string dragPasteboardKindName(DragPasteboardKind kind) {
  switch (kind) {
    case EMPTY_PASTEBOARD:
      return "empty";
    case TAB_TRANSFER:
      return "tab-transfer";
    case SIDEBAR_REORDER:
      return "sidebar-reorder";
    case FILE_URL:
      return "file-url";
  }
  return "unknown";
}

bool isDragMotion(PointerEventKind kind) {
  return kind == PointerEventKind::LeftMouseDragged ||
         kind == PointerEventKind::RightMouseDragged ||
         kind == PointerEventKind::OtherMouseDragged;
}
}  // namespace cmux
