#ifndef __CMUX_DRAG_GATE__
#define __CMUX_DRAG_GATE__

#include "Headers.hpp"
#include "SessionError.hpp"

namespace cmux {
enum class PointerEventKind {
  None,
  LeftMouseDown,
  LeftMouseUp,
  RightMouseDown,
  RightMouseUp,
  OtherMouseDown,
  OtherMouseUp,
  ScrollWheel,
  LeftMouseDragged,
  RightMouseDragged,
  OtherMouseDragged,
};

/**
 * @brief Parses an event name such as "leftMouseDragged" (case-insensitive).
 * @throws SessionError(InvalidArgument) for an unknown name.
 */
PointerEventKind parsePointerEventKind(const string& name);
string pointerEventKindName(PointerEventKind kind);
string dragPasteboardKindName(DragPasteboardKind kind);

bool isDragMotion(PointerEventKind kind);

/**
 * @brief Decides whether the generic file-drop overlay may capture a pointer
 * event.
 *
 * Only a file drag in motion is captured. Clicks and scrolls always pass
 * through, and tab transfers and sidebar reorders belong to the layout and
 * sidebar code, not the overlay.
 */
inline bool shouldCaptureHitTest(PointerEventKind eventKind,
                                 DragPasteboardKind dragKind) {
  return dragKind == FILE_URL && isDragMotion(eventKind);
}

/**
 * @brief The pasteboard classification of the drag in progress, if any.
 */
class DragSession {
 public:
  DragSession() : kind(EMPTY_PASTEBOARD) {}

  DragPasteboardKind get() const {
    lock_guard<std::mutex> guard(mutex);
    return kind;
  }

  void seed(DragPasteboardKind _kind) {
    lock_guard<std::mutex> guard(mutex);
    kind = _kind;
  }

  void clear() { seed(EMPTY_PASTEBOARD); }

 protected:
  mutable std::mutex mutex;
  DragPasteboardKind kind;
};
}  // namespace cmux

#endif  // __CMUX_DRAG_GATE__
