#ifndef __CMUX_SESSION__
#define __CMUX_SESSION__

#include "DiagnosticCounters.hpp"
#include "DragGate.hpp"
#include "FocusState.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SplitTree.hpp"
#include "SurfaceRegistry.hpp"
#include "TerminalEngine.hpp"

namespace cmux {
struct Workspace {
  string id;
  string title;
  SplitTree tree;
  optional<string> lastFocused;
  time_t createdAt;
};

struct WorkspaceInfo {
  int index;
  string id;
  string title;
  bool selected;
  int numSurfaces;
  time_t createdAt;
};

struct SurfaceInfo {
  int index;
  string id;
  string workspaceId;
  PanelType type;
  bool focused;
};

struct SurfaceHealth {
  int index;
  string id;
  PanelType type;
  bool inWindow;
  bool portal;
  int viewDepth;
};

/** @brief Ids created by a structural command. */
struct CreatedSurface {
  string workspaceId;
  string surfaceId;
};

/**
 * @brief The process-wide session: the ordered workspaces and their split
 * layouts, the surface registry, focus and notifications, the drag session
 * and app focus.
 *
 * All state is guarded by one reader/writer lock. Every mutation takes it
 * exclusively for its whole duration, so commands from different connections
 * and engine callbacks never interleave; queries share it and always see the
 * state between two mutations.
 *
 * Surface references are either a surface id (in any workspace) or the index
 * of a surface in the selected workspace's visual order. Workspace references
 * are a workspace id or an index into the workspace list. An absent surface
 * reference means the focused surface.
 */
class Session {
 public:
  /**
   * @brief Starts the session with one workspace holding one terminal.
   * @param _engine The terminal engine, or null to run without one.
   */
  explicit Session(shared_ptr<TerminalEngine> _engine);
  ~Session();

  /**
   * @brief Stops the terminal engine and destroys every workspace. Later
   * commands fail with InvalidState.
   */
  void shutdown();

  shared_ptr<TerminalEngine> getEngine() const { return engine; }

  // Workspaces
  /** @brief Creates a selected workspace holding one focused terminal. */
  CreatedSurface newWorkspace();
  /**
   * @brief Selects a workspace and focuses the surface that was focused there
   * last.
   * @return The selected workspace id.
   */
  string selectWorkspace(const string &workspaceRef);
  /**
   * @brief Closes a workspace (the selected one when no reference is given)
   * with every surface and notification in it.
   * @return The id of the workspace selected afterwards.
   * @throws SessionError(InvalidState) when it is the only workspace.
   */
  string closeWorkspace(const optional<string> &workspaceRef);
  vector<WorkspaceInfo> listWorkspaces() const;
  WorkspaceInfo currentWorkspace() const;

  // Surfaces
  /**
   * @brief Splits a surface and focuses the new terminal next to it.
   */
  CreatedSurface newSplit(SplitDirection direction,
                          const optional<string> &surfaceRef);
  /**
   * @brief Adds a surface of the given type. In an empty workspace it becomes
   * the root; otherwise the target surface is split to the right.
   */
  CreatedSurface newSurface(PanelType type,
                            const optional<string> &surfaceRef);
  /**
   * @brief Closes a surface. A workspace left without surfaces is closed
   * unless it is the only one.
   * @return The closed surface id.
   */
  string closeSurface(const optional<string> &surfaceRef);
  /** @brief Explicit focus: marks notifications read and flashes once. */
  FocusChange focusSurface(const string &surfaceRef);
  /**
   * @brief Focuses the geometric neighbour of the focused surface.
   * @return nullopt when there is no surface in that direction.
   */
  optional<FocusChange> focusDirection(SplitDirection direction);
  optional<string> getFocusedSurface() const;
  vector<SurfaceInfo> listSurfaces(const optional<string> &workspaceRef) const;
  vector<SurfaceHealth> surfaceHealth(
      const optional<string> &workspaceRef) const;
  json layout(const optional<string> &workspaceRef) const;

  // Notifications
  string notifySurface(const optional<string> &surfaceRef, const string &title,
                       const string &kind, const string &body);
  vector<Notification> listNotifications() const;
  int clearNotifications();
  /** @brief Selects the notification's workspace and focuses its surface. */
  FocusChange focusNotification(const string &notificationId);
  bool isNotificationRead(const string &notificationId) const;

  // Flash
  void resetFlashCounts();
  int64_t flashCount(const string &surfaceRef) const;
  int64_t triggerFlash(const string &surfaceRef);

  // Rendering and input, delegated to the terminal engine
  SurfaceMetrics renderStats(const optional<string> &surfaceRef) const;
  /**
   * @brief Counts a draw reported by the engine.
   * @return false if the surface no longer exists.
   */
  bool recordDraw(const string &surfaceId);
  string readText(const optional<string> &surfaceRef);
  /** @return The surface the text was sent to. */
  string sendText(const optional<string> &surfaceRef, const string &text);

  // Drag and drop
  void seedDragPasteboard(DragPasteboardKind kind);
  void clearDragPasteboard();
  DragPasteboardKind getDragPasteboard() const;
  bool overlayHitGate(PointerEventKind eventKind) const;

  // Application focus
  void activateApp();
  void setAppFocusOverride(const optional<bool> &value);
  optional<bool> getAppFocusOverride() const;
  bool isAppFocused() const;

  diagnostics::DiagnosticCounters &getDiagnostics() { return diagnostics; }

 protected:
  // Helpers below expect sessionMutex to be held by the caller.
  void checkRunning() const;
  CreatedSurface createWorkspaceLocked();
  int workspaceIndexOf(const string &workspaceRef) const;
  int selectedIndex() const;
  int workspaceIndexOfSurface(const string &surfaceId) const;
  string resolveSurface(const optional<string> &surfaceRef) const;
  bool isPlaced(const string &surfaceId) const;
  string createSurface(PanelType type);
  void destroySurface(const string &surfaceId);
  void commitTree(Workspace *workspace, const SplitTree &tree,
                  const string &context);
  void closeWorkspaceAt(int index);
  /** @brief Hands focus to the selected workspace's last focused surface. */
  void refocusSelected();
  FocusChange explicitFocus(const string &surfaceId);
  void handOffFocus(const optional<string> &surfaceId);
  void focusWorkspace(int index);
  void onSurfaceExited(const string &surfaceId);

  mutable std::shared_mutex sessionMutex;
  vector<Workspace> workspaces;
  string selectedWorkspaceId;
  SurfaceRegistry registry;
  FocusState focus;
  DragSession dragSession;
  diagnostics::DiagnosticCounters diagnostics;
  shared_ptr<TerminalEngine> engine;
  bool appActive;
  optional<bool> appFocusOverride;
  int nextWorkspaceNumber;
  bool running;
};
}  // namespace cmux

#endif  // __CMUX_SESSION__
