#ifndef __CMUX_FOCUS_STATE__
#define __CMUX_FOCUS_STATE__

#include "Headers.hpp"
#include "SurfaceRegistry.hpp"

namespace cmux {
struct Notification {
  string id;
  string surfaceId;
  string workspaceId;
  string title;
  string kind;
  string body;
  bool isRead;
  time_t createdAt;
};

/** @brief Result of an explicit focus request. */
struct FocusChange {
  optional<string> previous;
  string current;
};

/**
 * @brief Tracks the single focused surface and the notifications routed to
 * surfaces.
 *
 * A notification goes from unread to read only when its surface becomes
 * focused. Not thread safe: the session calls mutators under its exclusive
 * lock.
 */
class FocusState {
 public:
  /**
   * @param _registry Source of surface flash counters.
   * @param _isPlaced Returns true if a surface is in some workspace's tree.
   */
  FocusState(SurfaceRegistry* _registry,
             function<bool(const string&)> _isPlaced)
      : registry(_registry), isPlaced(_isPlaced) {}

  /**
   * @brief Explicit focus request. Marks every unread notification of the
   * target read and flashes the target exactly once.
   * @throws SessionError(NotFound) if the surface is not in any tree.
   */
  FocusChange focus(const string& surfaceId);

  /**
   * @brief Moves focus as a consequence of a structural change (a new split,
   * a new workspace, the focused surface closing). Marks notifications read
   * but does not flash. An empty target leaves nothing focused.
   */
  void handOff(const optional<string>& surfaceId);

  /**
   * @brief Routes a new unread notification to a surface.
   * @return The notification id.
   * @throws SessionError(NotFound) if the surface is not in any tree.
   */
  string notify(const string& surfaceId, const string& workspaceId,
                const string& title, const string& kind, const string& body);

  /** @brief Flashes a surface without touching focus or notifications. */
  int64_t triggerFlash(const string& surfaceId);

  int64_t flashCount(const string& surfaceId) const;

  /** @brief All notifications, newest first. */
  vector<Notification> listNotifications() const;

  /** @throws SessionError(NotFound) for an unknown notification id. */
  bool isRead(const string& notificationId) const;

  /** @throws SessionError(NotFound) for an unknown notification id. */
  string surfaceForNotification(const string& notificationId) const;

  bool hasUnread(const string& surfaceId) const;

  /** @return The number of notifications removed. */
  int clearNotifications();
  void clearNotificationsFor(const set<string>& surfaceIds);

  /** @brief Drops the focus pointer if it refers to a closed surface. */
  void forget(const string& surfaceId);

  optional<string> getFocused() const { return focused; }
  bool isFocused(const string& surfaceId) const {
    return focused && *focused == surfaceId;
  }

 protected:
  void markRead(const string& surfaceId);

  SurfaceRegistry* registry;
  function<bool(const string&)> isPlaced;
  optional<string> focused;
  deque<Notification> notifications;
};
}  // namespace cmux

#endif  // __CMUX_FOCUS_STATE__
