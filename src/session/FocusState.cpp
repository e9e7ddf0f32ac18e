#include "FocusState.hpp"

namespace cmux {
FocusChange FocusState::focus(const string& surfaceId) {
  if (!isPlaced(surfaceId)) {
    throw SessionError(ErrorKind::NotFound, "Surface not found: " + surfaceId);
  }
  FocusChange change;
  change.previous = focused;
  change.current = surfaceId;
  focused = surfaceId;
  markRead(surfaceId);
  registry->incrementFlash(surfaceId);
  VLOG(1) << "Focused surface " << surfaceId;
  return change;
}

void FocusState::handOff(const optional<string>& surfaceId) {
  focused = surfaceId;
  if (surfaceId) {
    markRead(*surfaceId);
    VLOG(1) << "Focus handed off to " << *surfaceId;
  } else {
    VLOG(1) << "No surface is focused";
  }
}

string FocusState::notify(const string& surfaceId, const string& workspaceId,
                          const string& title, const string& kind,
                          const string& body) {
  if (!isPlaced(surfaceId)) {
    throw SessionError(ErrorKind::NotFound, "Surface not found: " + surfaceId);
  }
  Notification notification;
  notification.id = sole::uuid4().str();
  notification.surfaceId = surfaceId;
  notification.workspaceId = workspaceId;
  notification.title = title;
  notification.kind = kind;
  notification.body = body;
  notification.isRead = false;
  notification.createdAt = time(NULL);
  notifications.push_front(notification);
  VLOG(1) << "Notification " << notification.id << " for surface "
          << surfaceId << ": " << title;
  return notification.id;
}

int64_t FocusState::triggerFlash(const string& surfaceId) {
  return registry->incrementFlash(surfaceId);
}

int64_t FocusState::flashCount(const string& surfaceId) const {
  return registry->get(surfaceId).flashCount;
}

vector<Notification> FocusState::listNotifications() const {
  return vector<Notification>(notifications.begin(), notifications.end());
}

bool FocusState::isRead(const string& notificationId) const {
  for (const auto& it : notifications) {
    if (it.id == notificationId) {
      return it.isRead;
    }
  }
  throw SessionError(ErrorKind::NotFound,
                     "Notification not found: " + notificationId);
}

string FocusState::surfaceForNotification(
    const string& notificationId) const {
  for (const auto& it : notifications) {
    if (it.id == notificationId) {
      return it.surfaceId;
    }
  }
  throw SessionError(ErrorKind::NotFound,
                     "Notification not found: " + notificationId);
}

bool FocusState::hasUnread(const string& surfaceId) const {
  for (const auto& it : notifications) {
    if (it.surfaceId == surfaceId && !it.isRead) {
      return true;
    }
  }
  return false;
}

int FocusState::clearNotifications() {
  int count = int(notifications.size());
  notifications.clear();
  return count;
}

void FocusState::clearNotificationsFor(const set<string>& surfaceIds) {
  notifications.erase(
      std::remove_if(notifications.begin(), notifications.end(),
                     [&surfaceIds](const Notification& n) {
                       return surfaceIds.find(n.surfaceId) != surfaceIds.end();
                     }),
      notifications.end());
}

void FocusState::forget(const string& surfaceId) {
  if (isFocused(surfaceId)) {
    focused.reset();
  }
}

void FocusState::markRead(const string& surfaceId) {
  for (auto& it : notifications) {
    if (it.surfaceId == surfaceId) {
      it.isRead = true;
    }
  }
}
}  // namespace cmux
