#include "Session.hpp"

namespace cmux {
typedef std::unique_lock<std::shared_mutex> WriteLock;
typedef std::shared_lock<std::shared_mutex> ReadLock;

Session::Session(shared_ptr<TerminalEngine> _engine)
    : focus(&registry,
            [this](const string &surfaceId) { return isPlaced(surfaceId); }),
      engine(_engine),
      appActive(false),
      nextWorkspaceNumber(1),
      running(true) {
  if (engine.get()) {
    engine->setDrawCallback(
        [this](const string &surfaceId) { recordDraw(surfaceId); });
    engine->setExitCallback(
        [this](const string &surfaceId) { onSurfaceExited(surfaceId); });
  }
  WriteLock lock(sessionMutex);
  createWorkspaceLocked();
}

Session::~Session() { shutdown(); }

void Session::shutdown() {
  {
    WriteLock lock(sessionMutex);
    if (!running) {
      return;
    }
    running = false;
  }
  // Without the session lock: the engine's threads may be blocked on it
  if (engine.get()) {
    engine->shutdown();
  }
  WriteLock lock(sessionMutex);
  for (auto &workspace : workspaces) {
    for (const auto &surfaceId : workspace.tree.leaves()) {
      registry.destroy(surfaceId);
    }
  }
  workspaces.clear();
  selectedWorkspaceId.clear();
  focus.handOff(nullopt);
  focus.clearNotifications();
  LOG(INFO) << "Session shut down";
}

CreatedSurface Session::newWorkspace() {
  WriteLock lock(sessionMutex);
  checkRunning();
  return createWorkspaceLocked();
}

string Session::selectWorkspace(const string &workspaceRef) {
  WriteLock lock(sessionMutex);
  checkRunning();
  int index = workspaceIndexOf(workspaceRef);
  focusWorkspace(index);
  return workspaces[index].id;
}

string Session::closeWorkspace(const optional<string> &workspaceRef) {
  WriteLock lock(sessionMutex);
  checkRunning();
  int index = workspaceRef ? workspaceIndexOf(*workspaceRef) : selectedIndex();
  if (workspaces.size() <= 1) {
    throw SessionError(ErrorKind::InvalidState,
                       "Cannot close the last workspace");
  }
  closeWorkspaceAt(index);
  return selectedWorkspaceId;
}

vector<WorkspaceInfo> Session::listWorkspaces() const {
  ReadLock lock(sessionMutex);
  vector<WorkspaceInfo> result;
  for (size_t i = 0; i < workspaces.size(); i++) {
    const auto &workspace = workspaces[i];
    result.push_back({int(i), workspace.id, workspace.title,
                      workspace.id == selectedWorkspaceId,
                      int(workspace.tree.leaves().size()),
                      workspace.createdAt});
  }
  return result;
}

WorkspaceInfo Session::currentWorkspace() const {
  ReadLock lock(sessionMutex);
  checkRunning();
  int index = selectedIndex();
  const auto &workspace = workspaces[index];
  return {index,
          workspace.id,
          workspace.title,
          true,
          int(workspace.tree.leaves().size()),
          workspace.createdAt};
}

CreatedSurface Session::newSplit(SplitDirection direction,
                                 const optional<string> &surfaceRef) {
  WriteLock lock(sessionMutex);
  checkRunning();
  string target = resolveSurface(surfaceRef);
  int index = workspaceIndexOfSurface(target);
  Workspace *workspace = &workspaces[index];

  string newSurfaceId = createSurface(TERMINAL_PANEL);
  commitTree(workspace, workspace->tree.split(target, direction, newSurfaceId),
             "split " + splitDirectionName(direction) + " of " + target);
  selectedWorkspaceId = workspace->id;
  handOffFocus(newSurfaceId);
  return {workspace->id, newSurfaceId};
}

CreatedSurface Session::newSurface(PanelType type,
                                   const optional<string> &surfaceRef) {
  WriteLock lock(sessionMutex);
  checkRunning();
  Workspace *workspace = &workspaces[selectedIndex()];
  if (workspace->tree.empty() && !surfaceRef) {
    string newSurfaceId = createSurface(type);
    commitTree(workspace, SplitTree::withLeaf(newSurfaceId),
               "new root surface " + newSurfaceId);
    handOffFocus(newSurfaceId);
    return {workspace->id, newSurfaceId};
  }

  string target;
  if (surfaceRef) {
    target = resolveSurface(surfaceRef);
  } else {
    auto focused = focus.getFocused();
    target = (focused && workspace->tree.contains(*focused))
                 ? *focused
                 : workspace->tree.leaves().back();
  }
  workspace = &workspaces[workspaceIndexOfSurface(target)];
  string newSurfaceId = createSurface(type);
  commitTree(workspace,
             workspace->tree.split(target, SplitDirection::Right, newSurfaceId),
             "new surface next to " + target);
  selectedWorkspaceId = workspace->id;
  handOffFocus(newSurfaceId);
  return {workspace->id, newSurfaceId};
}

string Session::closeSurface(const optional<string> &surfaceRef) {
  WriteLock lock(sessionMutex);
  checkRunning();
  string target = resolveSurface(surfaceRef);
  int index = workspaceIndexOfSurface(target);
  Workspace *workspace = &workspaces[index];

  bool wasFocused = focus.isFocused(target);
  optional<string> successor = workspace->tree.successorOf(target);
  commitTree(workspace, workspace->tree.remove(target), "close " + target);
  if (workspace->lastFocused && *workspace->lastFocused == target) {
    workspace->lastFocused = successor;
  }
  destroySurface(target);

  if (workspace->tree.empty() && workspaces.size() > 1) {
    LOG(INFO) << "Workspace " << workspace->id << " has no surfaces left";
    closeWorkspaceAt(index);
    if (wasFocused && !focus.getFocused()) {
      refocusSelected();
    }
  } else if (wasFocused) {
    handOffFocus(successor);
  }
  return target;
}

FocusChange Session::focusSurface(const string &surfaceRef) {
  WriteLock lock(sessionMutex);
  checkRunning();
  string target = resolveSurface(surfaceRef);
  selectedWorkspaceId = workspaces[workspaceIndexOfSurface(target)].id;
  return explicitFocus(target);
}

optional<FocusChange> Session::focusDirection(SplitDirection direction) {
  WriteLock lock(sessionMutex);
  checkRunning();
  string current = resolveSurface(nullopt);
  const Workspace &workspace = workspaces[workspaceIndexOfSurface(current)];
  optional<string> next = workspace.tree.neighbor(current, direction);
  if (!next) {
    return nullopt;
  }
  return explicitFocus(*next);
}

optional<string> Session::getFocusedSurface() const {
  ReadLock lock(sessionMutex);
  return focus.getFocused();
}

vector<SurfaceInfo> Session::listSurfaces(
    const optional<string> &workspaceRef) const {
  ReadLock lock(sessionMutex);
  checkRunning();
  const Workspace &workspace =
      workspaces[workspaceRef ? workspaceIndexOf(*workspaceRef)
                              : selectedIndex()];
  vector<SurfaceInfo> result;
  vector<string> leaves = workspace.tree.leaves();
  for (size_t i = 0; i < leaves.size(); i++) {
    result.push_back({int(i), leaves[i], workspace.id,
                      registry.get(leaves[i]).type,
                      focus.isFocused(leaves[i])});
  }
  return result;
}

vector<SurfaceHealth> Session::surfaceHealth(
    const optional<string> &workspaceRef) const {
  ReadLock lock(sessionMutex);
  checkRunning();
  const Workspace &workspace =
      workspaces[workspaceRef ? workspaceIndexOf(*workspaceRef)
                              : selectedIndex()];
  bool visible = workspace.id == selectedWorkspaceId;
  vector<SurfaceHealth> result;
  vector<string> leaves = workspace.tree.leaves();
  for (size_t i = 0; i < leaves.size(); i++) {
    PanelType type = registry.get(leaves[i]).type;
    bool portal = false;
    if (capabilitiesFor(type).portalHosted && engine.get()) {
      portal = engine->isPortalHosted(leaves[i], visible);
    }
    result.push_back({int(i), leaves[i], type, visible, portal,
                      workspace.tree.depthOf(leaves[i])});
  }
  return result;
}

json Session::layout(const optional<string> &workspaceRef) const {
  ReadLock lock(sessionMutex);
  checkRunning();
  const Workspace &workspace =
      workspaces[workspaceRef ? workspaceIndexOf(*workspaceRef)
                              : selectedIndex()];
  json result;
  result["workspace"] = workspace.id;
  result["root"] = workspace.tree.toJson();
  return result;
}

string Session::notifySurface(const optional<string> &surfaceRef,
                              const string &title, const string &kind,
                              const string &body) {
  WriteLock lock(sessionMutex);
  checkRunning();
  string target = resolveSurface(surfaceRef);
  const Workspace &workspace = workspaces[workspaceIndexOfSurface(target)];
  return focus.notify(target, workspace.id, title, kind, body);
}

vector<Notification> Session::listNotifications() const {
  ReadLock lock(sessionMutex);
  return focus.listNotifications();
}

int Session::clearNotifications() {
  WriteLock lock(sessionMutex);
  return focus.clearNotifications();
}

FocusChange Session::focusNotification(const string &notificationId) {
  WriteLock lock(sessionMutex);
  checkRunning();
  string target = focus.surfaceForNotification(notificationId);
  selectedWorkspaceId = workspaces[workspaceIndexOfSurface(target)].id;
  return explicitFocus(target);
}

bool Session::isNotificationRead(const string &notificationId) const {
  ReadLock lock(sessionMutex);
  return focus.isRead(notificationId);
}

void Session::resetFlashCounts() {
  WriteLock lock(sessionMutex);
  registry.resetFlashCounts();
}

int64_t Session::flashCount(const string &surfaceRef) const {
  ReadLock lock(sessionMutex);
  checkRunning();
  return focus.flashCount(resolveSurface(surfaceRef));
}

int64_t Session::triggerFlash(const string &surfaceRef) {
  WriteLock lock(sessionMutex);
  checkRunning();
  return focus.triggerFlash(resolveSurface(surfaceRef));
}

SurfaceMetrics Session::renderStats(const optional<string> &surfaceRef) const {
  ReadLock lock(sessionMutex);
  checkRunning();
  return registry.get(resolveSurface(surfaceRef));
}

bool Session::recordDraw(const string &surfaceId) {
  ReadLock lock(sessionMutex);
  if (!registry.exists(surfaceId)) {
    VLOG(2) << "Dropping draw for closed surface " << surfaceId;
    return false;
  }
  registry.incrementDraw(surfaceId);
  return true;
}

string Session::readText(const optional<string> &surfaceRef) {
  string target;
  {
    ReadLock lock(sessionMutex);
    checkRunning();
    target = resolveSurface(surfaceRef);
  }
  if (!engine.get()) {
    throw SessionError(ErrorKind::Unsupported,
                       "No terminal engine is configured");
  }
  return engine->readText(target);
}

string Session::sendText(const optional<string> &surfaceRef,
                         const string &text) {
  string target;
  {
    ReadLock lock(sessionMutex);
    checkRunning();
    target = resolveSurface(surfaceRef);
    if (!capabilitiesFor(registry.get(target).type).acceptsInput) {
      throw SessionError(ErrorKind::InvalidState,
                         "Surface " + target + " does not accept input");
    }
  }
  if (!engine.get()) {
    throw SessionError(ErrorKind::Unsupported,
                       "No terminal engine is configured");
  }
  // The engine may call back into the session, so no lock is held here
  engine->sendText(target, text);
  return target;
}

void Session::seedDragPasteboard(DragPasteboardKind kind) {
  dragSession.seed(kind);
}

void Session::clearDragPasteboard() { dragSession.clear(); }

DragPasteboardKind Session::getDragPasteboard() const {
  return dragSession.get();
}

bool Session::overlayHitGate(PointerEventKind eventKind) const {
  return shouldCaptureHitTest(eventKind, dragSession.get());
}

void Session::activateApp() {
  WriteLock lock(sessionMutex);
  appActive = true;
}

void Session::setAppFocusOverride(const optional<bool> &value) {
  WriteLock lock(sessionMutex);
  appFocusOverride = value;
}

optional<bool> Session::getAppFocusOverride() const {
  ReadLock lock(sessionMutex);
  return appFocusOverride;
}

bool Session::isAppFocused() const {
  ReadLock lock(sessionMutex);
  return appFocusOverride.value_or(appActive);
}

void Session::checkRunning() const {
  if (!running) {
    throw SessionError(ErrorKind::InvalidState, "Session is shut down");
  }
}

CreatedSurface Session::createWorkspaceLocked() {
  Workspace workspace;
  workspace.id = sole::uuid4().str();
  workspace.title = "Terminal " + to_string(nextWorkspaceNumber++);
  workspace.createdAt = time(NULL);
  string surfaceId = createSurface(TERMINAL_PANEL);
  workspace.tree = SplitTree::withLeaf(surfaceId);
  workspaces.push_back(workspace);
  selectedWorkspaceId = workspace.id;
  handOffFocus(surfaceId);
  LOG(INFO) << "Created workspace " << workspace.id << " (" << workspace.title
            << ")";
  return {workspace.id, surfaceId};
}

int Session::workspaceIndexOf(const string &workspaceRef) const {
  string ref = trim(workspaceRef);
  if (isNonNegativeInteger(ref)) {
    size_t index = stoul(ref);
    if (index < workspaces.size()) {
      return int(index);
    }
  } else {
    for (size_t i = 0; i < workspaces.size(); i++) {
      if (workspaces[i].id == ref) {
        return int(i);
      }
    }
  }
  throw SessionError(ErrorKind::NotFound, "Workspace not found: " + ref);
}

int Session::selectedIndex() const {
  for (size_t i = 0; i < workspaces.size(); i++) {
    if (workspaces[i].id == selectedWorkspaceId) {
      return int(i);
    }
  }
  throw SessionError(ErrorKind::InvalidState, "No workspace is selected");
}

int Session::workspaceIndexOfSurface(const string &surfaceId) const {
  for (size_t i = 0; i < workspaces.size(); i++) {
    if (workspaces[i].tree.contains(surfaceId)) {
      return int(i);
    }
  }
  throw SessionError(ErrorKind::NotFound, "Surface not found: " + surfaceId);
}

string Session::resolveSurface(const optional<string> &surfaceRef) const {
  if (!surfaceRef) {
    auto focused = focus.getFocused();
    if (!focused) {
      throw SessionError(ErrorKind::InvalidState, "No surface is focused");
    }
    return *focused;
  }
  string ref = trim(*surfaceRef);
  if (isNonNegativeInteger(ref)) {
    vector<string> leaves = workspaces[selectedIndex()].tree.leaves();
    size_t index = stoul(ref);
    if (index < leaves.size()) {
      return leaves[index];
    }
    throw SessionError(ErrorKind::NotFound,
                       "No surface at index " + ref + " (workspace has " +
                           to_string(leaves.size()) + ")");
  }
  if (!isPlaced(ref)) {
    throw SessionError(ErrorKind::NotFound, "Surface not found: " + ref);
  }
  return ref;
}

bool Session::isPlaced(const string &surfaceId) const {
  for (const auto &workspace : workspaces) {
    if (workspace.tree.contains(surfaceId)) {
      return true;
    }
  }
  return false;
}

string Session::createSurface(PanelType type) {
  string surfaceId = registry.create(type);
  if (engine.get()) {
    try {
      engine->attach(surfaceId, type);
    } catch (const std::runtime_error &ex) {
      registry.destroy(surfaceId);
      throw SessionError(ErrorKind::InvalidState,
                         string("Could not start surface: ") + ex.what());
    }
  }
  return surfaceId;
}

void Session::destroySurface(const string &surfaceId) {
  if (engine.get()) {
    engine->detach(surfaceId);
  }
  focus.forget(surfaceId);
  focus.clearNotificationsFor({surfaceId});
  registry.destroy(surfaceId);
}

void Session::commitTree(Workspace *workspace, const SplitTree &tree,
                         const string &context) {
  diagnostics.recordSplitUnderflow(tree.countUnderflows(), context);
  workspace->tree = tree;
  VLOG(2) << "Layout of " << workspace->id << " after " << context << ": "
          << tree.toJson().dump();
}

void Session::closeWorkspaceAt(int index) {
  Workspace closing = workspaces[index];
  bool wasSelected = closing.id == selectedWorkspaceId;
  bool hadFocus = false;
  for (const auto &surfaceId : closing.tree.leaves()) {
    hadFocus = hadFocus || focus.isFocused(surfaceId);
    destroySurface(surfaceId);
  }
  workspaces.erase(workspaces.begin() + index);
  LOG(INFO) << "Closed workspace " << closing.id;
  if (workspaces.empty()) {
    selectedWorkspaceId.clear();
    focus.handOff(nullopt);
    return;
  }
  if (wasSelected || hadFocus) {
    int next = index > 0 ? index - 1 : 0;
    selectedWorkspaceId = workspaces[next].id;
    refocusSelected();
  }
}

void Session::refocusSelected() {
  const Workspace &workspace = workspaces[selectedIndex()];
  optional<string> target = workspace.lastFocused;
  if (!target && !workspace.tree.empty()) {
    target = workspace.tree.leaves().front();
  }
  handOffFocus(target);
}

FocusChange Session::explicitFocus(const string &surfaceId) {
  FocusChange change = focus.focus(surfaceId);
  workspaces[workspaceIndexOfSurface(surfaceId)].lastFocused = surfaceId;
  return change;
}

void Session::handOffFocus(const optional<string> &surfaceId) {
  focus.handOff(surfaceId);
  if (surfaceId) {
    workspaces[workspaceIndexOfSurface(*surfaceId)].lastFocused = surfaceId;
  }
}

void Session::focusWorkspace(int index) {
  Workspace &workspace = workspaces[index];
  selectedWorkspaceId = workspace.id;
  optional<string> target = workspace.lastFocused;
  if (!target && !workspace.tree.empty()) {
    target = workspace.tree.leaves().front();
  }
  if (target) {
    explicitFocus(*target);
  } else {
    focus.handOff(nullopt);
  }
}

void Session::onSurfaceExited(const string &surfaceId) {
  try {
    closeSurface(surfaceId);
    LOG(INFO) << "Closed surface " << surfaceId << " after its process exited";
  } catch (const SessionError &ex) {
    // Already closed by a command
    VLOG(1) << "Exit of " << surfaceId << " ignored: " << ex.what();
  }
}
}  // namespace cmux
