#include "SurfaceRegistry.hpp"

namespace cmux {
PanelCapabilities capabilitiesFor(PanelType type) {
  switch (type) {
    case TERMINAL_PANEL:
      return {true, true, true};
    case BROWSER_PANEL:
      return {true, false, false};
  }
  STFATAL << "Invalid panel type: " << int(type);
  return {false, false, false};
}

string panelTypeName(PanelType type) {
  switch (type) {
    case TERMINAL_PANEL:
      return "terminal";
    case BROWSER_PANEL:
      return "browser";
  }
  return "unknown";
}

PanelType parsePanelType(const string& name) {
  string lower = toLower(trim(name));
  if (lower == "terminal") {
    return TERMINAL_PANEL;
  }
  if (lower == "browser") {
    return BROWSER_PANEL;
  }
  throw SessionError(ErrorKind::InvalidArgument,
                     "Unknown panel type: '" + name + "'");
}

string SurfaceRegistry::create(PanelType type) {
  string id = sole::uuid4().str();
  surfaces[id] = shared_ptr<Surface>(new Surface(id, type));
  VLOG(1) << "Created " << panelTypeName(type) << " surface " << id;
  return id;
}

void SurfaceRegistry::destroy(const string& id) {
  auto it = surfaces.find(id);
  if (it == surfaces.end()) {
    throw SessionError(ErrorKind::NotFound, "Surface not found: " + id);
  }
  surfaces.erase(it);
  VLOG(1) << "Destroyed surface " << id;
}

int64_t SurfaceRegistry::incrementDraw(const string& id) {
  return ++(find(id)->drawCount);
}

int64_t SurfaceRegistry::incrementFlash(const string& id) {
  return ++(find(id)->flashCount);
}

SurfaceMetrics SurfaceRegistry::get(const string& id) const {
  auto surface = find(id);
  return {surface->id, surface->type, surface->drawCount.load(),
          surface->flashCount.load()};
}

bool SurfaceRegistry::exists(const string& id) const {
  return surfaces.find(id) != surfaces.end();
}

void SurfaceRegistry::resetFlashCounts() {
  for (auto& it : surfaces) {
    it.second->flashCount = 0;
  }
}

shared_ptr<SurfaceRegistry::Surface> SurfaceRegistry::find(
    const string& id) const {
  auto it = surfaces.find(id);
  if (it == surfaces.end()) {
    throw SessionError(ErrorKind::NotFound, "Surface not found: " + id);
  }
  return it->second;
}
}  // namespace cmux
