#ifndef __CMUX_SURFACE_REGISTRY__
#define __CMUX_SURFACE_REGISTRY__

#include "Headers.hpp"
#include "SessionError.hpp"

namespace cmux {
/**
 * @brief Fixed capability set of a panel type.
 */
struct PanelCapabilities {
  bool renders;
  bool acceptsInput;
  // The view is attached through a portal near the window root
  bool portalHosted;
};

PanelCapabilities capabilitiesFor(PanelType type);

string panelTypeName(PanelType type);

/**
 * @brief Parses "terminal" or "browser".
 * @throws SessionError(InvalidArgument) for any other name.
 */
PanelType parsePanelType(const string& name);

/** @brief Point-in-time copy of a surface's counters. */
struct SurfaceMetrics {
  string id;
  PanelType type;
  int64_t drawCount;
  int64_t flashCount;
};

/**
 * @brief Owns surface identity and per-surface counters.
 *
 * Structural calls (create, destroy, resetFlashCounts) are made under the
 * session's exclusive lock. The counter increments are atomic and may be
 * called with only the shared lock held.
 */
class SurfaceRegistry {
 public:
  SurfaceRegistry() {}

  /**
   * @brief Registers a new surface.
   * @return Its id (a random uuid).
   */
  string create(PanelType type);
  /** @throws SessionError(NotFound) for an unknown id. */
  void destroy(const string& id);
  /** @throws SessionError(NotFound) for an unknown id. */
  int64_t incrementDraw(const string& id);
  /** @throws SessionError(NotFound) for an unknown id. */
  int64_t incrementFlash(const string& id);
  /** @throws SessionError(NotFound) for an unknown id. */
  SurfaceMetrics get(const string& id) const;
  bool exists(const string& id) const;
  /** @brief Zeroes the flash counter of every surface. */
  void resetFlashCounts();
  size_t numSurfaces() const { return surfaces.size(); }

 protected:
  struct Surface {
    Surface(const string& _id, PanelType _type)
        : id(_id), type(_type), drawCount(0), flashCount(0) {}
    string id;
    PanelType type;
    atomic<int64_t> drawCount;
    atomic<int64_t> flashCount;
  };

  shared_ptr<Surface> find(const string& id) const;

  map<string, shared_ptr<Surface>> surfaces;
};
}  // namespace cmux

#endif  // __CMUX_SURFACE_REGISTRY__
