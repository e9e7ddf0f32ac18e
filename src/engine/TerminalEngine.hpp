#ifndef __CMUX_TERMINAL_ENGINE__
#define __CMUX_TERMINAL_ENGINE__

#include "Headers.hpp"
#include "SessionError.hpp"

namespace cmux {
/**
 * @brief Boundary to the terminal emulation/rendering engine that backs
 * surfaces.
 *
 * The session attaches every surface it creates and detaches every surface it
 * destroys. Engines report content changes through the draw callback and a
 * terminal whose process ended through the exit callback.
 *
 * attach() and detach() are called with the session's exclusive lock held, so
 * they must never invoke either callback synchronously. Callbacks must also be
 * invoked without any engine-internal lock held, since the session may call
 * back into the engine from them.
 */
class TerminalEngine {
 public:
  typedef function<void(const string &)> SurfaceCallback;

  virtual ~TerminalEngine() {}

  virtual string getName() const = 0;

  virtual void attach(const string &surfaceId, PanelType type) = 0;
  virtual void detach(const string &surfaceId) = 0;

  /**
   * @brief Returns the visible text of a surface.
   * @throws SessionError(NotFound) for an unknown surface and
   * SessionError(InvalidState) for a surface without text content.
   */
  virtual string readText(const string &surfaceId) = 0;

  /**
   * @brief Delivers input to a surface as if typed.
   * @throws SessionError(NotFound) or SessionError(InvalidState) as readText.
   */
  virtual void sendText(const string &surfaceId, const string &text) = 0;

  /**
   * @brief Whether the surface's view is currently hosted in the window
   * portal. Only surfaces in the selected workspace are visible.
   */
  virtual bool isPortalHosted(const string &surfaceId, bool visible) = 0;

  /** @brief Stops background work. No callback is invoked afterwards. */
  virtual void shutdown() = 0;

  void setDrawCallback(SurfaceCallback callback) { onDraw = callback; }
  void setExitCallback(SurfaceCallback callback) { onExit = callback; }

 protected:
  void reportDraw(const string &surfaceId) {
    if (onDraw) {
      onDraw(surfaceId);
    }
  }

  void reportExit(const string &surfaceId) {
    if (onExit) {
      onExit(surfaceId);
    }
  }

  SurfaceCallback onDraw;
  SurfaceCallback onExit;
};

/**
 * @brief Builds the engine named in the configuration: "headless", "pty" or
 * "none" (returns null).
 * @throws ConfigurationError for any other name.
 */
shared_ptr<TerminalEngine> createTerminalEngine(const string &name,
                                                const string &shell);
}  // namespace cmux

#endif  // __CMUX_TERMINAL_ENGINE__
