#ifndef __CMUX_PTY_TERMINAL__
#define __CMUX_PTY_TERMINAL__

#include "Headers.hpp"

namespace cmux {
/**
 * @brief Spawns a shell on a pseudo-terminal and keeps a bounded scrollback
 * of what it prints.
 */
class PtyTerminal {
 public:
  PtyTerminal();
  ~PtyTerminal();

  /** @brief Forks `shell` as a login shell connected to a new pty. */
  void start(const string &shell);
  /**
   * @brief Drains whatever the pty has ready, appending it to the scrollback.
   * @return The bytes that were read (empty if none or the shell exited).
   */
  string poll();
  /** @brief Writes raw bytes into the running terminal. */
  void appendData(const string &data);
  /** @brief Kills the child and closes the master side. */
  void stop();

  inline bool isRunning() const { return run; }
  inline int getMasterFd() const { return masterFd; }
  /** @brief The scrollback joined with newlines. */
  string getText() const;

 protected:
  /** @brief Master fd used to read/write the PTY. */
  int masterFd;
  /** @brief Child process ID of the shell. */
  pid_t childPid;
  bool run;
  /** @brief Recent lines that have been read from the PTY. */
  deque<string> buffer;
  int64_t bufferLength;
};
}  // namespace cmux

#endif  // __CMUX_PTY_TERMINAL__
