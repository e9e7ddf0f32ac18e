#include "PtyTerminal.hpp"

namespace cmux {
#define BUF_SIZE (16 * 1024)
#define MAX_BUFFER_LINES (1024)
#define MAX_BUFFER_CHARS (128 * MAX_BUFFER_LINES)

PtyTerminal::PtyTerminal()
    : masterFd(-1), childPid(-1), run(false), bufferLength(0) {}

PtyTerminal::~PtyTerminal() {
  if (masterFd >= 0) {
    stop();
  }
}

void PtyTerminal::start(const string &shell) {
  winsize initialSize;
  memset(&initialSize, 0, sizeof(initialSize));
  initialSize.ws_col = 80;
  initialSize.ws_row = 24;
  // Resolved before forking: the daemon is multithreaded
  string homeDir;
  passwd *pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_dir != NULL) {
    homeDir = pwd->pw_dir;
  }
  pid_t pid = forkpty(&masterFd, NULL, NULL, &initialSize);
  switch (pid) {
    case -1:
      FATAL_FAIL(pid);
    case 0: {
      if (!homeDir.empty() && chdir(homeDir.c_str()) == -1) {
        // Stay in the daemon's working directory
      }
      setenv("CMUX_VERSION", CMUX_VERSION, 1);
      setenv("TERM", "xterm-256color", 1);
      execl(shell.c_str(), shell.c_str(), "-l", (char *)NULL);
      _exit(127);
    }
    default: {
      // parent
      VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
      childPid = pid;
      run = true;
      int opts = fcntl(masterFd, F_GETFL);
      FATAL_FAIL(opts);
      FATAL_FAIL(fcntl(masterFd, F_SETFL, opts | O_NONBLOCK));
      break;
    }
  }
}

string PtyTerminal::poll() {
  if (!run) {
    return string();
  }
  char b[BUF_SIZE];
  ssize_t rc = ::read(masterFd, b, BUF_SIZE);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return string();
    }
    // EIO: the slave side closed because the shell exited
    VLOG(1) << "Terminal read failed: " << strerror(localErrno);
    rc = 0;
  }
  if (rc == 0) {
    LOG(INFO) << "Terminal session ended for pid " << childPid;
    // The slave side is gone, so the shell is exiting: reap it
    siginfo_t childInfo;
    int waitResult = waitid(P_PID, childPid, &childInfo, WEXITED);
    if (waitResult < 0 && GetErrno() != ECHILD) {
      FATAL_FAIL(waitResult);
    }
    run = false;
    return string();
  }

  string newChars(b, rc);
  vector<string> tokens = split(newChars, '\n');
  if (!newChars.empty() && newChars.back() == '\n') {
    // Start a fresh line for the next chunk
    tokens.push_back(string());
  }
  for (auto &it : tokens) {
    bufferLength += it.length();
  }
  if (buffer.empty() || tokens.empty()) {
    buffer.insert(buffer.end(), tokens.begin(), tokens.end());
  } else {
    buffer.back().append(tokens.front());
    buffer.insert(buffer.end(), tokens.begin() + 1, tokens.end());
  }
  while (buffer.size() > MAX_BUFFER_LINES ||
         (bufferLength > MAX_BUFFER_CHARS && !buffer.empty())) {
    bufferLength -= buffer.front().length();
    buffer.pop_front();
  }
  VLOG(2) << "Buffered lines: " << buffer.size();
  return newChars;
}

void PtyTerminal::appendData(const string &data) {
  size_t pos = 0;
  time_t startTime = time(NULL);
  while (pos < data.length()) {
    ssize_t written = ::write(masterFd, data.data() + pos, data.length() - pos);
    if (written < 0) {
      auto localErrno = GetErrno();
      if ((localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
           localErrno == EINTR) &&
          time(NULL) < startTime + 5) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      throw std::runtime_error(string("Failed writing to terminal: ") +
                               strerror(localErrno));
    }
    pos += written;
  }
}

void PtyTerminal::stop() {
  if (run) {
    kill(childPid, SIGKILL);
    siginfo_t childInfo;
    int waitResult = waitid(P_PID, childPid, &childInfo, WEXITED);
    if (waitResult < 0 && GetErrno() != ECHILD) {
      FATAL_FAIL(waitResult);
    }
  }
  run = false;
  if (masterFd >= 0) {
    FATAL_FAIL(::close(masterFd));
    masterFd = -1;
  }
}

string PtyTerminal::getText() const {
  string text;
  for (size_t i = 0; i < buffer.size(); i++) {
    if (i > 0) {
      text.append(1, '\n');
    }
    text.append(buffer[i]);
  }
  return text;
}
}  // namespace cmux
