#include "UnixPtyBackend.hpp"

#include "RawIoUtils.hpp"

extern char** environ;

namespace ox {
namespace {
enum ChildStage { CHILD_CHDIR = 1, CHILD_EXEC = 2 };

// Written by the child to the status pipe when it cannot exec the shell.
struct ChildFailure {
  int stage;
  int error;
};

[[noreturn]] void runChild(int statusFd, char* const* argv, char* const* envp,
                           const char* workingDirectory) {
  // Only async-signal-safe calls from here on: the parent may have other
  // threads holding locks at the time of the fork.
  static const int resetSignals[] = {SIGCHLD, SIGHUP,  SIGINT,  SIGQUIT,
                                     SIGTERM, SIGTSTP, SIGTTIN, SIGTTOU,
                                     SIGPIPE, SIGWINCH};
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = SIG_DFL;
  sigemptyset(&action.sa_mask);
  for (int signum : resetSignals) {
    sigaction(signum, &action, NULL);
  }
  sigset_t emptySet;
  sigemptyset(&emptySet);
  sigprocmask(SIG_SETMASK, &emptySet, NULL);

  ChildFailure failure;
  if (workingDirectory != NULL && ::chdir(workingDirectory) < 0) {
    failure.stage = CHILD_CHDIR;
    failure.error = errno;
    ssize_t ignored = ::write(statusFd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
  }

  ::execve(argv[0], argv, envp);

  failure.stage = CHILD_EXEC;
  failure.error = errno;
  ssize_t ignored = ::write(statusFd, &failure, sizeof(failure));
  (void)ignored;
  _exit(127);
}

vector<char*> toCharArray(vector<string>& strings) {
  vector<char*> pointers;
  for (auto& s : strings) {
    pointers.push_back(&s[0]);
  }
  pointers.push_back(NULL);
  return pointers;
}
}  // namespace

UnixPtyBackend::UnixPtyBackend()
    : masterFd(-1),
      childPid(-1),
      reaped(false),
      terminated(false),
      stopping(false),
      writesCancelled(false),
      transportClosed(false),
      sink(NULL) {
  wakePipe[0] = -1;
  wakePipe[1] = -1;
}

UnixPtyBackend::~UnixPtyBackend() {
  try {
    terminate();
  } catch (const std::exception& ex) {
    STERROR << "Error while tearing down pty: " << ex.what();
  }
}

vector<string> UnixPtyBackend::buildChildEnvironment() {
  static const vector<string> overridden = {"TERM=", "COLORTERM=",
                                            "OX_TERMINAL="};
  vector<string> env;
  for (char** it = environ; it != NULL && *it != NULL; it++) {
    string entry(*it);
    bool skip = false;
    for (const auto& prefix : overridden) {
      if (entry.compare(0, prefix.size(), prefix) == 0) {
        skip = true;
        break;
      }
    }
    if (!skip) {
      env.push_back(entry);
    }
  }
  env.push_back("TERM=xterm-256color");
  env.push_back("COLORTERM=truecolor");
  env.push_back("OX_TERMINAL=1");
  return env;
}

void UnixPtyBackend::spawn(const Shell& shell, const TerminalSize& size,
                           const string& workingDirectory) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (childPid > 0 || terminated) {
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "spawn",
                       "Backend has already been used");
  }
  if (!size.isValid()) {
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "spawn",
                       "Invalid terminal size " + to_string(size.rows) + "x" +
                           to_string(size.cols));
  }

  // Everything the child touches is prepared before forking.
  vector<string> argvStorage = shell.getArgv();
  vector<char*> argv = toCharArray(argvStorage);
  vector<string> envStorage = buildChildEnvironment();
  vector<char*> envp = toCharArray(envStorage);
  const char* cwd = workingDirectory.empty() ? NULL : workingDirectory.c_str();

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_row = (unsigned short)size.rows;
  win.ws_col = (unsigned short)size.cols;

  int statusPipe[2];
  if (::pipe(statusPipe) < 0) {
    throw PtyException(PtyError::fromLastError(
        PtyErrorCode::SPAWN_FAILED, "pipe", "Cannot create exec status pipe"));
  }
  if (::fcntl(statusPipe[0], F_SETFD, FD_CLOEXEC) < 0 ||
      ::fcntl(statusPipe[1], F_SETFD, FD_CLOEXEC) < 0) {
    PtyError error = PtyError::fromLastError(
        PtyErrorCode::SPAWN_FAILED, "fcntl", "Cannot set FD_CLOEXEC");
    ::close(statusPipe[0]);
    ::close(statusPipe[1]);
    throw PtyException(error);
  }

  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  if (pid < 0) {
    PtyError error = PtyError::fromLastError(PtyErrorCode::SPAWN_FAILED,
                                             "forkpty", "Cannot allocate a pty");
    ::close(statusPipe[0]);
    ::close(statusPipe[1]);
    masterFd = -1;
    throw PtyException(error);
  }
  if (pid == 0) {
    ::close(statusPipe[0]);
    runChild(statusPipe[1], &argv[0], &envp[0], cwd);
  }

  childPid = pid;
  ::close(statusPipe[1]);
  // The write end closes on a successful exec, so this read sees EOF.
  ChildFailure failure;
  ssize_t rc;
  do {
    rc = ::read(statusPipe[0], &failure, sizeof(failure));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(statusPipe[0]);

  if (rc == (ssize_t)sizeof(failure)) {
    reapChild(true);
    closeDescriptors();
    terminated = true;
    string what = failure.stage == CHILD_CHDIR
                      ? "Cannot change directory to " + workingDirectory
                      : "Cannot execute " + shell.getExecutable();
    throw PtyException(PtyErrorCode::SPAWN_FAILED,
                       failure.stage == CHILD_CHDIR ? "chdir" : "exec",
                       what + ": " + strerror(failure.error), failure.error);
  }

  try {
    RawIoUtils::setNonBlocking(masterFd);
    RawIoUtils::setCloseOnExec(masterFd);
    if (::pipe(wakePipe) < 0) {
      throw PtyException(PtyError::fromLastError(
          PtyErrorCode::SPAWN_FAILED, "pipe", "Cannot create wake pipe"));
    }
    RawIoUtils::setNonBlocking(wakePipe[0]);
    RawIoUtils::setNonBlocking(wakePipe[1]);
    RawIoUtils::setCloseOnExec(wakePipe[0]);
    RawIoUtils::setCloseOnExec(wakePipe[1]);
  } catch (const PtyException&) {
    terminate();
    throw;
  }

#ifdef WITH_UTEMPTER
  {
    char buf[1024];
    snprintf(buf, sizeof(buf), "oxterm [%lld]", (long long)getpid());
    utempter_add_record(masterFd, buf);
  }
#endif
  VLOG(1) << "pty opened " << masterFd << " for " << shell << " pid "
          << childPid;
}

void UnixPtyBackend::startReader(PtyOutputSink* _sink) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (masterFd < 0 || readThread) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "startReader",
                       "No pty to read from");
  }
  sink = _sink;
  readThread.reset(new thread(&UnixPtyBackend::readLoop, this));
}

void UnixPtyBackend::readLoop() {
  while (!stopping) {
    pollfd fds[2];
    fds[0].fd = masterFd;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = wakePipe[0];
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "poll on pty failed: " << strerror(GetErrno());
      transportClosed = true;
      break;
    }
    if (fds[1].revents) {
      break;
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
      string chunk;
      bool open = !(fds[0].revents & POLLNVAL) &&
                  RawIoUtils::readAvailable(masterFd, &chunk,
                                            PTY_READ_BUFFER_SIZE);
      if (!chunk.empty()) {
        VLOG(2) << "Read " << chunk.size() << " bytes from pty";
        sink->onOutput(chunk);
      } else if (fds[0].revents & POLLHUP) {
        // Hung up with nothing left to read
        open = false;
      }
      if (!open) {
        transportClosed = true;
        break;
      }
    }
  }
  if (transportClosed && !stopping) {
    LOG(INFO) << "Terminal session ended";
    sink->onTransportClosed(PtyError(PtyErrorCode::PROCESS_EXITED, "read",
                                     "The terminal was closed by the child"));
  }
}

void UnixPtyBackend::write(const string& data) {
  if (masterFd < 0 || terminated) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "write",
                       "The pty is closed");
  }
  RawIoUtils::writeAll(masterFd, data.data(), data.size(), &writesCancelled);
}

void UnixPtyBackend::cancelPendingWrites() { writesCancelled = true; }

string UnixPtyBackend::tryRead() {
  string chunk;
  if (masterFd < 0 || transportClosed) {
    return chunk;
  }
  if (!RawIoUtils::readAvailable(masterFd, &chunk, PTY_READ_BUFFER_SIZE)) {
    transportClosed = true;
  }
  return chunk;
}

void UnixPtyBackend::resize(const TerminalSize& size) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (masterFd < 0 || terminated) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "resize",
                       "The pty is closed");
  }
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_row = (unsigned short)size.rows;
  tmpwin.ws_col = (unsigned short)size.cols;
  if (::ioctl(masterFd, TIOCSWINSZ, &tmpwin) < 0) {
    throw PtyException(PtyError::fromLastError(
        PtyErrorCode::RESIZE_FAILED, "resize", "TIOCSWINSZ failed"));
  }
  VLOG(1) << "pty resized to " << size.rows << "x" << size.cols;
}

void UnixPtyBackend::signal(PtySignal signal) {
  switch (signal) {
    case PtySignal::INTERRUPT:
    case PtySignal::BREAK:
      sendToForeground(SIGINT);
      break;
    case PtySignal::QUIT:
      sendToForeground(SIGQUIT);
      break;
    case PtySignal::SUSPEND:
      sendToForeground(SIGTSTP);
      break;
    case PtySignal::END_OF_INPUT: {
      // EOF is the line discipline's VEOF character, not a signal.
      char eof = 0x04;
      termios attributes;
      if (masterFd >= 0 && ::tcgetattr(masterFd, &attributes) == 0 &&
          attributes.c_cc[VEOF] != _POSIX_VDISABLE) {
        eof = (char)attributes.c_cc[VEOF];
      }
      write(string(1, eof));
      break;
    }
  }
}

void UnixPtyBackend::sendToForeground(int signum) {
  lock_guard<recursive_mutex> guard(processMutex);
  if (masterFd < 0 || childPid <= 0 || reaped) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "signal",
                       "The child has exited");
  }
  pid_t group = ::tcgetpgrp(masterFd);
  if (group <= 0) {
    // The shell is a session leader, so its pid is its process group.
    group = childPid;
  }
  if (::kill(-group, signum) < 0) {
    if (GetErrno() == ESRCH) {
      throw PtyException(PtyErrorCode::PROCESS_EXITED, "signal",
                         "No process to signal", ESRCH);
    }
    throw PtyException(PtyError::fromLastError(
        PtyErrorCode::SIGNAL_UNSUPPORTED, "signal",
        string("Cannot deliver ") + strsignal(signum)));
  }
  VLOG(1) << "Sent " << strsignal(signum) << " to process group " << group;
}

bool UnixPtyBackend::reapChild(bool block) {
  if (reaped) {
    return true;
  }
  if (childPid <= 0) {
    return false;
  }
  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(childPid, &status, block ? 0 : WNOHANG);
  } while (rc < 0 && GetErrno() == EINTR);
  if (rc == childPid) {
    reaped = true;
    if (WIFEXITED(status)) {
      exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exitStatus = 128 + WTERMSIG(status);
    }
    VLOG(1) << "Reaped child " << childPid;
    return true;
  }
  if (rc < 0) {
    // ECHILD: somebody else (SIGCHLD set to SIG_IGN) already reaped it.
    reaped = true;
    return true;
  }
  return false;
}

bool UnixPtyBackend::isAlive() {
  if (transportClosed) {
    return false;
  }
  lock_guard<recursive_mutex> guard(processMutex);
  if (childPid <= 0 || terminated) {
    return false;
  }
  return !reapChild(false);
}

optional<int> UnixPtyBackend::exitCode() {
  lock_guard<recursive_mutex> guard(processMutex);
  reapChild(false);
  return exitStatus;
}

void UnixPtyBackend::terminate() {
  {
    lock_guard<recursive_mutex> guard(processMutex);
    if (terminated) {
      return;
    }
    terminated = true;
    if (childPid > 0 && !reapChild(false)) {
      // Hangup first, like closing a terminal window.
      if (::kill(-childPid, SIGHUP) < 0) {
        ::kill(childPid, SIGHUP);
      }
      auto deadline = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(PTY_TERMINATE_GRACE_MS);
      while (!reapChild(false) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      if (!reaped) {
        LOG(INFO) << "Child " << childPid << " ignored SIGHUP, killing it";
        if (::kill(-childPid, SIGKILL) < 0) {
          ::kill(childPid, SIGKILL);
        }
        reapChild(true);
      }
    }
  }
  stopReader();
  lock_guard<recursive_mutex> guard(processMutex);
  closeDescriptors();
}

void UnixPtyBackend::stopReader() {
  if (!readThread) {
    return;
  }
  stopping = true;
  if (wakePipe[1] >= 0) {
    char c = 0;
    if (::write(wakePipe[1], &c, 1) < 0 && GetErrno() != EAGAIN) {
      STERROR << "Cannot wake pty reader: " << strerror(GetErrno());
    }
  }
  if (readThread->get_id() == std::this_thread::get_id()) {
    readThread->detach();
  } else {
    readThread->join();
  }
  readThread.reset();
}

void UnixPtyBackend::closeDescriptors() {
  if (masterFd >= 0) {
#ifdef WITH_UTEMPTER
    utempter_remove_record(masterFd);
#endif
    ::close(masterFd);
    masterFd = -1;
  }
  for (int i = 0; i < 2; i++) {
    if (wakePipe[i] >= 0) {
      ::close(wakePipe[i]);
      wakePipe[i] = -1;
    }
  }
}

string UnixPtyBackend::describe() const { return "unix pty (forkpty)"; }
}  // namespace ox
