#include "RawIoUtils.hpp"

namespace ox {
#ifndef WIN32
void RawIoUtils::writeAll(int fd, const char* buf, size_t count,
                          const atomic<bool>* cancelled) {
  if (fd < 0) {
    throw PtyException(PtyErrorCode::BROKEN_PIPE, "write",
                       "Invalid file descriptor for writeAll", EBADF);
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        if (cancelled != NULL && *cancelled) {
          throw PtyException(PtyErrorCode::BROKEN_PIPE, "write",
                             "Write abandoned, the pty is closing",
                             ECANCELED);
        }
        // The pty input queue is full, wait until the child drains it.
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (::poll(&pfd, 1, 100) < 0 && GetErrno() != EINTR) {
          throw PtyException(PtyError::fromLastError(
              PtyErrorCode::BROKEN_PIPE, "write", "poll failed"));
        }
        continue;
      }
      VLOG(1) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw PtyException(PtyErrorCode::BROKEN_PIPE, "write",
                         string("Cannot write: ") + strerror(localErrno),
                         localErrno);
    }
    if (rc == 0) {
      throw PtyException(PtyErrorCode::BROKEN_PIPE, "write",
                         "Cannot write: descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawIoUtils::readAvailable(int fd, string* out, size_t maxBytes) {
  if (fd < 0) {
    return false;
  }
  vector<char> b(maxBytes);
  while (true) {
    ssize_t rc = ::read(fd, &b[0], maxBytes);
    if (rc > 0) {
      out->append(&b[0], rc);
      return true;
    }
    if (rc == 0) {
      return false;
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return true;
    }
    // Linux reports a hung up pty master as EIO rather than EOF
    if (localErrno != EIO) {
      VLOG(1) << "Read from fd " << fd << " failed: " << strerror(localErrno);
    }
    return false;
  }
}

void RawIoUtils::setNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    throw PtyException(PtyError::fromLastError(
        PtyErrorCode::SPAWN_FAILED, "fcntl", "Cannot set O_NONBLOCK"));
  }
}

void RawIoUtils::setCloseOnExec(int fd) {
  int flags = ::fcntl(fd, F_GETFD, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) {
    throw PtyException(PtyError::fromLastError(
        PtyErrorCode::SPAWN_FAILED, "fcntl", "Cannot set FD_CLOEXEC"));
  }
}
#else
void RawIoUtils::writeAll(HANDLE handle, const char* buf, size_t count) {
  if (handle == NULL || handle == INVALID_HANDLE_VALUE) {
    throw PtyException(PtyErrorCode::BROKEN_PIPE, "write",
                       "Invalid handle for writeAll", ERROR_INVALID_HANDLE);
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    DWORD chunk = 0;
    if (!WriteFile(handle, buf + bytesWritten, (DWORD)(count - bytesWritten),
                   &chunk, NULL)) {
      throw PtyException(PtyError::fromLastError(PtyErrorCode::BROKEN_PIPE,
                                                 "write", "WriteFile failed"));
    }
    bytesWritten += chunk;
  }
}

bool RawIoUtils::readAvailable(HANDLE handle, string* out, size_t maxBytes) {
  DWORD available = 0;
  if (!PeekNamedPipe(handle, NULL, 0, NULL, &available, NULL)) {
    return false;
  }
  if (available == 0) {
    return true;
  }
  vector<char> b(maxBytes);
  DWORD bytesRead = 0;
  if (!ReadFile(handle, &b[0], (DWORD)std::min<size_t>(available, maxBytes),
                &bytesRead, NULL)) {
    return false;
  }
  out->append(&b[0], bytesRead);
  return true;
}
#endif
}  // namespace ox
