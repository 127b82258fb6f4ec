#include "PtyError.hpp"

namespace ox {
const char* errorCodeName(PtyErrorCode code) {
  switch (code) {
    case PtyErrorCode::NONE:
      return "None";
    case PtyErrorCode::SPAWN_FAILED:
      return "SpawnFailed";
    case PtyErrorCode::NOT_AVAILABLE:
      return "NotAvailable";
    case PtyErrorCode::BROKEN_PIPE:
      return "BrokenPipe";
    case PtyErrorCode::PROCESS_EXITED:
      return "ProcessExited";
    case PtyErrorCode::INVALID_UTF8:
      return "InvalidUtf8";
    case PtyErrorCode::LOCK_POISONED:
      return "LockPoisoned";
    case PtyErrorCode::SIGNAL_UNSUPPORTED:
      return "SignalUnsupported";
    case PtyErrorCode::RESIZE_FAILED:
      return "ResizeFailed";
  }
  return "Unknown";
}

PtyError PtyError::fromLastError(PtyErrorCode code, const string& operation,
                                 const string& message) {
  int osError = GetErrno();
#ifdef WIN32
  string detail = WinErrorToString((DWORD)osError);
#else
  string detail = strerror(osError);
#endif
  return PtyError(code, operation, message + ": " + detail, osError);
}

bool PtyError::isRecoverable() const {
  switch (code) {
    case PtyErrorCode::NONE:
    case PtyErrorCode::BROKEN_PIPE:
    case PtyErrorCode::INVALID_UTF8:
    case PtyErrorCode::LOCK_POISONED:
    case PtyErrorCode::SIGNAL_UNSUPPORTED:
    case PtyErrorCode::RESIZE_FAILED:
      return true;
    case PtyErrorCode::SPAWN_FAILED:
    case PtyErrorCode::NOT_AVAILABLE:
    case PtyErrorCode::PROCESS_EXITED:
      return false;
  }
  return false;
}

string PtyError::toString() const {
  if (code == PtyErrorCode::NONE) {
    return "None";
  }
  std::ostringstream ss;
  ss << errorCodeName(code);
  if (!operation.empty()) {
    ss << " in " << operation;
  }
  if (!message.empty()) {
    ss << ": " << message;
  }
  if (osError) {
    ss << " (os error " << osError << ")";
  }
  return ss.str();
}
}  // namespace ox
