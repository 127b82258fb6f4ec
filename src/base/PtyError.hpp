#ifndef __OX_PTY_ERROR__
#define __OX_PTY_ERROR__

#include "Headers.hpp"

namespace ox {
/** @brief Failure categories shared by every pty backend. */
enum class PtyErrorCode {
  NONE = 0,
  SPAWN_FAILED,
  NOT_AVAILABLE,
  BROKEN_PIPE,
  PROCESS_EXITED,
  INVALID_UTF8,
  LOCK_POISONED,
  SIGNAL_UNSUPPORTED,
  RESIZE_FAILED,
};

/** @brief Stable CamelCase name of an error code, e.g. "BrokenPipe". */
const char* errorCodeName(PtyErrorCode code);

/**
 * @brief A typed failure with enough context to diagnose it.
 *
 * A default constructed PtyError means success, so facade methods can return
 * one unconditionally and callers test it with `if (error)`.
 */
class PtyError {
 public:
  PtyError() : code(PtyErrorCode::NONE), osError(0) {}

  PtyError(PtyErrorCode _code, const string& _operation, const string& _message,
           int _osError = 0)
      : code(_code),
        operation(_operation),
        message(_message),
        osError(_osError) {}

  /** @brief Builds an error from the current errno / GetLastError(). */
  static PtyError fromLastError(PtyErrorCode code, const string& operation,
                                const string& message);

  explicit operator bool() const { return code != PtyErrorCode::NONE; }

  PtyErrorCode getCode() const { return code; }
  const string& getOperation() const { return operation; }
  const string& getMessage() const { return message; }
  int getOsError() const { return osError; }

  /**
   * @brief True for failures after which the session remains usable.
   *
   * BrokenPipe is included because a transient write failure leaves the
   * session open unless liveness has also dropped.
   */
  bool isRecoverable() const;

  /** @brief "<Code> in <operation>: <message> (os error N)". */
  string toString() const;

 protected:
  PtyErrorCode code;
  string operation;
  string message;
  int osError;
};

inline std::ostream& operator<<(std::ostream& os, const PtyError& error) {
  return os << error.toString();
}

/**
 * @brief Carries a PtyError through backend internals.
 *
 * Backends throw this; the Pty facade converts it back into a returned
 * PtyError so nothing unwinds past the facade.
 */
class PtyException : public std::runtime_error {
 public:
  explicit PtyException(const PtyError& _error)
      : std::runtime_error(_error.toString()), error(_error) {}

  PtyException(PtyErrorCode code, const string& operation,
               const string& message, int osError = 0)
      : PtyException(PtyError(code, operation, message, osError)) {}

  const PtyError& getError() const { return error; }

 protected:
  PtyError error;
};
}  // namespace ox

#endif  // __OX_PTY_ERROR__
