#ifndef __OX_RAW_IO_UTILS__
#define __OX_RAW_IO_UTILS__

#include "Headers.hpp"
#include "PtyError.hpp"

namespace ox {
/**
 * @brief Write and read loops over raw descriptors and pipe handles.
 *
 * Failures are raised as PtyException so backends can pass them straight to
 * the session facade.
 */
class RawIoUtils {
 public:
#ifndef WIN32
  /**
   * @brief Writes the entire buffer, waiting for writability on EAGAIN.
   *
   * Throws BrokenPipe when the other side is gone (EPIPE, EIO), the
   * descriptor is invalid, or `cancelled` turns true while waiting.
   */
  static void writeAll(int fd, const char* buf, size_t count,
                       const atomic<bool>* cancelled = NULL);

  /**
   * @brief Appends whatever is readable right now to `out` without blocking.
   * @return false once the descriptor reports end of stream (EOF or EIO),
   * true otherwise, including when nothing was available.
   */
  static bool readAvailable(int fd, string* out, size_t maxBytes);

  /** @brief Sets O_NONBLOCK, throwing SpawnFailed on error. */
  static void setNonBlocking(int fd);

  /** @brief Sets FD_CLOEXEC, throwing SpawnFailed on error. */
  static void setCloseOnExec(int fd);

#else
  /** @brief WriteFile loop over a pipe handle. */
  static void writeAll(HANDLE handle, const char* buf, size_t count);

  /**
   * @brief Reads what PeekNamedPipe reports as available, never blocking.
   * @return false once the pipe is broken.
   */
  static bool readAvailable(HANDLE handle, string* out, size_t maxBytes);
#endif
};
}  // namespace ox
#endif  // __OX_RAW_IO_UTILS__
