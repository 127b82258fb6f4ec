#ifndef __OX_SUBPROCESS_UTILS__
#define __OX_SUBPROCESS_UTILS__

#include "Headers.hpp"
#include "RawIoUtils.hpp"

namespace ox {
/**
 * @brief Runs short-lived helper programs and captures their stdout.
 *
 * Used to ask a shell for its version string. Methods are virtual so tests
 * can substitute canned output.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command` with `args` (no shell involved) and returns stdout.
   *
   * stdin and stderr of the child are detached. Throws std::runtime_error
   * when the process cannot be started.
   */
  virtual string SubprocessToStringInteractive(const string& command,
                                               const vector<string>& args);

  /** @brief First non-empty line of `output`, trimmed. */
  static string firstLine(const string& output);

#ifndef WIN32
  /**
   * @brief pipe() with FD_CLOEXEC on both ends, so a pty forked on another
   * thread never inherits the write end. Throws std::runtime_error.
   */
  static void createCloseOnExecPipe(int fds[2]);
#endif
};
}  // namespace ox

#endif  // __OX_SUBPROCESS_UTILS__
