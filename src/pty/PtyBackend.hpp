#ifndef __OX_PTY_BACKEND__
#define __OX_PTY_BACKEND__

#include "Headers.hpp"
#include "PtyError.hpp"
#include "Shell.hpp"

namespace ox {
/** @brief Bytes read from the child per read call. */
const int PTY_READ_BUFFER_SIZE = 16 * 1024;
/** @brief Size of the ConPTY pipes. */
const int CONPTY_PIPE_BUFFER_SIZE = 64 * 1024;
/** @brief How long terminate() waits for a polite exit before killing. */
const int PTY_TERMINATE_GRACE_MS = 500;
/** @brief Read polling interval of the winpty fallback. */
const int WINPTY_POLL_INTERVAL_MS = 20;

/** @brief Control requests a pane can send to its shell. */
enum class PtySignal {
  INTERRUPT,
  BREAK,
  QUIT,
  SUSPEND,
  END_OF_INPUT,
};

const char* signalName(PtySignal signal);

enum class BackendKind {
  UNIX,
  CONPTY,
  WINPTY,
};

/** @brief Terminal geometry in character cells. */
class TerminalSize {
 public:
  TerminalSize() : rows(24), cols(80) {}
  TerminalSize(int _rows, int _cols) : rows(_rows), cols(_cols) {}

  bool isValid() const {
    return rows > 0 && cols > 0 && rows <= 0x7FFF && cols <= 0x7FFF;
  }

  bool operator==(const TerminalSize& other) const {
    return rows == other.rows && cols == other.cols;
  }
  bool operator!=(const TerminalSize& other) const { return !(*this == other); }

  int rows;
  int cols;
};

/**
 * @brief Receives what a backend's reader thread produces.
 *
 * Both callbacks run on the reader thread.
 */
class PtyOutputSink {
 public:
  virtual ~PtyOutputSink() {}

  /** @brief A chunk of child output, in the order it was read. */
  virtual void onOutput(const string& bytes) = 0;

  /**
   * @brief The output stream ended because the child exited or the pipe
   * broke. Not called when the reader was stopped by terminate().
   */
  virtual void onTransportClosed(const PtyError& reason) = 0;
};

/**
 * @brief One way of running a shell under a pseudo terminal.
 *
 * Failing operations throw PtyException. Instances are single use: spawn
 * once, terminate once (later calls are no-ops).
 */
class PtyBackend {
 public:
  virtual ~PtyBackend() {}

  /**
   * @brief Starts `shell` attached to a new pseudo terminal.
   *
   * On failure every resource acquired so far is released before the
   * SpawnFailed (or NotAvailable) exception leaves.
   */
  virtual void spawn(const Shell& shell, const TerminalSize& size,
                     const string& workingDirectory) = 0;

  /**
   * @brief Starts the single background reader delivering to `sink`.
   *
   * Once the reader runs, tryRead() must not be used.
   */
  virtual void startReader(PtyOutputSink* sink) = 0;

  /** @brief Writes all of `data` to the child's input. */
  virtual void write(const string& data) = 0;

  /**
   * @brief Returns whatever output is available without blocking.
   *
   * Empty means nothing right now; the end of the stream shows up as
   * isAlive() turning false.
   */
  virtual string tryRead() = 0;

  virtual void resize(const TerminalSize& size) = 0;

  /** @brief Throws SignalUnsupported for kinds the platform cannot express. */
  virtual void signal(PtySignal signal) = 0;

  virtual bool isAlive() = 0;

  /**
   * @brief Makes a write that waits on a full input queue give up with
   * BrokenPipe. May be called from any thread, just before terminate().
   */
  virtual void cancelPendingWrites() {}

  /** @brief Exit code once the child has been reaped. */
  virtual optional<int> exitCode() = 0;

  /**
   * @brief Stops the child and releases every resource, in a fixed order.
   *
   * Safe after a failed spawn and safe to call repeatedly.
   */
  virtual void terminate() = 0;

  virtual BackendKind getKind() const = 0;

  /** @brief Short capability/version string for diagnostics. */
  virtual string describe() const = 0;
};
}  // namespace ox

#endif  // __OX_PTY_BACKEND__
