#ifndef __OX_PTY__
#define __OX_PTY__

#include "BackendSelector.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PtyBackend.hpp"
#include "ShellRegistry.hpp"
#include "Utf8Utils.hpp"

namespace ox {
/** @brief Everything needed to open a session. */
class PtyOptions {
 public:
  PtyOptions() : conptyProbe(&BackendSelector::isConPtyAvailable) {}

  ShellSelector shell;
  TerminalSize size;
  /**
   * @brief Decides between ConPTY and the fallback on Windows.
   *
   * Replaced to force the fallback path.
   */
  std::function<bool()> conptyProbe;
  /** @brief Shell detection probes, the real machine when null. */
  shared_ptr<ShellEnvironment> environment;
};

/**
 * @brief One terminal pane's pseudo terminal session.
 *
 * The single type the editor talks to. It owns the backend, collects the
 * reader thread's output and serializes writes. Every method reports
 * failure as a returned PtyError; nothing throws out of this class.
 *
 * Two locks are involved. writeMutex orders everything sent to the child
 * and is held across the backend write. sessionMutex only guards the
 * buffers and flags and is never held during backend I/O, so the reader
 * thread and a slow writer never wait on each other. When both are needed
 * writeMutex is taken first.
 */
class Pty : public PtyOutputSink {
 public:
  /**
   * @brief Resolves the shell, picks a backend and starts the session.
   *
   * Returns null and fills `error` (when given) with SpawnFailed or
   * NotAvailable on failure; nothing is left running in that case.
   */
  static shared_ptr<Pty> open(const PtyOptions& options, PtyError* error);

  /** @brief Same as open() with a caller supplied backend. */
  static shared_ptr<Pty> openWithBackend(unique_ptr<PtyBackend> backend,
                                         const Shell& shell,
                                         const PtyOptions& options,
                                         PtyError* error);

  virtual ~Pty();

  /** @brief Sends `text` to the shell as is, e.g. "ls -l\n". */
  PtyError runCommand(const string& text);

  /** @brief Clears the output first so only this command's output remains. */
  PtyError silentRunCommand(const string& text);

  /**
   * @brief Sends one typed character right away and tracks the line.
   *
   * The pending line is cleared on newline or carriage return.
   */
  PtyError charInput(char32_t ch);

  /**
   * @brief Backspace: drops the last pending character and sends DEL.
   *
   * Does nothing when the pending line is empty.
   */
  PtyError charPop();

  /** @brief The characters typed since the last newline. */
  string pendingInput();

  /** @brief Raw output accumulated since the last clear or drain. */
  string output();

  /** @brief output() decoded as UTF-8 with U+FFFD substitution. */
  string outputText();

  /** @brief Returns and clears the accumulated output. */
  string takeOutput();

  /**
   * @brief Drains the output as text.
   *
   * A multi-byte sequence cut off at the end is kept for the next drain.
   */
  string takeOutputText();

  void clearOutput();

  /** @brief True when output arrived since the previous call. */
  bool hasNewOutput();

  /**
   * @brief Blocks until output arrives, the session dies or the timeout
   * expires.
   * @return true if output is waiting.
   */
  bool waitForOutput(int timeoutMs);

  PtyError resize(const TerminalSize& newSize);
  PtyError resize(int rows, int cols) { return resize(TerminalSize(rows, cols)); }

  PtyError signal(PtySignal kind);

  bool isAlive();

  /**
   * @brief Stops the shell and frees every resource. Idempotent.
   *
   * Waits for a write in progress on another thread; one stuck on a full
   * input queue is cancelled first.
   */
  void terminate();

  optional<int> exitCode();

  const Shell& getShell() const { return shell; }
  TerminalSize getSize();
  BackendKind getBackendKind() const { return backend->getKind(); }
  string describeBackend() const { return backend->describe(); }

  /** @brief Backend, shell and state summary for diagnostics. */
  json capabilityReport();

  // PtyOutputSink, called on the reader thread.
  virtual void onOutput(const string& bytes);
  virtual void onTransportClosed(const PtyError& reason);

 protected:
  Pty(unique_ptr<PtyBackend> _backend, const Shell& _shell,
      const TerminalSize& _size);

  /**
   * @brief Holds sessionMutex and marks the session poisoned if the
   * critical section unwinds with an exception.
   */
  class SessionLock {
   public:
    explicit SessionLock(Pty* _pty);
    ~SessionLock();

    unique_lock<std::mutex> lock;

   protected:
    Pty* pty;
    int exceptionsOnEntry;
  };

  /** @brief Sends `data` to the child. Caller holds writeMutex only. */
  PtyError writeLocked(const string& operation, const string& data);

  /**
   * @brief Runs `call` on the backend, turning exceptions into errors.
   *
   * Anything that is not a PtyException is reported as `failureCode`.
   */
  PtyError callBackend(const string& operation, PtyErrorCode failureCode,
                       const std::function<void()>& call);

  /** @brief Clears the liveness flag and wakes waiters. */
  void markExited(const string& reason);

  /** @brief The ProcessExited result, logged only the first time. */
  PtyError exitedError(const string& operation);

  unique_ptr<PtyBackend> backend;
  Shell shell;

  std::mutex writeMutex;
  std::mutex sessionMutex;
  std::condition_variable outputCondition;

  // Guarded by sessionMutex
  string outputBuffer;
  string pendingLine;
  TerminalSize size;
  Utf8StreamDecoder textDecoder;
  bool alive;
  bool closed;
  bool newOutput;
  bool poisoned;
  bool exitLogged;
  set<PtySignal> unsupportedLogged;
};
}  // namespace ox

#endif  // __OX_PTY__
