#ifndef __OX_UNIX_PTY_BACKEND__
#define __OX_UNIX_PTY_BACKEND__

#include "PtyBackend.hpp"

namespace ox {
/**
 * @brief Runs a shell on a POSIX pty allocated with forkpty().
 *
 * The master descriptor is non-blocking. The reader thread polls it together
 * with a self-pipe that terminate() uses to wake it up.
 */
class UnixPtyBackend : public PtyBackend {
 public:
  UnixPtyBackend();
  virtual ~UnixPtyBackend();

  virtual void spawn(const Shell& shell, const TerminalSize& size,
                     const string& workingDirectory);
  virtual void startReader(PtyOutputSink* _sink);
  virtual void write(const string& data);
  virtual string tryRead();
  virtual void resize(const TerminalSize& size);
  virtual void signal(PtySignal signal);
  virtual bool isAlive();
  virtual void cancelPendingWrites();
  virtual optional<int> exitCode();
  virtual void terminate();
  virtual BackendKind getKind() const { return BackendKind::UNIX; }
  virtual string describe() const;

  /** @brief Child pid, -1 before spawn. */
  pid_t getChildPid() const { return childPid; }

 protected:
  void readLoop();
  void stopReader();
  void closeDescriptors();

  /**
   * @brief Collects the child's exit status if it has exited.
   * @return true once the child is gone. Caller holds processMutex.
   */
  bool reapChild(bool block);

  /** @brief Delivers `signum` to the terminal's foreground process group. */
  void sendToForeground(int signum);

  /** @brief Parent environment plus the terminal variables for the child. */
  static vector<string> buildChildEnvironment();

  int masterFd;
  pid_t childPid;
  int wakePipe[2];
  optional<int> exitStatus;
  bool reaped;
  bool terminated;
  atomic<bool> stopping;
  atomic<bool> writesCancelled;
  atomic<bool> transportClosed;
  PtyOutputSink* sink;
  unique_ptr<thread> readThread;
  recursive_mutex processMutex;
};
}  // namespace ox

#endif  // __OX_UNIX_PTY_BACKEND__
