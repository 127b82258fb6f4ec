#ifndef __OX_WINPTY_BACKEND__
#define __OX_WINPTY_BACKEND__

#include "PtyBackend.hpp"

#if defined(WIN32) && defined(OX_HAVE_WINPTY)
#include <winpty.h>

namespace ox {
/**
 * @brief Fallback for Windows releases without ConPTY, built on winpty.
 *
 * winpty runs a hidden console plus an agent that scrapes it and exposes
 * the result as named pipes. The reader polls the output pipe instead of
 * blocking so it can also notice the agent shutting down.
 */
class WinPtyBackend : public PtyBackend {
 public:
  WinPtyBackend();
  virtual ~WinPtyBackend();

  virtual void spawn(const Shell& shell, const TerminalSize& size,
                     const string& workingDirectory);
  virtual void startReader(PtyOutputSink* _sink);
  virtual void write(const string& data);
  virtual string tryRead();
  virtual void resize(const TerminalSize& size);
  virtual void signal(PtySignal signal);
  virtual bool isAlive();
  virtual optional<int> exitCode();
  virtual void terminate();
  virtual BackendKind getKind() const { return BackendKind::WINPTY; }
  virtual string describe() const;

 protected:
  void readLoop();
  void releaseHandles();

  /** @brief Current environment with TERM set, as a double-NUL block. */
  static std::wstring buildEnvironmentBlock();

  winpty_t* agent;
  HANDLE conin;
  HANDLE conout;
  HANDLE process;
  bool terminated;
  atomic<bool> stopping;
  atomic<bool> transportClosed;
  PtyOutputSink* sink;
  unique_ptr<thread> readThread;
  recursive_mutex handleMutex;
};
}  // namespace ox
#endif

#endif  // __OX_WINPTY_BACKEND__
