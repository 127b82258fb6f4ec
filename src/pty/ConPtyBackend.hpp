#ifndef __OX_CONPTY_BACKEND__
#define __OX_CONPTY_BACKEND__

#include "PtyBackend.hpp"

#ifdef WIN32
namespace ox {
typedef HRESULT(WINAPI* CreatePseudoConsoleFn)(COORD size, HANDLE input,
                                               HANDLE output, DWORD flags,
                                               HPCON* pseudoConsole);
typedef HRESULT(WINAPI* ResizePseudoConsoleFn)(HPCON pseudoConsole,
                                               COORD size);
typedef void(WINAPI* ClosePseudoConsoleFn)(HPCON pseudoConsole);

/** @brief ConPTY entry points looked up in kernel32 at runtime. */
struct ConPtyApi {
  ConPtyApi() : create(NULL), resize(NULL), close(NULL) {}

  /** @brief Fills the pointers; false when this Windows predates ConPTY. */
  bool load();

  CreatePseudoConsoleFn create;
  ResizePseudoConsoleFn resize;
  ClosePseudoConsoleFn close;
};

/**
 * @brief Runs a shell attached to a Windows pseudo console (1809+).
 *
 * A reader thread blocks in ReadFile on the output pipe. A thread pool wait
 * on the process handle closes the pseudo console when the shell exits,
 * which breaks the pipe and lets the reader finish.
 */
class ConPtyBackend : public PtyBackend {
 public:
  ConPtyBackend();
  virtual ~ConPtyBackend();

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
  virtual BackendKind getKind() const { return BackendKind::CONPTY; }
  virtual string describe() const;

 protected:
  void readLoop();
  void closePseudoConsole();
  /** @brief Closes every handle in a fixed order; safe on partial state. */
  void releaseHandles();
  static VOID CALLBACK onProcessExited(PVOID context, BOOLEAN timedOut);

  ConPtyApi api;
  HPCON pseudoConsole;
  HANDLE inputRead;
  HANDLE inputWrite;
  HANDLE outputRead;
  HANDLE outputWrite;
  PROCESS_INFORMATION processInfo;
  HANDLE exitWait;
  bool terminated;
  atomic<bool> stopping;
  atomic<bool> transportClosed;
  PtyOutputSink* sink;
  unique_ptr<thread> readThread;
  recursive_mutex handleMutex;
};
}  // namespace ox
#endif  // WIN32

#endif  // __OX_CONPTY_BACKEND__
