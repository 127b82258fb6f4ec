#include "ConPtyBackend.hpp"

#include "RawIoUtils.hpp"

namespace ox {
namespace {
void closeIfValid(HANDLE* handle) {
  if (*handle != NULL && *handle != INVALID_HANDLE_VALUE) {
    CloseHandle(*handle);
  }
  *handle = NULL;
}

COORD toCoord(const TerminalSize& size) {
  COORD c;
  c.X = (SHORT)size.cols;
  c.Y = (SHORT)size.rows;
  return c;
}
}  // namespace

bool ConPtyApi::load() {
  HMODULE kernel32 = GetModuleHandleW(L"kernel32.dll");
  if (kernel32 == NULL) {
    return false;
  }
  create = (CreatePseudoConsoleFn)GetProcAddress(kernel32,
                                                 "CreatePseudoConsole");
  resize = (ResizePseudoConsoleFn)GetProcAddress(kernel32,
                                                 "ResizePseudoConsole");
  close = (ClosePseudoConsoleFn)GetProcAddress(kernel32, "ClosePseudoConsole");
  return create != NULL && resize != NULL && close != NULL;
}

ConPtyBackend::ConPtyBackend()
    : pseudoConsole(NULL),
      inputRead(NULL),
      inputWrite(NULL),
      outputRead(NULL),
      outputWrite(NULL),
      exitWait(NULL),
      terminated(false),
      stopping(false),
      transportClosed(false),
      sink(NULL) {
  ZeroMemory(&processInfo, sizeof(processInfo));
}

ConPtyBackend::~ConPtyBackend() {
  try {
    terminate();
  } catch (const std::exception& ex) {
    STERROR << "Error while tearing down pseudo console: " << ex.what();
  }
}

void ConPtyBackend::spawn(const Shell& shell, const TerminalSize& size,
                          const string& workingDirectory) {
  lock_guard<recursive_mutex> guard(handleMutex);
  if (processInfo.hProcess != NULL || terminated) {
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "spawn",
                       "Backend has already been used");
  }
  if (!api.load()) {
    throw PtyException(PtyErrorCode::NOT_AVAILABLE, "CreatePseudoConsole",
                       "This Windows version has no ConPTY support");
  }
  if (!size.isValid()) {
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "spawn",
                       "Invalid terminal size");
  }

  if (!CreatePipe(&inputRead, &inputWrite, NULL, CONPTY_PIPE_BUFFER_SIZE) ||
      !CreatePipe(&outputRead, &outputWrite, NULL, CONPTY_PIPE_BUFFER_SIZE)) {
    PtyError error = PtyError::fromLastError(PtyErrorCode::SPAWN_FAILED,
                                             "CreatePipe", "Cannot create pipes");
    releaseHandles();
    throw PtyException(error);
  }

  HRESULT hr =
      api.create(toCoord(size), inputRead, outputWrite, 0, &pseudoConsole);
  if (FAILED(hr)) {
    pseudoConsole = NULL;
    releaseHandles();
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "CreatePseudoConsole",
                       "Cannot create pseudo console", (int)hr);
  }
  // The pseudo console holds its own duplicates of these ends.
  closeIfValid(&inputRead);
  closeIfValid(&outputWrite);

  STARTUPINFOEXW si;
  ZeroMemory(&si, sizeof(si));
  si.StartupInfo.cb = sizeof(STARTUPINFOEXW);

  SIZE_T bytesRequired = 0;
  InitializeProcThreadAttributeList(NULL, 1, 0, &bytesRequired);
  vector<char> attributeStorage(bytesRequired);
  si.lpAttributeList = (PPROC_THREAD_ATTRIBUTE_LIST)&attributeStorage[0];
  if (!InitializeProcThreadAttributeList(si.lpAttributeList, 1, 0,
                                         &bytesRequired)) {
    PtyError error = PtyError::fromLastError(
        PtyErrorCode::SPAWN_FAILED, "InitializeProcThreadAttributeList",
        "Cannot build startup attributes");
    releaseHandles();
    throw PtyException(error);
  }
  if (!UpdateProcThreadAttribute(si.lpAttributeList, 0,
                                 PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE,
                                 pseudoConsole, sizeof(pseudoConsole), NULL,
                                 NULL)) {
    PtyError error = PtyError::fromLastError(
        PtyErrorCode::SPAWN_FAILED, "UpdateProcThreadAttribute",
        "Cannot attach pseudo console");
    DeleteProcThreadAttributeList(si.lpAttributeList);
    releaseHandles();
    throw PtyException(error);
  }

  // CreateProcessW may modify the command line buffer.
  std::wstring commandLine = Utf8ToWide(shell.toCommandLine());
  std::wstring cwd = Utf8ToWide(workingDirectory);
  BOOL created = CreateProcessW(
      NULL, &commandLine[0], NULL, NULL, FALSE, EXTENDED_STARTUPINFO_PRESENT,
      NULL, workingDirectory.empty() ? NULL : cwd.c_str(), &si.StartupInfo,
      &processInfo);
  DWORD createError = GetLastError();
  DeleteProcThreadAttributeList(si.lpAttributeList);
  if (!created) {
    ZeroMemory(&processInfo, sizeof(processInfo));
    releaseHandles();
    terminated = true;
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "CreateProcess",
                       "Cannot start " + shell.getExecutable() + ": " +
                           WinErrorToString(createError),
                       (int)createError);
  }

  if (!RegisterWaitForSingleObject(&exitWait, processInfo.hProcess,
                                   &ConPtyBackend::onProcessExited, this,
                                   INFINITE, WT_EXECUTEONLYONCE)) {
    PtyError error = PtyError::fromLastError(PtyErrorCode::SPAWN_FAILED,
                                             "RegisterWaitForSingleObject",
                                             "Cannot watch the shell process");
    exitWait = NULL;
    terminate();
    throw PtyException(error);
  }
  VLOG(1) << "pseudo console opened for " << shell << " pid "
          << processInfo.dwProcessId;
}

VOID CALLBACK ConPtyBackend::onProcessExited(PVOID context, BOOLEAN timedOut) {
  ConPtyBackend* self = (ConPtyBackend*)context;
  VLOG(1) << "Shell process exited";
  // The output pipe stays open until the pseudo console goes away.
  self->closePseudoConsole();
}

void ConPtyBackend::startReader(PtyOutputSink* _sink) {
  lock_guard<recursive_mutex> guard(handleMutex);
  if (outputRead == NULL || readThread) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "startReader",
                       "No pseudo console to read from");
  }
  sink = _sink;
  readThread.reset(new thread(&ConPtyBackend::readLoop, this));
}

void ConPtyBackend::readLoop() {
  vector<char> b(PTY_READ_BUFFER_SIZE);
  while (true) {
    DWORD bytesRead = 0;
    if (!ReadFile(outputRead, &b[0], (DWORD)b.size(), &bytesRead, NULL) ||
        bytesRead == 0) {
      VLOG(1) << "Pseudo console output closed: " << WinErrnoToString();
      break;
    }
    VLOG(2) << "Read " << bytesRead << " bytes from pseudo console";
    sink->onOutput(string(&b[0], bytesRead));
  }
  transportClosed = true;
  if (!stopping) {
    sink->onTransportClosed(PtyError(PtyErrorCode::PROCESS_EXITED, "read",
                                     "The pseudo console output closed"));
  }
}

void ConPtyBackend::write(const string& data) {
  if (inputWrite == NULL) {
    throw PtyException(PtyErrorCode::BROKEN_PIPE, "write",
                       "The input pipe is closed");
  }
  RawIoUtils::writeAll(inputWrite, data.data(), data.size());
}

string ConPtyBackend::tryRead() {
  string chunk;
  if (outputRead == NULL || transportClosed) {
    return chunk;
  }
  if (!RawIoUtils::readAvailable(outputRead, &chunk, PTY_READ_BUFFER_SIZE)) {
    transportClosed = true;
  }
  return chunk;
}

void ConPtyBackend::resize(const TerminalSize& size) {
  lock_guard<recursive_mutex> guard(handleMutex);
  if (pseudoConsole == NULL) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "resize",
                       "The pseudo console is closed");
  }
  HRESULT hr = api.resize(pseudoConsole, toCoord(size));
  if (FAILED(hr)) {
    throw PtyException(PtyErrorCode::RESIZE_FAILED, "ResizePseudoConsole",
                       "Cannot resize pseudo console", (int)hr);
  }
  VLOG(1) << "pseudo console resized to " << size.rows << "x" << size.cols;
}

void ConPtyBackend::signal(PtySignal signal) {
  switch (signal) {
    case PtySignal::INTERRUPT:
    case PtySignal::BREAK:
      // The pseudo console turns ETX into a CTRL_C_EVENT for its process
      // group, the only console event it forwards.
      write("\x03");
      break;
    case PtySignal::QUIT:
    case PtySignal::SUSPEND:
      throw PtyException(PtyErrorCode::SIGNAL_UNSUPPORTED, "signal",
                         string(signalName(signal)) +
                             " has no Windows console equivalent");
    case PtySignal::END_OF_INPUT: {
      lock_guard<recursive_mutex> guard(handleMutex);
      closeIfValid(&inputWrite);
      break;
    }
  }
}

bool ConPtyBackend::isAlive() {
  if (transportClosed) {
    return false;
  }
  lock_guard<recursive_mutex> guard(handleMutex);
  if (processInfo.hProcess == NULL || terminated) {
    return false;
  }
  return WaitForSingleObject(processInfo.hProcess, 0) == WAIT_TIMEOUT;
}

optional<int> ConPtyBackend::exitCode() {
  lock_guard<recursive_mutex> guard(handleMutex);
  DWORD code;
  if (processInfo.hProcess == NULL ||
      !GetExitCodeProcess(processInfo.hProcess, &code) ||
      code == STILL_ACTIVE) {
    return std::nullopt;
  }
  return (int)code;
}

void ConPtyBackend::terminate() {
  {
    lock_guard<recursive_mutex> guard(handleMutex);
    if (terminated) {
      return;
    }
    terminated = true;
  }
  stopping = true;

  if (processInfo.hProcess != NULL &&
      WaitForSingleObject(processInfo.hProcess, 0) == WAIT_TIMEOUT) {
    // Closing the pseudo console sends CTRL_CLOSE_EVENT to its clients.
    closePseudoConsole();
    if (WaitForSingleObject(processInfo.hProcess, PTY_TERMINATE_GRACE_MS) ==
        WAIT_TIMEOUT) {
      LOG(INFO) << "Shell ignored the close request, terminating it";
      if (!TerminateProcess(processInfo.hProcess, 1)) {
        STERROR << "TerminateProcess failed: " << WinErrnoToString();
      }
      WaitForSingleObject(processInfo.hProcess, PTY_TERMINATE_GRACE_MS);
    }
  }
  if (exitWait != NULL) {
    // Blocks until a running exit callback has finished.
    UnregisterWaitEx(exitWait, INVALID_HANDLE_VALUE);
    exitWait = NULL;
  }
  closePseudoConsole();
  if (readThread) {
    if (readThread->get_id() == std::this_thread::get_id()) {
      readThread->detach();
    } else {
      readThread->join();
    }
    readThread.reset();
  }
  lock_guard<recursive_mutex> guard(handleMutex);
  releaseHandles();
}

void ConPtyBackend::closePseudoConsole() {
  lock_guard<recursive_mutex> guard(handleMutex);
  if (pseudoConsole != NULL) {
    api.close(pseudoConsole);
    pseudoConsole = NULL;
  }
}

void ConPtyBackend::releaseHandles() {
  closePseudoConsole();
  closeIfValid(&inputWrite);
  closeIfValid(&outputRead);
  closeIfValid(&inputRead);
  closeIfValid(&outputWrite);
  closeIfValid(&processInfo.hThread);
  closeIfValid(&processInfo.hProcess);
}

string ConPtyBackend::describe() const {
  return "ConPTY (kernel32 CreatePseudoConsole)";
}
}  // namespace ox
