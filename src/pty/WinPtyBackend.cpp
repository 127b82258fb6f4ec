#include "WinPtyBackend.hpp"

#include "RawIoUtils.hpp"

namespace ox {
namespace {
// Converts and frees a winpty error.
PtyError takeWinptyError(winpty_error_ptr_t err, const string& operation) {
  string message = "unknown winpty error";
  int code = 0;
  if (err != NULL) {
    code = (int)winpty_error_code(err);
    LPCWSTR text = winpty_error_msg(err);
    if (text != NULL) {
      message = WideToUtf8(text);
    }
    winpty_error_free(err);
  }
  return PtyError(PtyErrorCode::SPAWN_FAILED, operation, message, code);
}

void closeIfValid(HANDLE* handle) {
  if (*handle != NULL && *handle != INVALID_HANDLE_VALUE) {
    CloseHandle(*handle);
  }
  *handle = NULL;
}
}  // namespace

WinPtyBackend::WinPtyBackend()
    : agent(NULL),
      conin(NULL),
      conout(NULL),
      process(NULL),
      terminated(false),
      stopping(false),
      transportClosed(false),
      sink(NULL) {}

WinPtyBackend::~WinPtyBackend() {
  try {
    terminate();
  } catch (const std::exception& ex) {
    STERROR << "Error while tearing down winpty: " << ex.what();
  }
}

std::wstring WinPtyBackend::buildEnvironmentBlock() {
  std::wstring block;
  LPWCH strings = GetEnvironmentStringsW();
  if (strings != NULL) {
    for (LPWCH it = strings; *it != L'\0'; it += wcslen(it) + 1) {
      std::wstring entry(it);
      if (_wcsnicmp(entry.c_str(), L"TERM=", 5) == 0) {
        continue;
      }
      block += entry;
      block.push_back(L'\0');
    }
    FreeEnvironmentStringsW(strings);
  }
  block += L"TERM=xterm-256color";
  block.push_back(L'\0');
  block.push_back(L'\0');
  return block;
}

void WinPtyBackend::spawn(const Shell& shell, const TerminalSize& size,
                          const string& workingDirectory) {
  lock_guard<recursive_mutex> guard(handleMutex);
  if (agent != NULL || terminated) {
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "spawn",
                       "Backend has already been used");
  }
  if (!size.isValid()) {
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "spawn",
                       "Invalid terminal size");
  }

  winpty_error_ptr_t err = NULL;
  winpty_config_t* config = winpty_config_new(WINPTY_FLAG_COLOR_ESCAPES, &err);
  if (config == NULL) {
    throw PtyException(takeWinptyError(err, "winpty_config_new"));
  }
  winpty_config_set_initial_size(config, size.cols, size.rows);
  agent = winpty_open(config, &err);
  winpty_config_free(config);
  if (agent == NULL) {
    throw PtyException(takeWinptyError(err, "winpty_open"));
  }

  conin = CreateFileW(winpty_conin_name(agent), GENERIC_WRITE, 0, NULL,
                      OPEN_EXISTING, 0, NULL);
  conout = CreateFileW(winpty_conout_name(agent), GENERIC_READ, 0, NULL,
                       OPEN_EXISTING, 0, NULL);
  if (conin == INVALID_HANDLE_VALUE || conout == INVALID_HANDLE_VALUE) {
    PtyError error = PtyError::fromLastError(
        PtyErrorCode::SPAWN_FAILED, "CreateFile", "Cannot open winpty pipes");
    releaseHandles();
    throw PtyException(error);
  }

  std::wstring commandLine = Utf8ToWide(shell.toCommandLine());
  std::wstring cwd = Utf8ToWide(workingDirectory);
  std::wstring environment = buildEnvironmentBlock();
  winpty_spawn_config_t* spawnConfig = winpty_spawn_config_new(
      WINPTY_SPAWN_FLAG_AUTO_SHUTDOWN, NULL, commandLine.c_str(),
      workingDirectory.empty() ? NULL : cwd.c_str(), environment.c_str(),
      &err);
  if (spawnConfig == NULL) {
    PtyError error = takeWinptyError(err, "winpty_spawn_config_new");
    releaseHandles();
    throw PtyException(error);
  }

  DWORD createError = 0;
  BOOL spawned =
      winpty_spawn(agent, spawnConfig, &process, NULL, &createError, &err);
  winpty_spawn_config_free(spawnConfig);
  if (!spawned) {
    PtyError error = takeWinptyError(err, "winpty_spawn");
    releaseHandles();
    terminated = true;
    throw PtyException(PtyErrorCode::SPAWN_FAILED, "winpty_spawn",
                       "Cannot start " + shell.getExecutable() + ": " +
                           error.getMessage(),
                       createError ? (int)createError : error.getOsError());
  }
  VLOG(1) << "winpty session opened for " << shell;
}

void WinPtyBackend::startReader(PtyOutputSink* _sink) {
  lock_guard<recursive_mutex> guard(handleMutex);
  if (conout == NULL || readThread) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "startReader",
                       "No winpty session to read from");
  }
  sink = _sink;
  readThread.reset(new thread(&WinPtyBackend::readLoop, this));
}

void WinPtyBackend::readLoop() {
  while (!stopping) {
    string chunk;
    bool open = RawIoUtils::readAvailable(conout, &chunk, PTY_READ_BUFFER_SIZE);
    if (!chunk.empty()) {
      VLOG(2) << "Read " << chunk.size() << " bytes from winpty";
      sink->onOutput(chunk);
      continue;
    }
    if (!open) {
      transportClosed = true;
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(WINPTY_POLL_INTERVAL_MS));
  }
  if (transportClosed && !stopping) {
    sink->onTransportClosed(PtyError(PtyErrorCode::PROCESS_EXITED, "read",
                                     "The winpty agent closed its output"));
  }
}

void WinPtyBackend::write(const string& data) {
  if (conin == NULL) {
    throw PtyException(PtyErrorCode::BROKEN_PIPE, "write",
                       "The input pipe is closed");
  }
  RawIoUtils::writeAll(conin, data.data(), data.size());
}

string WinPtyBackend::tryRead() {
  string chunk;
  if (conout == NULL || transportClosed) {
    return chunk;
  }
  if (!RawIoUtils::readAvailable(conout, &chunk, PTY_READ_BUFFER_SIZE)) {
    transportClosed = true;
  }
  return chunk;
}

void WinPtyBackend::resize(const TerminalSize& size) {
  lock_guard<recursive_mutex> guard(handleMutex);
  if (agent == NULL) {
    throw PtyException(PtyErrorCode::PROCESS_EXITED, "resize",
                       "The winpty session is closed");
  }
  winpty_error_ptr_t err = NULL;
  if (!winpty_set_size(agent, size.cols, size.rows, &err)) {
    PtyError error = takeWinptyError(err, "winpty_set_size");
    throw PtyException(PtyErrorCode::RESIZE_FAILED, "resize",
                       error.getMessage(), error.getOsError());
  }
}

void WinPtyBackend::signal(PtySignal signal) {
  switch (signal) {
    case PtySignal::INTERRUPT:
    case PtySignal::BREAK:
      // The agent types ETX into the hidden console as Ctrl+C.
      write("\x03");
      break;
    case PtySignal::QUIT:
    case PtySignal::SUSPEND:
      throw PtyException(PtyErrorCode::SIGNAL_UNSUPPORTED, "signal",
                         string(signalName(signal)) +
                             " has no Windows console equivalent");
    case PtySignal::END_OF_INPUT: {
      lock_guard<recursive_mutex> guard(handleMutex);
      closeIfValid(&conin);
      break;
    }
  }
}

bool WinPtyBackend::isAlive() {
  if (transportClosed) {
    return false;
  }
  lock_guard<recursive_mutex> guard(handleMutex);
  if (process == NULL || terminated) {
    return false;
  }
  return WaitForSingleObject(process, 0) == WAIT_TIMEOUT;
}

optional<int> WinPtyBackend::exitCode() {
  lock_guard<recursive_mutex> guard(handleMutex);
  DWORD code;
  if (process == NULL || !GetExitCodeProcess(process, &code) ||
      code == STILL_ACTIVE) {
    return std::nullopt;
  }
  return (int)code;
}

void WinPtyBackend::terminate() {
  {
    lock_guard<recursive_mutex> guard(handleMutex);
    if (terminated) {
      return;
    }
    terminated = true;
  }
  stopping = true;

  if (process != NULL && WaitForSingleObject(process, 0) == WAIT_TIMEOUT) {
    // End of input is the closest thing to a polite request.
    {
      lock_guard<recursive_mutex> guard(handleMutex);
      closeIfValid(&conin);
    }
    if (WaitForSingleObject(process, PTY_TERMINATE_GRACE_MS) == WAIT_TIMEOUT) {
      LOG(INFO) << "Shell ignored end of input, terminating it";
      if (!TerminateProcess(process, 1)) {
        STERROR << "TerminateProcess failed: " << WinErrnoToString();
      }
      WaitForSingleObject(process, PTY_TERMINATE_GRACE_MS);
    }
  }
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

void WinPtyBackend::releaseHandles() {
  closeIfValid(&conin);
  closeIfValid(&conout);
  closeIfValid(&process);
  if (agent != NULL) {
    winpty_free(agent);
    agent = NULL;
  }
}

string WinPtyBackend::describe() const {
  return "winpty (pre-1809 fallback)";
}
}  // namespace ox
