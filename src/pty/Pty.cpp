#include "Pty.hpp"

namespace ox {
Pty::SessionLock::SessionLock(Pty* _pty)
    : lock(_pty->sessionMutex),
      pty(_pty),
      exceptionsOnEntry(std::uncaught_exceptions()) {
  if (pty->poisoned) {
    LOG(WARNING) << PtyError(PtyErrorCode::LOCK_POISONED, "lock",
                             "A critical section failed earlier, continuing "
                             "with the state it left behind");
    pty->poisoned = false;
  }
}

Pty::SessionLock::~SessionLock() {
  if (std::uncaught_exceptions() > exceptionsOnEntry) {
    pty->poisoned = true;
  }
}

shared_ptr<Pty> Pty::open(const PtyOptions& options, PtyError* error) {
  try {
    shared_ptr<ShellEnvironment> environment = options.environment;
    if (!environment) {
      environment.reset(new ShellEnvironment());
    }
    ShellRegistry registry(environment);
    Shell shell = registry.resolve(options.shell);

#ifdef WIN32
    const bool windows = true;
#else
    const bool windows = false;
#endif
    bool conptyAvailable =
        windows && options.conptyProbe && options.conptyProbe();
    BackendKind kind = BackendSelector::choose(
        windows, conptyAvailable, BackendSelector::isFallbackCompiled());
    return openWithBackend(BackendSelector::create(kind), shell, options,
                           error);
  } catch (const PtyException& ex) {
    LOG(WARNING) << "Cannot open a pty session: " << ex.getError();
    if (error) {
      *error = ex.getError();
    }
    return shared_ptr<Pty>();
  } catch (const std::exception& ex) {
    PtyError failure(PtyErrorCode::SPAWN_FAILED, "open", ex.what());
    LOG(WARNING) << "Cannot open a pty session: " << failure;
    if (error) {
      *error = failure;
    }
    return shared_ptr<Pty>();
  }
}

shared_ptr<Pty> Pty::openWithBackend(unique_ptr<PtyBackend> backend,
                                     const Shell& shell,
                                     const PtyOptions& options,
                                     PtyError* error) {
  PtyError spawnError;
  try {
    backend->spawn(shell, options.size, options.shell.workingDirectory);
  } catch (const PtyException& ex) {
    spawnError = ex.getError();
  } catch (const std::exception& ex) {
    spawnError = PtyError(PtyErrorCode::SPAWN_FAILED, "spawn", ex.what());
  }
  if (spawnError) {
    LOG(WARNING) << "Cannot start " << shell << ": " << spawnError;
    try {
      backend->terminate();
    } catch (const std::exception& ex) {
      STERROR << "Cleanup after a failed spawn failed: " << ex.what();
    }
    if (error) {
      *error = spawnError;
    }
    return shared_ptr<Pty>();
  }

  shared_ptr<Pty> pty(new Pty(std::move(backend), shell, options.size));
  Pty* session = pty.get();
  PtyError readerError =
      pty->callBackend("startReader", PtyErrorCode::SPAWN_FAILED,
                       [session]() { session->backend->startReader(session); });
  if (readerError) {
    pty->terminate();
    if (error) {
      *error = readerError;
    }
    return shared_ptr<Pty>();
  }
  VLOG(1) << "Opened " << shell << " on " << pty->describeBackend() << " at "
          << options.size.rows << "x" << options.size.cols;
  return pty;
}

Pty::Pty(unique_ptr<PtyBackend> _backend, const Shell& _shell,
         const TerminalSize& _size)
    : backend(std::move(_backend)),
      shell(_shell),
      size(_size),
      alive(true),
      closed(false),
      newOutput(false),
      poisoned(false),
      exitLogged(false) {}

Pty::~Pty() { terminate(); }

PtyError Pty::runCommand(const string& text) {
  lock_guard<std::mutex> writeGuard(writeMutex);
  return writeLocked("runCommand", text);
}

PtyError Pty::silentRunCommand(const string& text) {
  clearOutput();
  lock_guard<std::mutex> writeGuard(writeMutex);
  return writeLocked("silentRunCommand", text);
}

PtyError Pty::charInput(char32_t ch) {
  string encoded = Utf8Utils::encode(ch);
  lock_guard<std::mutex> writeGuard(writeMutex);
  PtyError error = writeLocked("charInput", encoded);
  if (error) {
    return error;
  }
  SessionLock guard(this);
  if (ch == U'\n' || ch == U'\r') {
    pendingLine.clear();
  } else {
    pendingLine += encoded;
  }
  return PtyError();
}

PtyError Pty::charPop() {
  lock_guard<std::mutex> writeGuard(writeMutex);
  {
    SessionLock guard(this);
    if (pendingLine.empty()) {
      return PtyError();
    }
  }
  // DEL is what a terminal's backspace key sends
  PtyError error = writeLocked("charPop", "\x7f");
  if (error) {
    return error;
  }
  SessionLock guard(this);
  pendingLine.erase(Utf8Utils::lastCharacterStart(pendingLine));
  return PtyError();
}

string Pty::pendingInput() {
  SessionLock guard(this);
  return pendingLine;
}

string Pty::output() {
  SessionLock guard(this);
  return outputBuffer;
}

string Pty::outputText() {
  int replacements = 0;
  string text = Utf8Utils::sanitize(output(), &replacements);
  if (replacements > 0) {
    VLOG(1) << PtyError(PtyErrorCode::INVALID_UTF8, "outputText",
                        "Replaced " + to_string(replacements) +
                            " malformed sequences");
  }
  return text;
}

string Pty::takeOutput() {
  SessionLock guard(this);
  string bytes;
  bytes.swap(outputBuffer);
  newOutput = false;
  return bytes;
}

string Pty::takeOutputText() {
  SessionLock guard(this);
  string bytes;
  bytes.swap(outputBuffer);
  newOutput = false;
  int before = textDecoder.getReplacementCount();
  string text = textDecoder.decode(bytes);
  if (!alive && textDecoder.hasPending()) {
    // Nothing will ever complete the tail
    text += textDecoder.flush();
  }
  if (textDecoder.getReplacementCount() != before) {
    VLOG(1) << PtyError(PtyErrorCode::INVALID_UTF8, "takeOutputText",
                        "Replaced malformed output with U+FFFD");
  }
  return text;
}

void Pty::clearOutput() {
  SessionLock guard(this);
  outputBuffer.clear();
  textDecoder.reset();
  newOutput = false;
}

bool Pty::hasNewOutput() {
  SessionLock guard(this);
  bool result = newOutput;
  newOutput = false;
  return result;
}

bool Pty::waitForOutput(int timeoutMs) {
  SessionLock guard(this);
  outputCondition.wait_for(guard.lock, std::chrono::milliseconds(timeoutMs),
                           [this]() { return newOutput || !alive; });
  bool result = newOutput;
  newOutput = false;
  return result;
}

PtyError Pty::resize(const TerminalSize& newSize) {
  if (!newSize.isValid()) {
    return PtyError(PtyErrorCode::RESIZE_FAILED, "resize",
                    "Invalid terminal size " + to_string(newSize.rows) + "x" +
                        to_string(newSize.cols));
  }
  if (!isAlive()) {
    return exitedError("resize");
  }
  PtyError error = callBackend("resize", PtyErrorCode::RESIZE_FAILED,
                               [&]() { backend->resize(newSize); });
  if (error) {
    LOG(WARNING) << error;
    return error;
  }
  SessionLock guard(this);
  size = newSize;
  VLOG(1) << "Resized to " << newSize.rows << "x" << newSize.cols;
  return PtyError();
}

PtyError Pty::signal(PtySignal kind) {
  if (!isAlive()) {
    return exitedError("signal");
  }
  PtyError error;
  if (kind == PtySignal::END_OF_INPUT) {
    // Goes through the input stream, so it is ordered with writes
    lock_guard<std::mutex> writeGuard(writeMutex);
    error = callBackend("signal", PtyErrorCode::BROKEN_PIPE,
                        [&]() { backend->signal(kind); });
  } else {
    error = callBackend("signal", PtyErrorCode::SIGNAL_UNSUPPORTED,
                        [&]() { backend->signal(kind); });
  }
  if (!error) {
    VLOG(1) << "Sent " << signalName(kind);
    return error;
  }

  if (error.getCode() == PtyErrorCode::SIGNAL_UNSUPPORTED) {
    bool first;
    {
      SessionLock guard(this);
      first = unsupportedLogged.insert(kind).second;
    }
    if (first) {
      LOG(WARNING) << error;
    }
  } else if (error.getCode() == PtyErrorCode::PROCESS_EXITED) {
    markExited(error.getMessage());
    return exitedError("signal");
  } else {
    LOG(WARNING) << error;
  }
  return error;
}

bool Pty::isAlive() {
  {
    SessionLock guard(this);
    if (!alive) {
      return false;
    }
  }
  if (backend->isAlive()) {
    return true;
  }
  markExited("the child process exited");
  return false;
}

void Pty::terminate() {
  {
    SessionLock guard(this);
    if (closed) {
      return;
    }
    closed = true;
    alive = false;
  }
  outputCondition.notify_all();

  // A writer already inside the backend finishes (or is cancelled) before
  // the descriptors go away. Later writers see the closed flag.
  backend->cancelPendingWrites();
  lock_guard<std::mutex> writeGuard(writeMutex);
  PtyError error = callBackend("terminate", PtyErrorCode::BROKEN_PIPE,
                               [this]() { backend->terminate(); });
  if (error) {
    LOG(WARNING) << "Error while closing the session: " << error;
  }
  VLOG(1) << "Closed session running " << shell;
}

optional<int> Pty::exitCode() {
  try {
    return backend->exitCode();
  } catch (const PtyException& ex) {
    LOG(WARNING) << ex.getError();
    return std::nullopt;
  }
}

TerminalSize Pty::getSize() {
  SessionLock guard(this);
  return size;
}

json Pty::capabilityReport() {
  json report;
  report["backend"] = BackendSelector::backendName(getBackendKind());
  report["description"] = describeBackend();
  report["conptyAvailable"] = BackendSelector::isConPtyAvailable();
  report["fallbackCompiled"] = BackendSelector::isFallbackCompiled();

  json shellInfo;
  shellInfo["kind"] = Shell::kindToString(shell.getKind());
  shellInfo["name"] = shell.getName();
  shellInfo["executable"] = shell.getExecutable();
  shellInfo["args"] = shell.getArgs();
  if (!shell.getVersion().empty()) {
    shellInfo["version"] = shell.getVersion();
  }
  report["shell"] = shellInfo;

  TerminalSize current = getSize();
  report["size"] = {{"rows", current.rows}, {"cols", current.cols}};
  report["alive"] = isAlive();
  optional<int> code = exitCode();
  if (code) {
    report["exitCode"] = *code;
  }
  return report;
}

void Pty::onOutput(const string& bytes) {
  try {
    SessionLock guard(this);
    outputBuffer.append(bytes);
    newOutput = true;
  } catch (const std::bad_alloc& ex) {
    STERROR << "Dropped " << bytes.size() << " bytes of output: " << ex.what();
  }
  outputCondition.notify_all();
  VLOG(2) << "Received " << bytes.size() << " bytes";
}

void Pty::onTransportClosed(const PtyError& reason) {
  markExited(reason.getMessage());
}

PtyError Pty::writeLocked(const string& operation, const string& data) {
  if (!isAlive()) {
    return exitedError(operation);
  }
  if (data.empty()) {
    return PtyError();
  }
  PtyError error = callBackend(operation, PtyErrorCode::BROKEN_PIPE,
                               [&]() { backend->write(data); });
  if (error) {
    if (error.getCode() == PtyErrorCode::PROCESS_EXITED) {
      markExited(error.getMessage());
      return exitedError(operation);
    }
    LOG(WARNING) << error;
    // Refreshes liveness so the caller can tell a dead child from a hiccup
    isAlive();
    return error;
  }
  VLOG(2) << "Wrote " << data.size() << " bytes";
  return error;
}

PtyError Pty::callBackend(const string& operation, PtyErrorCode failureCode,
                          const std::function<void()>& call) {
  try {
    call();
  } catch (const PtyException& ex) {
    return ex.getError();
  } catch (const std::exception& ex) {
    return PtyError(failureCode, operation, ex.what());
  }
  return PtyError();
}

void Pty::markExited(const string& reason) {
  {
    SessionLock guard(this);
    if (!alive) {
      return;
    }
    alive = false;
  }
  outputCondition.notify_all();
  VLOG(1) << "Session ended: " << reason;
}

PtyError Pty::exitedError(const string& operation) {
  bool first;
  bool wasClosed;
  {
    SessionLock guard(this);
    first = !exitLogged;
    exitLogged = true;
    wasClosed = closed;
  }
  PtyError error(PtyErrorCode::PROCESS_EXITED, operation,
                 wasClosed ? "The session is closed" : "The shell has exited");
  if (first) {
    LOG(INFO) << error;
  }
  return error;
}
}  // namespace ox
