#include "BackendSelector.hpp"

#ifdef WIN32
#include "ConPtyBackend.hpp"
#ifdef OX_HAVE_WINPTY
#include "WinPtyBackend.hpp"
#endif
#else
#include "UnixPtyBackend.hpp"
#endif

namespace ox {
const char* signalName(PtySignal signal) {
  switch (signal) {
    case PtySignal::INTERRUPT:
      return "Interrupt";
    case PtySignal::BREAK:
      return "Break";
    case PtySignal::QUIT:
      return "Quit";
    case PtySignal::SUSPEND:
      return "Suspend";
    case PtySignal::END_OF_INPUT:
      return "EndOfInput";
  }
  return "Unknown";
}

bool BackendSelector::isConPtyAvailable() {
#ifdef WIN32
  HMODULE kernel = GetModuleHandleW(L"kernel32.dll");
  if (kernel == NULL) {
    return false;
  }
  return GetProcAddress(kernel, "CreatePseudoConsole") != NULL &&
         GetProcAddress(kernel, "ResizePseudoConsole") != NULL &&
         GetProcAddress(kernel, "ClosePseudoConsole") != NULL;
#else
  return false;
#endif
}

bool BackendSelector::isFallbackCompiled() {
#if defined(WIN32) && defined(OX_HAVE_WINPTY)
  return true;
#else
  return false;
#endif
}

BackendKind BackendSelector::choose(bool windows, bool conptyAvailable,
                                    bool fallbackCompiled) {
  if (!windows) {
    return BackendKind::UNIX;
  }
  if (conptyAvailable) {
    return BackendKind::CONPTY;
  }
  if (fallbackCompiled) {
    LOG(INFO) << "ConPTY is not available, using the winpty fallback";
    return BackendKind::WINPTY;
  }
  throw PtyException(PtyErrorCode::NOT_AVAILABLE, "selectBackend",
                     "ConPTY requires Windows 10 1809 or later and no "
                     "fallback backend was built");
}

unique_ptr<PtyBackend> BackendSelector::create(BackendKind kind) {
  switch (kind) {
#ifdef WIN32
    case BackendKind::CONPTY:
      return unique_ptr<PtyBackend>(new ConPtyBackend());
#ifdef OX_HAVE_WINPTY
    case BackendKind::WINPTY:
      return unique_ptr<PtyBackend>(new WinPtyBackend());
#endif
#else
    case BackendKind::UNIX:
      return unique_ptr<PtyBackend>(new UnixPtyBackend());
#endif
    default:
      break;
  }
  throw PtyException(PtyErrorCode::NOT_AVAILABLE, "createBackend",
                     "The " + backendName(kind) +
                         " backend is not built for this platform");
}

string BackendSelector::backendName(BackendKind kind) {
  switch (kind) {
    case BackendKind::UNIX:
      return "unix";
    case BackendKind::CONPTY:
      return "conpty";
    case BackendKind::WINPTY:
      return "winpty";
  }
  return "unknown";
}
}  // namespace ox
