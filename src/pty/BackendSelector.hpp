#ifndef __OX_BACKEND_SELECTOR__
#define __OX_BACKEND_SELECTOR__

#include "PtyBackend.hpp"

namespace ox {
/**
 * @brief Picks and constructs the pty backend for this host.
 *
 * Unix hosts always get forkpty. Windows hosts get ConPTY when kernel32
 * exports it (Windows 10 1809 and later) and winpty otherwise.
 */
class BackendSelector {
 public:
  /**
   * @brief True when CreatePseudoConsole can be resolved at runtime.
   *
   * Always false off Windows.
   */
  static bool isConPtyAvailable();

  /** @brief True when the winpty fallback was compiled in. */
  static bool isFallbackCompiled();

  /**
   * @brief The backend to use given what the host offers.
   *
   * Throws NotAvailable on a Windows host with neither ConPTY nor a
   * compiled fallback.
   */
  static BackendKind choose(bool windows, bool conptyAvailable,
                            bool fallbackCompiled);

  /** @brief Throws NotAvailable when `kind` is not built for this platform. */
  static unique_ptr<PtyBackend> create(BackendKind kind);

  static string backendName(BackendKind kind);
};
}  // namespace ox

#endif  // __OX_BACKEND_SELECTOR__
