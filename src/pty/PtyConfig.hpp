#ifndef __OX_PTY_CONFIG__
#define __OX_PTY_CONFIG__

#include "Headers.hpp"
#include "Pty.hpp"
#include "SimpleIni.h"

namespace ox {
/**
 * @brief Settings read from oxpty.ini.
 *
 * [Shell] program/args/cwd, [Terminal] rows/cols, [Backend] conpty and
 * [Debug] verbose/logtostdout/logdir. Anything missing keeps its default.
 */
class PtyConfig {
 public:
  PtyConfig();

  /** @brief `<config home>/oxpty/oxpty.ini`. */
  static string defaultConfigPath();

  /**
   * @brief Reads `path` on top of the current values.
   *
   * A missing file leaves the defaults and returns false. Malformed values
   * are logged and skipped.
   */
  bool loadFromFile(const string& path);

  /** @brief Same as loadFromFile() for INI text already in memory. */
  bool loadFromString(const string& contents);

  /**
   * @brief Sets the shell to "auto", a kind name such as "pwsh", or a
   * command line such as "/usr/bin/bash --norc".
   */
  void setProgram(const string& _program);

  /** @brief Selector and size for Pty::open. */
  PtyOptions toOptions() const;

  string program;
  vector<string> args;
  string workingDirectory;
  TerminalSize size;
  bool conptyDisabled;
  int verbose;
  bool logToStdout;
  string logDirectory;

 protected:
  void apply(const CSimpleIniA& ini);
};
}  // namespace ox

#endif  // __OX_PTY_CONFIG__
