#ifndef __OX_SHELL__
#define __OX_SHELL__

#include "Headers.hpp"

namespace ox {
/** @brief Identity of an interactive program that can run in a pane. */
enum class ShellKind {
  POWERSHELL_CORE,
  POWERSHELL,
  CMD,
  WSL,
  GIT_BASH,
  BASH,
  ZSH,
  FISH,
  DASH,
  CUSTOM,
};

/**
 * @brief A resolved shell: identity, absolute executable and arguments.
 *
 * Instances are immutable; the `with*` methods return modified copies.
 */
class Shell {
 public:
  Shell() : kind(ShellKind::CUSTOM) {}

  Shell(ShellKind _kind, const string& _executable,
        const vector<string>& _args = vector<string>(),
        const string& _version = string())
      : kind(_kind), executable(_executable), args(_args), version(_version) {}

  ShellKind getKind() const { return kind; }
  const string& getExecutable() const { return executable; }
  const vector<string>& getArgs() const { return args; }
  /** @brief Version line reported by the shell, empty until probed. */
  const string& getVersion() const { return version; }

  /** @brief Human readable name, the file name for custom shells. */
  string getName() const;

  /** @brief True for shells that only run on Windows hosts. */
  bool isWindowsShell() const;

  Shell withExtraArgs(const vector<string>& extraArgs) const;
  Shell withVersion(const string& _version) const;

  /** @brief Executable followed by the arguments. */
  vector<string> getArgv() const;

  /** @brief CreateProcess command line with every element quoted as needed. */
  string toCommandLine() const;

  bool operator==(const Shell& other) const {
    return kind == other.kind && executable == other.executable &&
           args == other.args;
  }
  bool operator!=(const Shell& other) const { return !(*this == other); }

  /** @brief Config/CLI name: pwsh, powershell, cmd, wsl, gitbash, bash... */
  static string kindToString(ShellKind kind);
  static optional<ShellKind> kindFromString(const string& name);
  static string displayName(ShellKind kind);

  /** @brief File name searched on PATH for `kind`. */
  static string commandName(ShellKind kind, bool windows);

  static vector<string> defaultArgs(ShellKind kind);

  /** @brief Infers the identity of an executable from its file name. */
  static ShellKind kindFromExecutable(const string& path);

  /**
   * @brief Splits a user supplied command such as "pwsh -NoLogo".
   *
   * Double quotes group words. With `windows` set, bare cmd, powershell,
   * pwsh, wsl and bash get their ".exe" suffix.
   */
  static pair<string, vector<string>> splitCommandLine(const string& commandLine,
                                                       bool windows);

  /** @brief Quotes one argument following the CommandLineToArgvW rules. */
  static string quoteArgument(const string& arg);

 protected:
  ShellKind kind;
  string executable;
  vector<string> args;
  string version;
};

std::ostream& operator<<(std::ostream& os, const Shell& shell);

/**
 * @brief What the caller asked for when opening a session.
 *
 * Either auto-detect, a shell kind resolved through the registry, or an
 * explicit executable path. Extra arguments are appended to the shell's
 * defaults.
 */
class ShellSelector {
 public:
  ShellSelector() : autoDetect(true), kind(ShellKind::CUSTOM) {}

  static ShellSelector detect() { return ShellSelector(); }

  static ShellSelector forKind(ShellKind _kind) {
    ShellSelector selector;
    selector.autoDetect = false;
    selector.kind = _kind;
    return selector;
  }

  static ShellSelector forPath(const string& _path) {
    ShellSelector selector;
    selector.autoDetect = false;
    selector.kind = ShellKind::CUSTOM;
    selector.path = _path;
    return selector;
  }

  bool autoDetect;
  ShellKind kind;
  /** @brief Executable for CUSTOM, or an override path for a known kind. */
  string path;
  vector<string> extraArgs;
  /** @brief Initial working directory, empty to inherit ours. */
  string workingDirectory;
};
}  // namespace ox

#endif  // __OX_SHELL__
