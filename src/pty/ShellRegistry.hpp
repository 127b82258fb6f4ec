#ifndef __OX_SHELL_REGISTRY__
#define __OX_SHELL_REGISTRY__

#include "Headers.hpp"
#include "PtyError.hpp"
#include "Shell.hpp"
#include "SubprocessUtils.hpp"

namespace ox {
/**
 * @brief Environment variables and file probes seen by shell detection.
 *
 * The default implementation queries the real process environment and
 * filesystem. Tests derive from it to describe a fake machine.
 */
class ShellEnvironment {
 public:
  virtual ~ShellEnvironment() {}

  /** @brief Whether paths and shells follow Windows conventions. */
  virtual bool isWindows() const;

  virtual optional<string> getVariable(const string& name) const;

  /** @brief True when `path` names an existing, executable regular file. */
  virtual bool isExecutable(const string& path) const;
};

/**
 * @brief Finds and ranks the shells installed on this machine.
 *
 * The registry holds no state besides its probes: every call looks at the
 * environment again, so callers that want caching keep their own copy of
 * the results.
 */
class ShellRegistry {
 public:
  ShellRegistry();
  explicit ShellRegistry(shared_ptr<ShellEnvironment> _environment);
  ShellRegistry(shared_ptr<ShellEnvironment> _environment,
                shared_ptr<SubprocessUtils> _subprocessUtils);

  /**
   * @brief Best available shell for this platform.
   *
   * Windows: PowerShell Core, Windows PowerShell, cmd, WSL, Git Bash.
   * Unix: $SHELL, then bash, zsh, fish, dash, then /bin/sh. Throws
   * SpawnFailed only when nothing at all can be found.
   */
  Shell detect() const;

  /** @brief Every shell found, in priority order, without duplicates. */
  vector<Shell> available() const;

  /** @brief Locates one kind of shell, nullopt when it is not installed. */
  optional<Shell> find(ShellKind kind) const;

  /**
   * @brief Turns a selector into a launchable shell.
   *
   * Throws SpawnFailed when the requested shell cannot be located.
   */
  Shell resolve(const ShellSelector& selector) const;

  /** @brief Searches each PATH entry for `name`. */
  optional<string> findOnPath(const string& name) const;

  /** @brief Returns `shell` with its version line filled in, when possible. */
  Shell probeVersion(const Shell& shell) const;

  /** @brief Fixed ranking of the known kinds for this platform. */
  vector<ShellKind> priorityOrder() const;

 protected:
  shared_ptr<ShellEnvironment> environment;
  shared_ptr<SubprocessUtils> subprocessUtils;

  /** @brief Install locations checked after PATH. */
  vector<string> wellKnownLocations(ShellKind kind) const;

  optional<string> firstExecutable(const vector<string>& candidates) const;

  /** @brief The user's login shell from $SHELL (Unix only). */
  optional<Shell> fromShellVariable() const;

  string joinPath(const string& directory, const string& name) const;
  string parentDirectory(const string& path) const;
};
}  // namespace ox

#endif  // __OX_SHELL_REGISTRY__
