#include "ShellRegistry.hpp"

namespace ox {
bool ShellEnvironment::isWindows() const {
#ifdef WIN32
  return true;
#else
  return false;
#endif
}

optional<string> ShellEnvironment::getVariable(const string& name) const {
#ifdef WIN32
  // getenv answers in the ANSI code page, paths are handled as UTF-8
  const wchar_t* value = ::_wgetenv(Utf8ToWide(name).c_str());
  if (value == NULL) {
    return std::nullopt;
  }
  return WideToUtf8(value);
#else
  const char* value = ::getenv(name.c_str());
  if (value == NULL) {
    return std::nullopt;
  }
  return string(value);
#endif
}

bool ShellEnvironment::isExecutable(const string& path) const {
  if (path.empty()) {
    return false;
  }
#ifdef WIN32
  std::wstring widePath;
  try {
    widePath = Utf8ToWide(path);
  } catch (const std::range_error&) {
    LOG(WARNING) << "Skipping a path that is not valid UTF-8: " << path;
    return false;
  }
  DWORD attributes = GetFileAttributesW(widePath.c_str());
  return attributes != INVALID_FILE_ATTRIBUTES &&
         !(attributes & FILE_ATTRIBUTE_DIRECTORY);
#else
  struct stat st;
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return false;
  }
  return ::access(path.c_str(), X_OK) == 0;
#endif
}

ShellRegistry::ShellRegistry()
    : ShellRegistry(make_shared<ShellEnvironment>(),
                    make_shared<SubprocessUtils>()) {}

ShellRegistry::ShellRegistry(shared_ptr<ShellEnvironment> _environment)
    : ShellRegistry(_environment, make_shared<SubprocessUtils>()) {}

ShellRegistry::ShellRegistry(shared_ptr<ShellEnvironment> _environment,
                             shared_ptr<SubprocessUtils> _subprocessUtils)
    : environment(_environment), subprocessUtils(_subprocessUtils) {}

vector<ShellKind> ShellRegistry::priorityOrder() const {
  if (environment->isWindows()) {
    return {ShellKind::POWERSHELL_CORE, ShellKind::POWERSHELL, ShellKind::CMD,
            ShellKind::WSL, ShellKind::GIT_BASH};
  }
  return {ShellKind::BASH, ShellKind::ZSH, ShellKind::FISH, ShellKind::DASH};
}

Shell ShellRegistry::detect() const {
  if (!environment->isWindows()) {
    optional<Shell> loginShell = fromShellVariable();
    if (loginShell) {
      VLOG(1) << "Using $SHELL: " << *loginShell;
      return *loginShell;
    }
  }
  for (auto kind : priorityOrder()) {
    optional<Shell> shell = find(kind);
    if (shell) {
      VLOG(1) << "Detected shell: " << *shell;
      return *shell;
    }
  }
  if (!environment->isWindows() && environment->isExecutable("/bin/sh")) {
    LOG(INFO) << "No known shell found, falling back to /bin/sh";
    return Shell(ShellKind::CUSTOM, "/bin/sh");
  }
  throw PtyException(PtyErrorCode::SPAWN_FAILED, "detect",
                     "No usable shell found on this system");
}

vector<Shell> ShellRegistry::available() const {
  vector<Shell> shells;
  auto addUnique = [&shells](const Shell& shell) {
    for (const auto& existing : shells) {
      if (existing.getExecutable() == shell.getExecutable()) {
        return;
      }
    }
    shells.push_back(shell);
  };

  for (auto kind : priorityOrder()) {
    optional<Shell> shell = find(kind);
    if (shell) {
      addUnique(*shell);
    }
  }
  if (!environment->isWindows()) {
    // A login shell outside the known list (e.g. nushell) is still offered.
    optional<Shell> loginShell = fromShellVariable();
    if (loginShell) {
      addUnique(*loginShell);
    }
  }
  return shells;
}

optional<Shell> ShellRegistry::find(ShellKind kind) const {
  if (kind == ShellKind::CUSTOM) {
    return std::nullopt;
  }
  bool windows = environment->isWindows();
  if (Shell(kind, "").isWindowsShell() != windows) {
    return std::nullopt;
  }

  vector<string> candidates;
  if (kind == ShellKind::CMD) {
    optional<string> comSpec = environment->getVariable("ComSpec");
    if (comSpec && !comSpec->empty()) {
      candidates.push_back(*comSpec);
    }
  }
  // bash.exe on PATH is usually the WSL launcher, so Git Bash is only
  // looked for in its install locations.
  if (kind != ShellKind::GIT_BASH) {
    optional<string> onPath = findOnPath(Shell::commandName(kind, windows));
    if (onPath) {
      candidates.push_back(*onPath);
    }
  }
  vector<string> locations = wellKnownLocations(kind);
  candidates.insert(candidates.end(), locations.begin(), locations.end());

  optional<string> executable = firstExecutable(candidates);
  if (!executable) {
    VLOG(2) << Shell::displayName(kind) << " not found";
    return std::nullopt;
  }
  return Shell(kind, *executable, Shell::defaultArgs(kind));
}

Shell ShellRegistry::resolve(const ShellSelector& selector) const {
  Shell shell;
  if (selector.autoDetect) {
    shell = detect();
  } else if (selector.kind != ShellKind::CUSTOM && selector.path.empty()) {
    optional<Shell> found = find(selector.kind);
    if (!found) {
      throw PtyException(PtyErrorCode::SPAWN_FAILED, "resolve",
                         Shell::displayName(selector.kind) +
                             " is not installed");
    }
    shell = *found;
  } else {
    if (selector.path.empty()) {
      throw PtyException(PtyErrorCode::SPAWN_FAILED, "resolve",
                         "Custom shell requested without a path");
    }
    string executable = selector.path;
    if (executable.find_first_of("/\\") == string::npos) {
      optional<string> onPath = findOnPath(executable);
      if (!onPath && environment->isWindows()) {
        onPath = findOnPath(executable + ".exe");
      }
      if (!onPath) {
        throw PtyException(PtyErrorCode::SPAWN_FAILED, "resolve",
                           executable + " was not found on PATH");
      }
      executable = *onPath;
    } else if (!environment->isExecutable(executable)) {
      throw PtyException(PtyErrorCode::SPAWN_FAILED, "resolve",
                         executable + " is not an executable file");
    }
    ShellKind kind = selector.kind != ShellKind::CUSTOM
                         ? selector.kind
                         : Shell::kindFromExecutable(executable);
    shell = Shell(kind, executable, Shell::defaultArgs(kind));
  }
  return shell.withExtraArgs(selector.extraArgs);
}

optional<string> ShellRegistry::findOnPath(const string& name) const {
  optional<string> path = environment->getVariable("PATH");
  if (!path && environment->isWindows()) {
    path = environment->getVariable("Path");
  }
  if (!path) {
    return std::nullopt;
  }
  char separator = environment->isWindows() ? ';' : ':';
  for (const auto& directory : split(*path, separator)) {
    if (directory.empty()) {
      continue;
    }
    string candidate = joinPath(directory, name);
    if (environment->isExecutable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

Shell ShellRegistry::probeVersion(const Shell& shell) const {
  vector<string> versionArgs;
  switch (shell.getKind()) {
    case ShellKind::CMD:
      versionArgs = {"/c", "ver"};
      break;
    case ShellKind::POWERSHELL_CORE:
    case ShellKind::POWERSHELL:
      versionArgs = {"-NoLogo", "-NoProfile", "-Command",
                     "$PSVersionTable.PSVersion.ToString()"};
      break;
    case ShellKind::WSL:
      // wsl.exe answers in UTF-16 and may start a distribution
      return shell;
    default:
      versionArgs = {"--version"};
      break;
  }
  try {
    string output = subprocessUtils->SubprocessToStringInteractive(
        shell.getExecutable(), versionArgs);
    return shell.withVersion(SubprocessUtils::firstLine(output));
  } catch (const std::runtime_error& ex) {
    VLOG(1) << "Cannot probe version of " << shell << ": " << ex.what();
    return shell;
  }
}

vector<string> ShellRegistry::wellKnownLocations(ShellKind kind) const {
  vector<string> locations;
  if (!environment->isWindows()) {
    static const vector<string> binDirectories = {
        "/bin", "/usr/bin", "/usr/local/bin", "/opt/homebrew/bin"};
    for (const auto& directory : binDirectories) {
      locations.push_back(joinPath(directory, Shell::commandName(kind, false)));
    }
    return locations;
  }

  string systemRoot =
      environment->getVariable("SystemRoot").value_or("C:\\Windows");
  string programFiles =
      environment->getVariable("ProgramFiles").value_or("C:\\Program Files");
  optional<string> programFilesX86 =
      environment->getVariable("ProgramFiles(x86)");
  string system32 = joinPath(systemRoot, "System32");

  switch (kind) {
    case ShellKind::POWERSHELL_CORE:
      locations.push_back(joinPath(programFiles, "PowerShell\\7\\pwsh.exe"));
      locations.push_back(joinPath(programFiles, "PowerShell\\6\\pwsh.exe"));
      break;
    case ShellKind::POWERSHELL:
      locations.push_back(
          joinPath(system32, "WindowsPowerShell\\v1.0\\powershell.exe"));
      break;
    case ShellKind::CMD:
      locations.push_back(joinPath(system32, "cmd.exe"));
      break;
    case ShellKind::WSL:
      locations.push_back(joinPath(system32, "wsl.exe"));
      break;
    case ShellKind::GIT_BASH: {
      locations.push_back(joinPath(programFiles, "Git\\bin\\bash.exe"));
      if (programFilesX86) {
        locations.push_back(joinPath(*programFilesX86, "Git\\bin\\bash.exe"));
      }
      locations.push_back("C:\\Git\\bin\\bash.exe");
      // git.exe lives in <root>\cmd, bash.exe in <root>\bin
      optional<string> git = findOnPath("git.exe");
      if (git) {
        string gitRoot = parentDirectory(parentDirectory(*git));
        if (!gitRoot.empty()) {
          locations.push_back(joinPath(gitRoot, "bin\\bash.exe"));
        }
      }
      break;
    }
    default:
      break;
  }
  return locations;
}

optional<string> ShellRegistry::firstExecutable(
    const vector<string>& candidates) const {
  for (const auto& candidate : candidates) {
    if (environment->isExecutable(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

optional<Shell> ShellRegistry::fromShellVariable() const {
  optional<string> shellVariable = environment->getVariable("SHELL");
  if (!shellVariable || trim(*shellVariable).empty()) {
    return std::nullopt;
  }
  string executable = trim(*shellVariable);
  if (executable.find('/') == string::npos) {
    optional<string> onPath = findOnPath(executable);
    if (!onPath) {
      return std::nullopt;
    }
    executable = *onPath;
  } else if (!environment->isExecutable(executable)) {
    LOG(WARNING) << "$SHELL points at " << executable
                 << " which is not executable";
    return std::nullopt;
  }
  ShellKind kind = Shell::kindFromExecutable(executable);
  return Shell(kind, executable, Shell::defaultArgs(kind));
}

string ShellRegistry::joinPath(const string& directory,
                               const string& name) const {
  if (directory.empty()) {
    return name;
  }
  char last = directory.back();
  if (last == '/' || last == '\\') {
    return directory + name;
  }
  return directory + (environment->isWindows() ? "\\" : "/") + name;
}

string ShellRegistry::parentDirectory(const string& path) const {
  string trimmed = path;
  while (trimmed.size() > 1 &&
         (trimmed.back() == '/' || trimmed.back() == '\\')) {
    trimmed.pop_back();
  }
  auto slash = trimmed.find_last_of("/\\");
  if (slash == string::npos) {
    return string();
  }
  return trimmed.substr(0, slash);
}
}  // namespace ox
