#include "Shell.hpp"

namespace ox {
namespace {
// Base name without directories or a trailing ".exe", lower cased.
string executableStem(const string& path) {
  auto slash = path.find_last_of("/\\");
  string name = toLower(slash == string::npos ? path : path.substr(slash + 1));
  if (name.size() > 4 && name.compare(name.size() - 4, 4, ".exe") == 0) {
    name.resize(name.size() - 4);
  }
  return name;
}
}  // namespace

string Shell::getName() const {
  if (kind == ShellKind::CUSTOM) {
    auto slash = executable.find_last_of("/\\");
    return slash == string::npos ? executable : executable.substr(slash + 1);
  }
  return displayName(kind);
}

bool Shell::isWindowsShell() const {
  switch (kind) {
    case ShellKind::POWERSHELL_CORE:
    case ShellKind::POWERSHELL:
    case ShellKind::CMD:
    case ShellKind::WSL:
    case ShellKind::GIT_BASH:
      return true;
    default:
      return false;
  }
}

Shell Shell::withExtraArgs(const vector<string>& extraArgs) const {
  Shell copy(*this);
  copy.args.insert(copy.args.end(), extraArgs.begin(), extraArgs.end());
  return copy;
}

Shell Shell::withVersion(const string& _version) const {
  Shell copy(*this);
  copy.version = _version;
  return copy;
}

vector<string> Shell::getArgv() const {
  vector<string> argv;
  argv.push_back(executable);
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

string Shell::toCommandLine() const {
  string commandLine;
  for (const auto& arg : getArgv()) {
    if (!commandLine.empty()) {
      commandLine += " ";
    }
    commandLine += quoteArgument(arg);
  }
  return commandLine;
}

string Shell::kindToString(ShellKind kind) {
  switch (kind) {
    case ShellKind::POWERSHELL_CORE:
      return "pwsh";
    case ShellKind::POWERSHELL:
      return "powershell";
    case ShellKind::CMD:
      return "cmd";
    case ShellKind::WSL:
      return "wsl";
    case ShellKind::GIT_BASH:
      return "gitbash";
    case ShellKind::BASH:
      return "bash";
    case ShellKind::ZSH:
      return "zsh";
    case ShellKind::FISH:
      return "fish";
    case ShellKind::DASH:
      return "dash";
    case ShellKind::CUSTOM:
      return "custom";
  }
  return "custom";
}

optional<ShellKind> Shell::kindFromString(const string& name) {
  string lowered = toLower(trim(name));
  if (lowered == "pwsh" || lowered == "powershellcore") {
    return ShellKind::POWERSHELL_CORE;
  }
  if (lowered == "powershell") {
    return ShellKind::POWERSHELL;
  }
  if (lowered == "cmd") {
    return ShellKind::CMD;
  }
  if (lowered == "wsl") {
    return ShellKind::WSL;
  }
  if (lowered == "gitbash" || lowered == "git-bash") {
    return ShellKind::GIT_BASH;
  }
  if (lowered == "bash") {
    return ShellKind::BASH;
  }
  if (lowered == "zsh") {
    return ShellKind::ZSH;
  }
  if (lowered == "fish") {
    return ShellKind::FISH;
  }
  if (lowered == "dash") {
    return ShellKind::DASH;
  }
  return std::nullopt;
}

string Shell::displayName(ShellKind kind) {
  switch (kind) {
    case ShellKind::POWERSHELL_CORE:
      return "PowerShell Core";
    case ShellKind::POWERSHELL:
      return "Windows PowerShell";
    case ShellKind::CMD:
      return "Command Prompt";
    case ShellKind::WSL:
      return "WSL";
    case ShellKind::GIT_BASH:
      return "Git Bash";
    case ShellKind::BASH:
      return "Bash";
    case ShellKind::ZSH:
      return "Zsh";
    case ShellKind::FISH:
      return "Fish";
    case ShellKind::DASH:
      return "Dash";
    case ShellKind::CUSTOM:
      return "Custom";
  }
  return "Custom";
}

string Shell::commandName(ShellKind kind, bool windows) {
  string name = kindToString(kind);
  if (kind == ShellKind::GIT_BASH) {
    name = "bash";
  }
  if (windows) {
    name += ".exe";
  }
  return name;
}

vector<string> Shell::defaultArgs(ShellKind kind) {
  switch (kind) {
    case ShellKind::POWERSHELL_CORE:
    case ShellKind::POWERSHELL:
      return {"-NoLogo"};
    case ShellKind::GIT_BASH:
      return {"--login", "-i"};
    default:
      return {};
  }
}

ShellKind Shell::kindFromExecutable(const string& path) {
  string stem = executableStem(path);
  if (stem == "bash") {
    string lowered = toLower(path);
    if (lowered.find("\\git\\") != string::npos ||
        lowered.find("/git/") != string::npos) {
      return ShellKind::GIT_BASH;
    }
    return ShellKind::BASH;
  }
  optional<ShellKind> kind = kindFromString(stem);
  if (kind && *kind != ShellKind::GIT_BASH) {
    return *kind;
  }
  return ShellKind::CUSTOM;
}

pair<string, vector<string>> Shell::splitCommandLine(const string& commandLine,
                                                     bool windows) {
  vector<string> tokens;
  string current;
  bool inQuotes = false;
  bool haveToken = false;
  for (char c : commandLine) {
    if (c == '"') {
      inQuotes = !inQuotes;
      haveToken = true;
    } else if ((c == ' ' || c == '\t') && !inQuotes) {
      if (haveToken) {
        tokens.push_back(current);
        current.clear();
        haveToken = false;
      }
    } else {
      current.push_back(c);
      haveToken = true;
    }
  }
  if (haveToken) {
    tokens.push_back(current);
  }
  if (tokens.empty()) {
    return make_pair(string(), vector<string>());
  }

  string program = tokens[0];
  if (windows) {
    static const set<string> bareNames = {"cmd", "powershell", "pwsh", "wsl",
                                          "bash"};
    if (bareNames.count(toLower(program))) {
      program += ".exe";
    }
  }
  return make_pair(program, vector<string>(tokens.begin() + 1, tokens.end()));
}

string Shell::quoteArgument(const string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == string::npos) {
    return arg;
  }
  string quoted = "\"";
  size_t backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      backslashes++;
      continue;
    }
    if (c == '"') {
      // Backslashes before a quote are doubled, plus one for the quote.
      quoted.append(backslashes * 2 + 1, '\\');
    } else {
      quoted.append(backslashes, '\\');
    }
    backslashes = 0;
    quoted.push_back(c);
  }
  // Trailing backslashes precede the closing quote.
  quoted.append(backslashes * 2, '\\');
  quoted.push_back('"');
  return quoted;
}

std::ostream& operator<<(std::ostream& os, const Shell& shell) {
  os << shell.getName() << " (" << shell.getExecutable();
  for (const auto& arg : shell.getArgs()) {
    os << " " << arg;
  }
  return os << ")";
}
}  // namespace ox
