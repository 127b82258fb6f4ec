#include "PtyConfig.hpp"

#include "LogHandler.hpp"

namespace ox {
namespace {
// Parses a whole string as an int, rejecting trailing garbage.
optional<int> parseInt(const char* value) {
  if (value == NULL) {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    string text = trim(value);
    int result = stoi(text, &consumed);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return result;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

optional<bool> parseBool(const char* value) {
  if (value == NULL) {
    return std::nullopt;
  }
  string text = toLower(trim(value));
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    return true;
  }
  if (text == "0" || text == "false" || text == "no" || text == "off") {
    return false;
  }
  return std::nullopt;
}
}  // namespace

PtyConfig::PtyConfig()
    : program("auto"),
      conptyDisabled(false),
      verbose(0),
      logToStdout(false),
      logDirectory(LogHandler::defaultLogDirectory()) {}

string PtyConfig::defaultConfigPath() {
  return (fs::path(sago::getConfigHome()) / "oxpty" / "oxpty.ini").string();
}

bool PtyConfig::loadFromFile(const string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    VLOG(1) << "No config file at " << path << ", using defaults";
    return false;
  }
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Invalid config file: " << path;
    return false;
  }
  apply(ini);
  VLOG(1) << "Loaded config from " << path;
  return true;
}

bool PtyConfig::loadFromString(const string& contents) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(contents.c_str(), contents.size());
  if (rc < 0) {
    LOG(WARNING) << "Invalid config data";
    return false;
  }
  apply(ini);
  return true;
}

void PtyConfig::apply(const CSimpleIniA& ini) {
  const char* programValue = ini.GetValue("Shell", "program", NULL);
  if (programValue) {
    setProgram(trim(programValue));
  }
  const char* argsValue = ini.GetValue("Shell", "args", NULL);
  if (argsValue) {
    args = splitWhitespace(argsValue);
  }
  const char* cwdValue = ini.GetValue("Shell", "cwd", NULL);
  if (cwdValue) {
    workingDirectory = trim(cwdValue);
  }

  const char* rowsValue = ini.GetValue("Terminal", "rows", NULL);
  const char* colsValue = ini.GetValue("Terminal", "cols", NULL);
  optional<int> rows = parseInt(rowsValue);
  optional<int> cols = parseInt(colsValue);
  if (rowsValue && (!rows || !TerminalSize(*rows, 1).isValid())) {
    LOG(WARNING) << "Ignoring invalid [Terminal] rows: " << rowsValue;
  } else if (rows) {
    size.rows = *rows;
  }
  if (colsValue && (!cols || !TerminalSize(1, *cols).isValid())) {
    LOG(WARNING) << "Ignoring invalid [Terminal] cols: " << colsValue;
  } else if (cols) {
    size.cols = *cols;
  }

  const char* conptyValue = ini.GetValue("Backend", "conpty", NULL);
  if (conptyValue) {
    string mode = toLower(trim(conptyValue));
    if (mode == "auto") {
      conptyDisabled = false;
    } else if (mode == "disabled") {
      conptyDisabled = true;
    } else {
      LOG(WARNING) << "Ignoring invalid [Backend] conpty: " << conptyValue;
    }
  }

  const char* verboseValue = ini.GetValue("Debug", "verbose", NULL);
  optional<int> level = parseInt(verboseValue);
  if (level) {
    verbose = *level;
  } else if (verboseValue) {
    LOG(WARNING) << "Ignoring invalid [Debug] verbose: " << verboseValue;
  }
  const char* stdoutValue = ini.GetValue("Debug", "logtostdout", NULL);
  optional<bool> toStdout = parseBool(stdoutValue);
  if (toStdout) {
    logToStdout = *toStdout;
  } else if (stdoutValue) {
    LOG(WARNING) << "Ignoring invalid [Debug] logtostdout: " << stdoutValue;
  }
  const char* logdirValue = ini.GetValue("Debug", "logdir", NULL);
  if (logdirValue && !trim(logdirValue).empty()) {
    logDirectory = trim(logdirValue);
  }
}

void PtyConfig::setProgram(const string& _program) {
  program = _program.empty() ? string("auto") : _program;
}

PtyOptions PtyConfig::toOptions() const {
  PtyOptions options;
  if (program == "auto") {
    options.shell = ShellSelector::detect();
  } else {
    optional<ShellKind> kind = Shell::kindFromString(program);
    if (kind && *kind != ShellKind::CUSTOM) {
      options.shell = ShellSelector::forKind(*kind);
    } else {
#ifdef WIN32
      auto command = Shell::splitCommandLine(program, true);
#else
      auto command = Shell::splitCommandLine(program, false);
#endif
      options.shell = ShellSelector::forPath(command.first);
      options.shell.extraArgs = command.second;
    }
  }
  options.shell.extraArgs.insert(options.shell.extraArgs.end(), args.begin(),
                                 args.end());
  options.shell.workingDirectory = workingDirectory;
  options.size = size;
  if (conptyDisabled) {
    options.conptyProbe = []() { return false; };
  }
  return options;
}
}  // namespace ox
