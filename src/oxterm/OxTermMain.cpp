#include <cxxopts.hpp>

#include "HostConsole.hpp"
#include "LogHandler.hpp"
#include "Pty.hpp"
#include "PtyConfig.hpp"

using namespace ox;

namespace {
const int COMMAND_TIMEOUT_MS = 10000;

#ifndef WIN32
volatile sig_atomic_t windowChanged = 0;

void handleWindowChange(int) { windowChanged = 1; }
#endif

#ifdef WIN32
const char* ENTER_KEY = "\r";
#else
const char* ENTER_KEY = "\n";
#endif

void writeToStdout(const string& s) {
  if (s.empty()) {
    return;
  }
  fwrite(s.data(), 1, s.size(), stdout);
  fflush(stdout);
}

void resizeSession(Pty* pty, const TerminalSize& size) {
  PtyError error = pty->resize(size);
  if (error) {
    LOG(WARNING) << "Resize to " << size.rows << "x" << size.cols
                 << " failed: " << error;
  }
}

json backendInfo(const PtyOptions& options) {
  PtyError error;
  shared_ptr<Pty> pty = Pty::open(options, &error);
  if (!pty) {
    json report;
    report["conptyAvailable"] = BackendSelector::isConPtyAvailable();
    report["fallbackCompiled"] = BackendSelector::isFallbackCompiled();
    report["error"] = error.toString();
    return report;
  }
  json report = pty->capabilityReport();
  pty->terminate();
  return report;
}

int listShells() {
  ShellRegistry registry;
  vector<Shell> shells = registry.available();
  if (shells.empty()) {
    CLOG(INFO, "stdout") << "No shells found" << endl;
    return 1;
  }
  for (const auto& found : shells) {
    Shell shell = registry.probeVersion(found);
    CLOG(INFO, "stdout") << Shell::kindToString(shell.getKind()) << "\t"
                         << shell.getName() << "\t" << shell.getExecutable()
                         << (shell.getVersion().empty()
                                 ? string()
                                 : "\t" + shell.getVersion())
                         << endl;
  }
  return 0;
}

// Runs one command, echoes everything the shell prints and exits.
int runOneCommand(const PtyOptions& options, const string& command) {
  PtyError error;
  shared_ptr<Pty> pty = Pty::open(options, &error);
  if (!pty) {
    CLOG(ERROR, "stdout") << error << endl;
    return 1;
  }
  error = pty->silentRunCommand(command + ENTER_KEY + "exit" + ENTER_KEY);
  if (error) {
    CLOG(ERROR, "stdout") << error << endl;
    return 1;
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(COMMAND_TIMEOUT_MS);
  while (pty->isAlive() && std::chrono::steady_clock::now() < deadline) {
    pty->waitForOutput(100);
    writeToStdout(pty->takeOutputText());
  }
  writeToStdout(pty->takeOutputText());
  if (pty->isAlive()) {
    LOG(WARNING) << "Shell did not exit after the command, closing it";
  }
  pty->terminate();
  optional<int> code = pty->exitCode();
  return code ? *code : 1;
}

int runInteractive(const PtyOptions& baseOptions) {
  HostConsole console;
  PtyOptions options = baseOptions;
  bool interactive = HostConsole::isInteractive();
  if (interactive) {
    options.size = console.getSize();
  }

  PtyError error;
  shared_ptr<Pty> pty = Pty::open(options, &error);
  if (!pty) {
    CLOG(ERROR, "stdout") << error << endl;
    return 1;
  }
  LOG(INFO) << "Running " << pty->getShell() << " on "
            << pty->describeBackend();

  if (interactive) {
    console.setup();
  }
#ifndef WIN32
  ::signal(SIGWINCH, handleWindowChange);
#endif

  bool stdinOpen = true;
  TerminalSize lastSize = options.size;
  while (pty->isAlive()) {
#ifdef WIN32
    if (stdinOpen) {
      DWORD events = 0;
      INPUT_RECORD buffer[128];
      HANDLE handle = GetStdHandle(STD_INPUT_HANDLE);
      PeekConsoleInput(handle, buffer, 128, &events);
      if (events > 0) {
        ReadConsoleInput(handle, buffer, 128, &events);
        string s;
        for (DWORD i = 0; i < events; i++) {
          if (buffer[i].EventType == KEY_EVENT &&
              buffer[i].Event.KeyEvent.bKeyDown) {
            char charPressed = buffer[i].Event.KeyEvent.uChar.AsciiChar;
            if (charPressed) {
              s += charPressed;
            }
          }
        }
        if (!s.empty()) {
          PtyError writeError = pty->runCommand(s);
          if (writeError) {
            LOG(WARNING) << writeError;
          }
        }
      }
    }
    if (interactive) {
      TerminalSize current = console.getSize();
      if (current != lastSize) {
        lastSize = current;
        resizeSession(pty.get(), current);
      }
    }
    pty->waitForOutput(10);
#else
    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    if (stdinOpen) {
      FD_SET(STDIN_FILENO, &rfd);
    }
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int rc = select(stdinOpen ? STDIN_FILENO + 1 : 0, &rfd, NULL, NULL, &tv);
    if (rc < 0 && GetErrno() != EINTR) {
      STERROR << "select failed: " << strerror(GetErrno());
      break;
    }
    if (rc > 0 && FD_ISSET(STDIN_FILENO, &rfd)) {
      char buf[4096];
      ssize_t bytesRead = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (bytesRead > 0) {
        PtyError writeError = pty->runCommand(string(buf, bytesRead));
        if (writeError) {
          LOG(WARNING) << writeError;
        }
      } else if (bytesRead == 0) {
        VLOG(1) << "stdin closed, sending end of input";
        stdinOpen = false;
        PtyError eofError = pty->signal(PtySignal::END_OF_INPUT);
        if (eofError) {
          LOG(WARNING) << eofError;
        }
      }
    }
    if (windowChanged) {
      windowChanged = 0;
      TerminalSize current = console.getSize();
      if (current != lastSize) {
        lastSize = current;
        resizeSession(pty.get(), current);
      }
    }
#endif
    writeToStdout(pty->takeOutput());
  }
  writeToStdout(pty->takeOutput());

  console.teardown();
  pty->terminate();
  optional<int> code = pty->exitCode();
  return code ? *code : 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ox::HandleTerminate();

#ifndef WIN32
  // Writes to a dead child surface as BrokenPipe instead of killing us
  ::signal(SIGPIPE, SIG_IGN);
#endif

  cxxopts::Options options("oxterm", "Runs a shell inside a pseudo terminal");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("shell", "Shell kind (bash, pwsh, cmd...) or executable path",
         cxxopts::value<std::string>())  //
        ("args", "Extra arguments for the shell",
         cxxopts::value<std::string>()->default_value(""))  //
        ("cwd", "Initial working directory",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(
             PtyConfig::defaultConfigPath()))  //
        ("list-shells", "List the shells found on this machine")  //
        ("backend-info", "Print backend capabilities as JSON")   //
        ("no-conpty", "Use the fallback backend on Windows")     //
        ("c,command", "Run one command, print its output and exit",
         cxxopts::value<std::string>())                     //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("logtostdout", "log to stdout")                      //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "oxterm version " << OX_VERSION << endl;
      exit(0);
    }

    PtyConfig config;
    config.loadFromFile(result["cfgfile"].as<string>());

    // Command line options win over the config file
    if (result.count("shell")) {
      config.setProgram(result["shell"].as<string>());
    }
    if (!result["args"].as<string>().empty()) {
      config.args = splitWhitespace(result["args"].as<string>());
    }
    if (result.count("cwd")) {
      config.workingDirectory = result["cwd"].as<string>();
    }
    if (result.count("no-conpty")) {
      config.conptyDisabled = true;
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }

    LogHandler::setVerbosity(config.verbose);
    LogHandler::setupLogFiles(&defaultConf, config.logDirectory, "oxterm",
                              config.logToStdout, !config.logToStdout);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("oxterm-main");

    PtyOptions ptyOptions = config.toOptions();
    int exitCode = 0;
    if (result.count("list-shells")) {
      exitCode = listShells();
    } else if (result.count("backend-info")) {
      CLOG(INFO, "stdout") << backendInfo(ptyOptions).dump(2) << endl;
    } else if (result.count("command")) {
      exitCode = runOneCommand(ptyOptions, result["command"].as<string>());
    } else {
      exitCode = runInteractive(ptyOptions);
    }

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    return exitCode;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(ERROR, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }
}
