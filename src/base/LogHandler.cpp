#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ox {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts or the config file, not from easylogging's
  // own --v flag parsing.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name given by el::Helpers::setThreadName
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::timestampedName(const string &prefix) {
  time_t now = time(NULL);
  char stamp[32];
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", localtime(&now));
#ifdef WIN32
  unsigned long pid = GetCurrentProcessId();
#else
  unsigned long pid = (unsigned long)getpid();
#endif
  // The pid keeps names unique across processes started in the same second
  return prefix + "-" + stamp + "_" + to_string(pid) + ".log";
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, bool redirectStderrToFile,
                               string maxlogsize) {
  string logFile = createLogFile(path, timestampedName(filenamePrefix));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logFile);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  if (redirectStderrToFile) {
    string stderrFile =
        createLogFile(path, timestampedName(filenamePrefix + "-stderr"));
    FILE *stream = freopen(stderrFile.c_str(), "w", stderr);
    if (stream == NULL) {
      throw std::runtime_error("Cannot redirect stderr to " + stderrFile);
    }
    setvbuf(stream, NULL, _IOLBF, BUFSIZ);
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so nothing may be logged.
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::setVerbosity(int level) {
  el::Loggers::setVerboseLevel(std::max(0, std::min(9, level)));
}

string LogHandler::defaultLogDirectory() {
  return (fs::path(GetTempDirectory()) / "oxpty").string();
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + path + ": " +
                             ec.message());
  }
  string fullName = (fs::path(path) / filename).string();
#ifdef WIN32
  int fd = ::_open(fullName.c_str(), O_EXCL | O_CREAT, 0600);
#else
  // Refuse to follow a planted symlink in a shared temp directory
  int fd = ::open(fullName.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT | O_CLOEXEC,
                  0600);
#endif
  if (fd < 0) {
    throw std::runtime_error("Cannot create log file " + fullName + ": " +
                             strerror(errno));
  }
#ifdef WIN32
  ::_close(fd);
#else
  ::close(fd);
#endif
  return fullName;
}
}  // namespace ox
