#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace ox;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      ox::LogHandler::setupLogHandler(&argc, &argv);
  ox::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  ox::HandleTerminate();

#ifndef WIN32
  // Writes into closed pipes must fail with EPIPE, not kill the runner
  signal(SIGPIPE, SIG_IGN);
#endif

  string logDirectory =
      (fs::path(GetTempDirectory()) /
       ("oxpty_test_" + std::to_string(std::chrono::steady_clock::now()
                                           .time_since_epoch()
                                           .count())))
          .string();
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  ox::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", false,
                                false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  std::error_code ec;
  fs::remove_all(logDirectory, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot remove " << logDirectory << ": "
                          << ec.message() << endl;
  }
  return result;
}
