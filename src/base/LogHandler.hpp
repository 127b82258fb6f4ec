#ifndef __OX_LOG_HANDLER__
#define __OX_LOG_HANDLER__

#include "Headers.hpp"

namespace ox {
/**
 * @brief Owns the easylogging++ setup shared by oxterm and the test runner.
 *
 * Library code only ever logs through the `LOG`/`VLOG` macros; the hosting
 * executable decides where those messages go by calling into this class once
 * at startup.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the default configuration.
   *
   * The returned configuration is not applied yet so the caller can add file
   * output before calling `el::Loggers::reconfigureLogger`.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh `<prefix>-<time>_<pid>.log`
   * in `path`.
   *
   * Throws std::runtime_error when the directory or the file cannot be
   * created.
   * @param maxlogsize Byte limit before `rolloutHandler` drops the file.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /** @brief Pre-rollout callback, removes the full log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Configures the "stdout" logger used for user-facing messages. */
  static void setupStdoutLogger();

  /** @brief Applies a verbose level, clamped to easylogging's 0-9 range. */
  static void setVerbosity(int level);

  /** @brief Default log directory, `<temp>/oxpty`. */
  static string defaultLogDirectory();

 private:
  static string timestampedName(const string &prefix);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace ox
#endif  // __OX_LOG_HANDLER__
