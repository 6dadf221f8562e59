#ifndef __ST_LOG_HANDLER__
#define __ST_LOG_HANDLER__

#include "Headers.hpp"

namespace st {
/**
 * @brief Where and how much a session logs.
 */
struct LogSettings {
  string directory;
  /** Log files are named <prefix>-<time>_<pid>.log */
  string prefix = "slipterm";
  int verbose = 0;
  /** Mirror log lines to stdout. Only sane without a full-screen console. */
  bool mirrorToStdout = false;
  bool silent = false;
  /** Keep stray stderr writes (protobuf, libc) off the screen. */
  bool redirectStderr = true;
  string maxLogSize = "20971520";
};

/**
 * @brief Configures easylogging++ for slipterm.
 *
 * The interactive screen owns stdout while a session runs, so regular log
 * output always goes to a file and only the "stdout" logger writes to the
 * terminal (before setup and after teardown of the console).
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that startLogging() completes.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Applies @p settings, points the default logger at a fresh file and
   * installs the rollover callback.
   * @return Full path of the log file.
   */
  static string startLogging(el::Configurations *defaultConf,
                             const LogSettings &settings);

  /** @brief Removes the rollover callback installed by startLogging(). */
  static void stopLogging();

  /**
   * @brief Rollover callback: keeps exactly one previous file as <name>.1
   */
  static void rolloutHandler(const char *filename, std::size_t size);

 private:
  static void stderrToFile(const string &path);

  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace st
#endif  // __ST_LOG_HANDLER__
