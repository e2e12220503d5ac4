#ifndef __APC_LOG_HANDLER__
#define __APC_LOG_HANDLER__

#include "Headers.hpp"

namespace apc {
/**
 * @brief easylogging++ setup shared by apcctl and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration (format,
   * flush threshold) for the caller to extend.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the log to a new file under `path`, capped at `maxlogsize`
   * bytes. Optionally mirrors it to stdout and redirects stderr to a sibling
   * file.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /** @brief Maps -v levels 0..9 onto easylogging's VLOG verbosity. */
  static void setVerbosity(int verbose);

  /** @brief Removes the rolled log file. Must not log. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Configures the "stdout" logger used for user-facing output: bare
   * messages, no file.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /** @brief Creates the directory and an empty, exclusive log file. */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace apc
#endif  // __APC_LOG_HANDLER__
