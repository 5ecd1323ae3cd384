#ifndef __GM_LOG_HANDLER__
#define __GM_LOG_HANDLER__

#include "Headers.hpp"

namespace gm {
/**
 * @brief Owns the easylogging++ setup shared by the server and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration every
   * logger in the process is derived from.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file under `directory`.
   * @param logToStdout Mirror log lines to stdout as well.
   * @param redirectStderrToFile Send the process stderr to a sibling file.
   * @param maxLogSize Rollover threshold in bytes.
   */
  static void setupLogFiles(el::Configurations *defaultConf,
                            const string &directory, const string &prefix,
                            bool logToStdout, bool redirectStderrToFile,
                            const string &maxLogSize = "20971520");

  /** @brief Rollover callback: deletes the full log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Configures the "stdout" logger used for user facing text. */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &directory, const string &filename);

  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace gm
#endif  // __GM_LOG_HANDLER__
