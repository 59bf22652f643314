#ifndef __RAILGUN_LOG_HANDLER__
#define __RAILGUN_LOG_HANDLER__

#include "Headers.hpp"

namespace railgun {
/**
 * @brief Configures easylogging++ for the railgun library and its tools.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return Full path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false, bool appendPid = true,
                              string maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   * @throws std::runtime_error if the directory or file cannot be created.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace railgun
#endif  // __RAILGUN_LOG_HANDLER__
