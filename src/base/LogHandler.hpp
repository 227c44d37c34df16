#ifndef __LPANE_LOG_HANDLER__
#define __LPANE_LOG_HANDLER__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Where and how one lpane process writes its log.
 */
struct LogSettings {
  string directory;
  /** @brief First part of every file name. */
  string prefix;
  bool mirrorToStdout;
  /** @brief Send stderr to a `<prefix>-stderr-...` file next to the log. */
  bool captureStderr;
  /** @brief Size at which the log rolls over, 0 never rolls. */
  size_t maxFileSize;
  int verbose;

  LogSettings()
      : prefix("lpane"),
        mirrorToStdout(false),
        captureStderr(false),
        maxFileSize(20 * 1024 * 1024),
        verbose(0) {}
};

/**
 * @brief Configures easylogging++ for lpane.
 *
 * Each process logs to its own file, named after the start time and the pid,
 * so several panes started together never share a file.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging with `argc/argv`.
   * @return The default configuration, to be passed to `setupLogFiles`.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /** @brief The "stdout" logger prints bare messages for user output. */
  static void setupStdoutLogger();

  /**
   * @brief Points `defaultConf` at a new log file, applies the verbosity and
   * installs the rollover hook.  The caller reconfigures the logger.
   * @return Path of the new log file.
   * @throws std::system_error if the directory or a file cannot be created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const LogSettings &settings);

  /**
   * @brief `<prefix>[-<kind>]-<YYYYmmdd-HHMMSS>-<pid>`, without extension.
   */
  static string logFileStem(const string &prefix, const string &kind,
                            time_t when, pid_t pid);

  /**
   * @brief Keeps the full log as `<filename>.1`, replacing an older one.
   * easylogging reopens `filename` empty afterwards.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

 protected:
  /**
   * @brief Creates `<stem>.log` in `directory`, or `<stem>-N.log` when that
   * name is taken, and returns its path.
   */
  static string createLogFile(const string &directory, const string &stem);
  static void redirectStderr(const string &path);
};
}  // namespace lpane
#endif  // __LPANE_LOG_HANDLER__
