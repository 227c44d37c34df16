#ifndef __LPANE_PANE_CONFIG__
#define __LPANE_PANE_CONFIG__

#include <cxxopts.hpp>

#include "Headers.hpp"
#include "LogHandler.hpp"

namespace lpane {
/**
 * @brief Settings for the lpane driver, merged from an optional INI file and
 * the command line.  Values from the command line win.
 */
struct PaneConfig {
  /** @brief Command to run, the login shell when empty. */
  vector<string> command;
  string shell;
  size_t rows;
  size_t cols;
  size_t scrollback;
  int verbose;
  string logDir;
  bool logToStdout;
  string cfgFile;
  /** @brief Text to look for once the command finishes, empty for none. */
  string search;
  bool searchIsRegex;
  bool ignoreCase;
  /** @brief How long to wait for the command, in milliseconds. 0 waits
   * forever. */
  int timeoutMs;
  /** @brief Attach the pane to the controlling terminal. */
  bool interactive;

  PaneConfig();

  /** @brief The command line options the driver understands. */
  static cxxopts::Options createOptions();

  /**
   * @brief Reads the [Pane] and [Debug] sections of an INI file.
   * @throws std::runtime_error if the file cannot be parsed.
   */
  void loadIniFile(const string& filename);
  /** @brief Same as `loadIniFile` for INI text already in memory. */
  void loadIniData(const string& data);

  /** @brief Applies every option that was given explicitly. */
  void applyCommandLine(const cxxopts::ParseResult& result);

  /** @brief `command`, or the configured shell started as a login shell. */
  vector<string> commandLine() const;

  /**
   * @brief Log file settings for the driver.  stderr goes to a file unless
   * the log is mirrored to stdout.
   */
  LogSettings logSettings() const;
};
}  // namespace lpane

#endif  // __LPANE_PANE_CONFIG__
