#include "PaneConfig.hpp"

#include "SimpleIni.h"

namespace lpane {
namespace {
void applyIni(const CSimpleIniA& ini, PaneConfig* config) {
  const char* shell = ini.GetValue("Pane", "shell", NULL);
  if (shell) {
    config->shell = shell;
  }
  const char* scrollback = ini.GetValue("Pane", "scrollback", NULL);
  if (scrollback) {
    config->scrollback = checkedCast<size_t>(stol(scrollback));
  }
  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config->verbose = atoi(vlevel);
  }
  const char* logDir = ini.GetValue("Debug", "logdir", NULL);
  if (logDir) {
    config->logDir = logDir;
  }
}
}  // namespace

PaneConfig::PaneConfig()
    : rows(24),
      cols(80),
      scrollback(3500),
      verbose(0),
      logDir(GetTempDirectory() + "lpane"),
      logToStdout(false),
      searchIsRegex(false),
      ignoreCase(false),
      timeoutMs(0),
      interactive(false) {}

cxxopts::Options PaneConfig::createOptions() {
  cxxopts::Options options("lpane",
                           "Runs a command in a terminal pane and inspects it");
  options.add_options()             //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("c,command", "Command to run instead of the login shell",
       cxxopts::value<std::string>())  //
      ("s,search", "Text to search for in the pane",
       cxxopts::value<std::string>())                       //
      ("regex", "Treat the search text as a regex")         //
      ("i,ignore-case", "Case insensitive search")          //
      ("rows", "Pane height", cxxopts::value<size_t>())     //
      ("cols", "Pane width", cxxopts::value<size_t>())      //
      ("scrollback", "Lines of scrollback to keep",
       cxxopts::value<size_t>())  //
      ("timeout", "Milliseconds to wait for the command, 0 waits forever",
       cxxopts::value<int>())  //
      ("interactive", "Attach the pane to this terminal")  //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("logtostdout", "log to stdout")                    //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"), "LEVEL")  //
      ;
  return options;
}

void PaneConfig::loadIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  applyIni(ini, this);
}

void PaneConfig::loadIniData(const string& data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data);
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  applyIni(ini, this);
}

void PaneConfig::applyCommandLine(const cxxopts::ParseResult& result) {
  if (result.count("command")) {
    command = {"/bin/sh", "-c", result["command"].as<string>()};
  }
  if (result.count("search")) {
    search = result["search"].as<string>();
  }
  if (result.count("regex")) {
    searchIsRegex = true;
  }
  if (result.count("ignore-case")) {
    ignoreCase = true;
  }
  if (result.count("rows")) {
    rows = result["rows"].as<size_t>();
  }
  if (result.count("cols")) {
    cols = result["cols"].as<size_t>();
  }
  if (result.count("scrollback")) {
    scrollback = result["scrollback"].as<size_t>();
  }
  if (result.count("timeout")) {
    timeoutMs = result["timeout"].as<int>();
  }
  if (result.count("interactive")) {
    interactive = true;
  }
  if (result.count("cfgfile")) {
    cfgFile = result["cfgfile"].as<string>();
  }
  if (result.count("logtostdout")) {
    logToStdout = true;
  }
  if (result.count("verbose")) {
    verbose = result["verbose"].as<int>();
  }
  if (rows == 0 || cols == 0) {
    throw std::invalid_argument("Pane size must be at least 1x1");
  }
}

vector<string> PaneConfig::commandLine() const {
  if (!command.empty()) {
    return command;
  }
  if (!shell.empty()) {
    return {shell, "-l"};
  }
  // Let the spawner pick $SHELL
  return vector<string>();
}

LogSettings PaneConfig::logSettings() const {
  LogSettings settings;
  settings.directory = logDir;
  settings.prefix = "lpane";
  settings.mirrorToStdout = logToStdout;
  settings.captureStderr = !logToStdout;
  settings.verbose = verbose;
  return settings;
}
}  // namespace lpane
