#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace lpane {
namespace {
const int MAX_NAME_ATTEMPTS = 16;
}

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Only for easylogging's own flags, verbosity comes from LogSettings
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name given with setThreadName
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  // The pump thread and the main thread interleave, flush every line
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  // Nothing reaches a file until setupLogFiles picks one
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");
  return defaultConf;
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

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const LogSettings &settings) {
  time_t now = time(NULL);
  pid_t pid = ::getpid();
  string logPath = createLogFile(
      settings.directory, logFileStem(settings.prefix, "", now, pid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           to_string(settings.maxFileSize));
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           settings.mirrorToStdout ? "true" : "false");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  el::Loggers::setVerboseLevel(settings.verbose);

  if (settings.captureStderr) {
    redirectStderr(createLogFile(
        settings.directory, logFileStem(settings.prefix, "stderr", now, pid)));
  }
  return logPath;
}

string LogHandler::logFileStem(const string &prefix, const string &kind,
                               time_t when, pid_t pid) {
  struct tm timeinfo;
  localtime_r(&when, &timeinfo);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &timeinfo);
  string stem = prefix;
  if (!kind.empty()) {
    stem += "-" + kind;
  }
  return stem + "-" + buffer + "-" + to_string(pid);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so this must not log
  string previous = string(filename) + ".1";
  if (::rename(filename, previous.c_str()) < 0) {
    ::remove(filename);
  }
}

string LogHandler::createLogFile(const string &directory, const string &stem) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw std::system_error(ec, "Cannot create log directory " + directory);
  }
  for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; attempt++) {
    string path = directory + "/" + stem +
                  (attempt ? "-" + to_string(attempt) : string()) + ".log";
    int fd = ::open(path.c_str(), O_WRONLY | O_NOFOLLOW | O_EXCL | O_CREAT,
                    0600);
    if (fd >= 0) {
      ::close(fd);
      return path;
    }
    if (GetErrno() != EEXIST) {
      throw SystemErrorFromErrno("Cannot create log file " + path);
    }
  }
  throw std::system_error(EEXIST, std::generic_category(),
                          "No free log file name for " + stem);
}

void LogHandler::redirectStderr(const string &path) {
  FILE *stream = freopen(path.c_str(), "w", stderr);
  if (!stream) {
    throw SystemErrorFromErrno("Cannot send stderr to " + path);
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace lpane
