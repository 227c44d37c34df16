#ifndef __LPANE_CHILD_PROCESS__
#define __LPANE_CHILD_PROCESS__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief How a reaped child ended.  `signal` is 0 unless the child was
 * killed by a signal.
 */
struct ExitStatus {
  int code;
  int signal;

  ExitStatus() : code(0), signal(0) {}
  ExitStatus(int _code, int _signal) : code(_code), signal(_signal) {}

  bool success() const { return code == 0 && signal == 0; }

  /** @brief Decodes a status word filled in by waitpid(2). */
  static ExitStatus fromWaitStatus(int status) {
    if (WIFSIGNALED(status)) {
      return ExitStatus(128 + WTERMSIG(status), WTERMSIG(status));
    }
    if (WIFEXITED(status)) {
      return ExitStatus(WEXITSTATUS(status), 0);
    }
    return ExitStatus(1, 0);
  }
};

inline std::ostream& operator<<(std::ostream& os, const ExitStatus& status) {
  if (status.signal) {
    os << "signal " << status.signal;
  } else {
    os << "exit code " << status.code;
  }
  return os;
}

/**
 * @brief A spawned child process.
 *
 * Every method may throw `std::system_error` when the OS call fails.
 */
class ChildProcess {
 public:
  virtual ~ChildProcess() {}

  /**
   * @brief Sends the child its kill signal and returns without waiting.  A
   * no-op once the child was reaped.
   */
  virtual void kill() = 0;
  /** @brief Reaps the child if it has exited, never blocks. */
  virtual optional<ExitStatus> tryWait() = 0;
  /** @brief Blocks until the child exits and reaps it. */
  virtual ExitStatus wait() = 0;
  /**
   * @brief Kills the child and blocks until it is reaped.  Implementations
   * may escalate when the child ignores the first signal.
   */
  virtual ExitStatus killAndWait() {
    kill();
    return wait();
  }
  virtual optional<pid_t> processId() const = 0;
};
}  // namespace lpane

#endif  // __LPANE_CHILD_PROCESS__
