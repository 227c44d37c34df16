#ifndef __LPANE_PROCESS_LIFECYCLE__
#define __LPANE_PROCESS_LIFECYCLE__

#include "ChildProcess.hpp"
#include "Headers.hpp"
#include "PaneTypes.hpp"

namespace lpane {
/**
 * @brief Owns a pane's child process and makes sure it is reaped.
 *
 * Destroying the lifecycle kills the child and then blocks until it has been
 * waited on, whether or not `terminate()` was called or the child was already
 * seen to exit.
 */
class ProcessLifecycle {
 public:
  explicit ProcessLifecycle(unique_ptr<ChildProcess> _process);
  ~ProcessLifecycle();

  ProcessLifecycle(const ProcessLifecycle&) = delete;
  ProcessLifecycle& operator=(const ProcessLifecycle&) = delete;

  /** @brief Sends the kill signal without waiting.  Failures are ignored. */
  void terminate();

  /**
   * @brief Polls the child without blocking.
   *
   * A failed poll counts as dead, as does a reaped child.  Once dead, always
   * dead.
   */
  bool isTerminated();

  /** @brief Like `isTerminated()` but tells a failed poll apart. */
  ExitState exitState();

  /** @brief Exit status, once the child has been reaped. */
  optional<ExitStatus> exitStatus() const { return status; }

  optional<pid_t> processId() const { return process->processId(); }

 protected:
  unique_ptr<ChildProcess> process;
  bool dead;
  optional<ExitStatus> status;
};
}  // namespace lpane

#endif  // __LPANE_PROCESS_LIFECYCLE__
