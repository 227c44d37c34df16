#ifndef __LPANE_UNIX_PTY__
#define __LPANE_UNIX_PTY__

#include "ChildProcess.hpp"
#include "Headers.hpp"
#include "MasterPty.hpp"
#include "RawFdUtils.hpp"

namespace lpane {
/**
 * @brief A child process started by `UnixPtySpawner`.
 *
 * The exit status is cached once the child is reaped so the pid is never
 * signalled or waited on again after the kernel may have reused it.
 */
class UnixChildProcess : public ChildProcess {
 public:
  explicit UnixChildProcess(pid_t _pid) : pid(_pid) {}
  virtual ~UnixChildProcess() {}

  /** @brief Sends SIGHUP. */
  virtual void kill();
  virtual optional<ExitStatus> tryWait();
  virtual ExitStatus wait();
  /**
   * @brief Sends SIGHUP, gives the child a short grace period to exit and
   * then sends SIGKILL before reaping it.
   */
  virtual ExitStatus killAndWait();
  virtual optional<pid_t> processId() const { return pid; }

  static const int KILL_GRACE_PERIOD_MS = 250;

 protected:
  pid_t pid;
  optional<ExitStatus> status;
};

class UnixMasterPty : public MasterPty {
 public:
  explicit UnixMasterPty(UniqueFd _masterFd);
  virtual ~UnixMasterPty() {}

  virtual void resize(const ScreenSize& size);
  virtual ScreenSize getSize();
  virtual unique_ptr<PtyReader> tryCloneReader();
  virtual shared_ptr<PtyWriter> tryCloneWriter();
  virtual PtyWriter& writer() { return *ownWriter; }
  virtual optional<pid_t> processGroupLeader();

  int getFd() const { return masterFd.get(); }

 protected:
  UniqueFd masterFd;
  shared_ptr<PtyWriter> ownWriter;

  UniqueFd dupMaster();
};

struct SpawnedPty {
  unique_ptr<ChildProcess> child;
  unique_ptr<MasterPty> master;
};

/**
 * @brief Starts a command on a fresh pty with forkpty(3).
 */
class UnixPtySpawner {
 public:
  /**
   * @brief Runs `argv` (or the user's login shell when `argv` is empty) on a
   * new pty of the given size.
   * @param cwd Directory to start in, the home directory when empty.
   * @throws std::system_error if the pty cannot be created.
   */
  SpawnedPty spawn(const vector<string>& argv, const ScreenSize& size,
                   const string& cwd = string());

  /** @brief $SHELL, falling back to the passwd entry and then /bin/sh. */
  static string defaultShell();

 protected:
  [[noreturn]] void runChild(const vector<string>& argv, const string& cwd);
};
}  // namespace lpane

#endif  // __LPANE_UNIX_PTY__
