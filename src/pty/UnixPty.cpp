#include "UnixPty.hpp"

namespace lpane {
void UnixChildProcess::kill() {
  if (status) {
    return;
  }
  if (::kill(pid, SIGHUP) < 0) {
    throw SystemErrorFromErrno("Cannot signal child " + to_string(pid));
  }
}

ExitStatus UnixChildProcess::killAndWait() {
  if (status) {
    return *status;
  }
  kill();
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(KILL_GRACE_PERIOD_MS);
  while (std::chrono::steady_clock::now() < deadline) {
    if (tryWait()) {
      return *status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  VLOG(1) << "Child " << pid << " ignored SIGHUP, sending SIGKILL";
  if (::kill(pid, SIGKILL) < 0) {
    throw SystemErrorFromErrno("Cannot kill child " + to_string(pid));
  }
  return wait();
}

optional<ExitStatus> UnixChildProcess::tryWait() {
  if (status) {
    return status;
  }
  while (true) {
    int waitStatus = 0;
    pid_t rc = ::waitpid(pid, &waitStatus, WNOHANG);
    if (rc == 0) {
      return nullopt;
    }
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      throw SystemErrorFromErrno("Cannot poll child " + to_string(pid));
    }
    status = ExitStatus::fromWaitStatus(waitStatus);
    VLOG(1) << "Child " << pid << " exited with " << *status;
    return status;
  }
}

ExitStatus UnixChildProcess::wait() {
  if (status) {
    return *status;
  }
  while (true) {
    int waitStatus = 0;
    pid_t rc = ::waitpid(pid, &waitStatus, 0);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      throw SystemErrorFromErrno("Cannot wait for child " + to_string(pid));
    }
    status = ExitStatus::fromWaitStatus(waitStatus);
    VLOG(1) << "Child " << pid << " reaped with " << *status;
    return *status;
  }
}

UnixMasterPty::UnixMasterPty(UniqueFd _masterFd)
    : masterFd(std::move(_masterFd)) {
  ownWriter.reset(new FdPtyWriter(dupMaster()));
}

UniqueFd UnixMasterPty::dupMaster() {
  int fd = ::dup(masterFd.get());
  if (fd < 0) {
    throw SystemErrorFromErrno("Cannot duplicate pty master");
  }
  ::fcntl(fd, F_SETFD, FD_CLOEXEC);
  return UniqueFd(fd);
}

void UnixMasterPty::resize(const ScreenSize& size) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_row = checkedCast<unsigned short>(size.rows);
  win.ws_col = checkedCast<unsigned short>(size.cols);
  win.ws_xpixel = checkedCast<unsigned short>(size.pixelWidth);
  win.ws_ypixel = checkedCast<unsigned short>(size.pixelHeight);
  if (::ioctl(masterFd.get(), TIOCSWINSZ, &win) < 0) {
    throw SystemErrorFromErrno("Cannot resize pty");
  }
}

ScreenSize UnixMasterPty::getSize() {
  winsize win;
  memset(&win, 0, sizeof(win));
  if (::ioctl(masterFd.get(), TIOCGWINSZ, &win) < 0) {
    throw SystemErrorFromErrno("Cannot read pty size");
  }
  return ScreenSize(win.ws_row, win.ws_col, win.ws_xpixel, win.ws_ypixel);
}

unique_ptr<PtyReader> UnixMasterPty::tryCloneReader() {
  return unique_ptr<PtyReader>(new FdPtyReader(dupMaster()));
}

shared_ptr<PtyWriter> UnixMasterPty::tryCloneWriter() {
  return shared_ptr<PtyWriter>(new FdPtyWriter(dupMaster()));
}

optional<pid_t> UnixMasterPty::processGroupLeader() {
  pid_t pgrp = ::tcgetpgrp(masterFd.get());
  if (pgrp <= 0) {
    return nullopt;
  }
  return pgrp;
}

SpawnedPty UnixPtySpawner::spawn(const vector<string>& argv,
                                 const ScreenSize& size, const string& cwd) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_row = checkedCast<unsigned short>(size.rows);
  win.ws_col = checkedCast<unsigned short>(size.cols);
  win.ws_xpixel = checkedCast<unsigned short>(size.pixelWidth);
  win.ws_ypixel = checkedCast<unsigned short>(size.pixelHeight);

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1:
      throw SystemErrorFromErrno("forkpty failed");
    case 0:
      runChild(argv, cwd);
    default:
      break;
  }
  // parent
  VLOG(1) << "pty opened " << masterFd << " for child " << pid;
  ::fcntl(masterFd, F_SETFD, FD_CLOEXEC);
  SpawnedPty spawned;
  spawned.child.reset(new UnixChildProcess(pid));
  spawned.master.reset(new UnixMasterPty(UniqueFd(masterFd)));
  return spawned;
}

string UnixPtySpawner::defaultShell() {
  const char* shell = ::getenv("SHELL");
  if (shell && *shell) {
    return shell;
  }
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_shell && *pwd->pw_shell) {
    return pwd->pw_shell;
  }
  return "/bin/sh";
}

void UnixPtySpawner::runChild(const vector<string>& argv, const string& cwd) {
  if (!cwd.empty()) {
    if (::chdir(cwd.c_str()) < 0) {
      LOG(ERROR) << "Cannot chdir to " << cwd << ": " << strerror(GetErrno());
      _exit(127);
    }
  } else {
    passwd* pwd = getpwuid(getuid());
    if (pwd != NULL && ::chdir(pwd->pw_dir) < 0) {
      VLOG(1) << "Cannot chdir to home directory " << pwd->pw_dir;
    }
  }
  setenv("LPANE_VERSION", LPANE_VERSION, 1);
  // The child should see default SIGCHLD handling regardless of what the
  // parent installed, or shells and popen() in the child break.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGWINCH, SIG_DFL);

  vector<string> args = argv;
  if (args.empty()) {
    args.push_back(defaultShell());
    args.push_back("-l");
  }
  vector<char*> cargs;
  for (auto& arg : args) {
    cargs.push_back(const_cast<char*>(arg.c_str()));
  }
  cargs.push_back(NULL);
  execvp(cargs[0], cargs.data());
  // only get here if the exec failed
  LOG(ERROR) << "Cannot run " << args[0] << ": " << strerror(GetErrno());
  _exit(127);
}
}  // namespace lpane
