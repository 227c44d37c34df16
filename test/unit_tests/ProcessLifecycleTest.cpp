#include "FakePane.hpp"
#include "ProcessLifecycle.hpp"
#include "TestHeaders.hpp"
#include "UnixPty.hpp"

using namespace lpane;

namespace {
pid_t forkExiting(int code) {
  pid_t pid = ::fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    ::_exit(code);
  }
  return pid;
}

pid_t forkSleeping() {
  pid_t pid = ::fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    ::pause();
    ::_exit(0);
  }
  return pid;
}

// Forks a child that ignores SIGHUP and returns once the handler is in place
pid_t forkIgnoringHangup() {
  int ready[2];
  REQUIRE(::pipe(ready) == 0);
  pid_t pid = ::fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    ::signal(SIGHUP, SIG_IGN);
    ::close(ready[0]);
    char c = 'r';
    if (::write(ready[1], &c, 1) != 1) {
      ::_exit(1);
    }
    while (true) {
      ::pause();
    }
  }
  ::close(ready[1]);
  char c;
  REQUIRE(::read(ready[0], &c, 1) == 1);
  ::close(ready[0]);
  return pid;
}

int64_t millisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}
}  // namespace

TEST_CASE("ProcessLifecycle needs a child", "[ProcessLifecycle]") {
  REQUIRE_THROWS_AS(ProcessLifecycle(unique_ptr<ChildProcess>()),
                    std::invalid_argument);
}

TEST_CASE("ProcessLifecycle tracks the child", "[ProcessLifecycle]") {
  auto state = make_shared<FakeChildState>();
  {
    ProcessLifecycle lifecycle(
        unique_ptr<ChildProcess>(new FakeChildProcess(state)));
    REQUIRE(lifecycle.processId() == pid_t(4242));
    REQUIRE(!lifecycle.isTerminated());
    REQUIRE(lifecycle.exitState() == ExitState::Running);
    REQUIRE(!lifecycle.exitStatus());

    state->exited = true;
    state->status = ExitStatus(0, 0);
    REQUIRE(lifecycle.isTerminated());
    int polls = state->tryWaitCalls;
    // Once dead the child is not polled again
    REQUIRE(lifecycle.isTerminated());
    REQUIRE(state->tryWaitCalls == polls);
    REQUIRE(lifecycle.exitStatus()->success());
  }
  REQUIRE(state->killCalls == 1);
  REQUIRE(state->waitCalls == 1);
}

TEST_CASE("ExitStatus decodes wait statuses", "[ProcessLifecycle]") {
  pid_t pid = forkExiting(7);
  int waitStatus = 0;
  REQUIRE(::waitpid(pid, &waitStatus, 0) == pid);
  ExitStatus exited = ExitStatus::fromWaitStatus(waitStatus);
  REQUIRE(exited.code == 7);
  REQUIRE(exited.signal == 0);
  REQUIRE(!exited.success());

  pid = forkSleeping();
  REQUIRE(::kill(pid, SIGKILL) == 0);
  REQUIRE(::waitpid(pid, &waitStatus, 0) == pid);
  ExitStatus signalled = ExitStatus::fromWaitStatus(waitStatus);
  REQUIRE(signalled.signal == SIGKILL);
  REQUIRE(signalled.code == 128 + SIGKILL);

  std::ostringstream ss;
  ss << exited << " / " << signalled;
  REQUIRE(ss.str() == "exit code 7 / signal " + to_string(SIGKILL));
}

TEST_CASE("UnixChildProcess reaps exactly once", "[ProcessLifecycle]") {
  UnixChildProcess child(forkExiting(4));
  REQUIRE(child.processId() != nullopt);
  ExitStatus status = child.wait();
  REQUIRE(status.code == 4);

  // Cached: no second waitpid and no signal to a pid that may be reused
  REQUIRE(child.tryWait()->code == 4);
  REQUIRE(child.wait().code == 4);
  REQUIRE_NOTHROW(child.kill());
}

TEST_CASE("UnixChildProcess kill ends a running child",
          "[ProcessLifecycle]") {
  UnixChildProcess child(forkSleeping());
  REQUIRE(!child.tryWait());
  child.kill();
  ExitStatus status = child.wait();
  REQUIRE(status.signal == SIGHUP);
}

TEST_CASE("UnixChildProcess escalates to SIGKILL", "[ProcessLifecycle]") {
  UnixChildProcess child(forkIgnoringHangup());
  auto start = std::chrono::steady_clock::now();
  REQUIRE(child.killAndWait().signal == SIGKILL);
  REQUIRE(millisSince(start) >= UnixChildProcess::KILL_GRACE_PERIOD_MS);
  // Reaped, so a second call neither signals nor blocks
  REQUIRE(child.killAndWait().signal == SIGKILL);
}

TEST_CASE("terminate returns without waiting for the child",
          "[ProcessLifecycle]") {
  pid_t pid = forkIgnoringHangup();
  {
    ProcessLifecycle lifecycle(
        unique_ptr<ChildProcess>(new UnixChildProcess(pid)));
    auto start = std::chrono::steady_clock::now();
    lifecycle.terminate();
    REQUIRE(millisSince(start) < UnixChildProcess::KILL_GRACE_PERIOD_MS / 2);
    // SIGHUP is ignored, so the child is still there
    REQUIRE(!lifecycle.isTerminated());
  }
  // Destruction escalated and reaped it
  int waitStatus;
  REQUIRE(::waitpid(pid, &waitStatus, WNOHANG) < 0);
  REQUIRE(GetErrno() == ECHILD);
}

TEST_CASE("ProcessLifecycle still waits when killing fails",
          "[ProcessLifecycle]") {
  auto state = make_shared<FakeChildState>();
  state->killFails = true;
  {
    ProcessLifecycle lifecycle(
        unique_ptr<ChildProcess>(new FakeChildProcess(state)));
    REQUIRE_NOTHROW(lifecycle.terminate());
  }
  REQUIRE(state->killCalls == 2);
  REQUIRE(state->waitCalls == 1);
}

TEST_CASE("A polled-out child cannot be waited on twice",
          "[ProcessLifecycle]") {
  pid_t pid = forkExiting(0);
  int waitStatus;
  REQUIRE(::waitpid(pid, &waitStatus, 0) == pid);

  // Someone else reaped it, so polling fails and the lifecycle gives up on it
  ProcessLifecycle lifecycle(
      unique_ptr<ChildProcess>(new UnixChildProcess(pid)));
  REQUIRE(lifecycle.isTerminated());
  REQUIRE(lifecycle.exitState() == ExitState::Unknown);
}

#ifndef __APPLE__
TEST_CASE("Spawned ptys", "[ProcessLifecycle][pty]") {
  UnixPtySpawner spawner;

  SECTION("report and change their size") {
    SpawnedPty spawned =
        spawner.spawn({"/bin/sleep", "30"}, ScreenSize(24, 80));
    REQUIRE(spawned.master->getSize() == ScreenSize(24, 80));
    spawned.master->resize(ScreenSize(50, 132));
    REQUIRE(spawned.master->getSize() == ScreenSize(50, 132));
    REQUIRE_THROWS_AS(spawned.master->resize(ScreenSize(100000, 80)),
                      std::out_of_range);
    ProcessLifecycle lifecycle(std::move(spawned.child));
  }

  SECTION("run the command with the pty as its terminal") {
    SpawnedPty spawned = spawner.spawn(
        {"/bin/sh", "-c", "stty size; echo $LPANE_VERSION"},
        ScreenSize(33, 77));
    auto reader = spawned.master->tryCloneReader();
    string output;
    char buf[256];
    while (true) {
      size_t n = reader->read(buf, sizeof(buf));
      if (n == 0) {
        break;
      }
      output.append(buf, n);
    }
    REQUIRE(output.find("33 77") != string::npos);
    REQUIRE(output.find(LPANE_VERSION) != string::npos);
    REQUIRE(spawned.child->wait().success());
  }

  SECTION("feed input through the writer") {
    SpawnedPty spawned =
        spawner.spawn({"/bin/sh", "-c", "read line; exit $line"},
                      ScreenSize(24, 80));
    spawned.master->writer().write("5\n");
    REQUIRE(spawned.child->wait().code == 5);
  }

  SECTION("missing programs exit with 127") {
    SpawnedPty spawned =
        spawner.spawn({"/nonexistent/program"}, ScreenSize(24, 80));
    REQUIRE(spawned.child->wait().code == 127);
  }
}
#endif

TEST_CASE("Default shell follows SHELL", "[ProcessLifecycle]") {
  const char* previous = ::getenv("SHELL");
  string saved = previous ? previous : "";

  ::setenv("SHELL", "/bin/testshell", 1);
  REQUIRE(UnixPtySpawner::defaultShell() == "/bin/testshell");
  ::unsetenv("SHELL");
  REQUIRE(!UnixPtySpawner::defaultShell().empty());

  if (previous) {
    ::setenv("SHELL", saved.c_str(), 1);
  }
}
