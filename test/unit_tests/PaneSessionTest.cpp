#include "FakePane.hpp"
#include "PaneSession.hpp"
#include "PlainTextEmulator.hpp"
#include "TestHeaders.hpp"
#include "UnixPty.hpp"

using namespace lpane;

namespace {
struct PaneFixture {
  shared_ptr<FakeChildState> child;
  shared_ptr<FakePtyState> pty;
  shared_ptr<FakeProbe> probe;
  FakeTerminalEmulator* emulator;
  unique_ptr<PaneSession> pane;

  PaneFixture()
      : child(new FakeChildState()),
        pty(new FakePtyState()),
        probe(new FakeProbe()),
        emulator(new FakeTerminalEmulator(24, 80)) {
    pane.reset(new PaneSession(
        7, 3, unique_ptr<TerminalEmulator>(emulator),
        unique_ptr<ChildProcess>(new FakeChildProcess(child)),
        unique_ptr<MasterPty>(new FakeMasterPty(pty)), probe));
  }
};

template <typename Predicate>
bool waitFor(Predicate predicate, int timeoutMs) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}
}  // namespace

TEST_CASE("Pane identity", "[PaneSession]") {
  PaneFixture f;
  REQUIRE(f.pane->paneId() == 7);
  REQUIRE(f.pane->domainId() == 3);
  REQUIRE(f.pane->identity() == make_pair(PaneId(7), DomainId(3)));
}

TEST_CASE("Allocated pane ids are unique", "[PaneSession]") {
  set<PaneId> ids;
  for (int a = 0; a < 1000; a++) {
    REQUIRE(ids.insert(allocPaneId()).second);
  }
}

TEST_CASE("Input and output are forwarded to the emulator", "[PaneSession]") {
  PaneFixture f;
  f.pane->feed("some output");
  REQUIRE(f.emulator->received == "some output");

  f.pane->dispatchKey(KeyCode::character('x'), MOD_CTRL);
  REQUIRE(f.emulator->keys.size() == 1);
  REQUIRE(f.emulator->keys[0].key == KeyCode::character('x'));
  REQUIRE(f.emulator->keys[0].modifiers == MOD_CTRL);

  f.pane->dispatchMouse(MouseEvent(MouseEventKind::Press, MouseButton::Left,
                                   1, 2));
  REQUIRE(f.emulator->mouseEvents.size() == 1);

  f.pane->paste("pasted");
  REQUIRE(f.emulator->pastes == vector<string>({"pasted"}));

  f.pane->focusChanged(true);
  REQUIRE(f.emulator->focused);

  f.emulator->title = "vim";
  REQUIRE(f.pane->title() == "vim");
  REQUIRE(f.pane->palette().ansi[1] == ColorPalette::defaults().ansi[1]);

  f.emulator->mouseGrabbed = true;
  REQUIRE(f.pane->isMouseGrabbed());

  auto clipboard = make_shared<MemoryClipboard>();
  f.pane->setClipboard(clipboard);
  REQUIRE(f.emulator->clipboard == clipboard);

  SemanticZone zone;
  zone.startX = 0;
  zone.startY = 0;
  zone.endX = 4;
  zone.endY = 0;
  zone.type = SemanticType::Prompt;
  f.emulator->zones.push_back(zone);
  REQUIRE(f.pane->semanticZones().size() == 1);
}

TEST_CASE("Rejected mouse events surface as errors", "[PaneSession]") {
  PaneFixture f;
  f.emulator->rejectMouse = true;
  REQUIRE_THROWS_AS(
      f.pane->dispatchMouse(
          MouseEvent(MouseEventKind::Press, MouseButton::Left, 0, 0)),
      std::runtime_error);
  // The pane is still usable afterwards
  f.pane->feed("x");
  REQUIRE(f.emulator->received == "x");
}

TEST_CASE("Resize updates the pty and then the emulator", "[PaneSession]") {
  PaneFixture f;
  f.pane->resize(ScreenSize(30, 100, 800, 600));
  REQUIRE(f.pty->size == ScreenSize(30, 100, 800, 600));
  REQUIRE(f.emulator->getDimensions() ==
          make_pair(size_t(30), size_t(100)));
}

TEST_CASE("Failed pty resize leaves the emulator alone", "[PaneSession]") {
  PaneFixture f;
  f.pty->failResize = true;
  uint64_t seqNo = f.emulator->getSeqNo();
  REQUIRE_THROWS_AS(f.pane->resize(ScreenSize(30, 100)), std::system_error);
  REQUIRE(f.pty->resizeCalls == 1);
  REQUIRE(f.emulator->getDimensions() == make_pair(size_t(24), size_t(80)));
  REQUIRE(f.emulator->getSeqNo() == seqNo);
}

TEST_CASE("Re-entering a pane from inside a borrow fails fast",
          "[PaneSession]") {
  PaneFixture f;

  SECTION("from an emulator callback") {
    PaneSession* pane = f.pane.get();
    f.emulator->onKey = [pane]() { pane->title(); };
    REQUIRE_THROWS_AS(pane->dispatchKey(KeyCode(Key::Enter), MOD_NONE),
                      std::logic_error);
    // The borrow was released while unwinding
    f.emulator->onKey = nullptr;
    REQUIRE(pane->title().empty());
  }

  SECTION("while holding the renderable view") {
    auto view = f.pane->renderableView();
    REQUIRE(view->getDimensions() == make_pair(size_t(24), size_t(80)));
    REQUIRE_THROWS_AS(f.pane->feed("x"), std::logic_error);
    REQUIRE_THROWS_AS(f.pane->search(Pattern::caseSensitive("x")),
                      std::logic_error);
  }

  SECTION("while holding the writer") {
    auto writer = f.pane->writer();
    REQUIRE_THROWS_AS(f.pane->reader(), std::logic_error);
    REQUIRE_THROWS_AS(f.pane->resize(ScreenSize(10, 10)), std::logic_error);
  }
}

TEST_CASE("Other threads wait for a borrow to be released",
          "[PaneSession]") {
  PaneFixture f;
  std::atomic<bool> fed(false);
  std::thread feeder;
  {
    auto view = f.pane->renderableView();
    feeder = std::thread([&f, &fed]() {
      f.pane->feed("late");
      fed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(!fed);
  }
  feeder.join();
  REQUIRE(fed);
  REQUIRE(f.emulator->received == "late");
}

TEST_CASE("Writer and reader reach the pty", "[PaneSession]") {
  PaneFixture f;
  {
    auto writer = f.pane->writer();
    writer->write("ls\r");
  }
  REQUIRE(f.pty->writer->getWritten() == "ls\r");

  f.pty->output = "listing";
  auto reader = f.pane->reader();
  char buf[64];
  size_t n = reader->read(buf, sizeof(buf));
  REQUIRE(string(buf, n) == "listing");
  REQUIRE(reader->read(buf, sizeof(buf)) == 0);
}

TEST_CASE("Working directory lookup", "[PaneSession]") {
  PaneFixture f;
  f.probe->dirs[99] = "file://localhost/probed";

  SECTION("prefers the directory reported by the shell") {
    f.emulator->currentDir = string("file://localhost/reported");
    f.pty->leader = pid_t(99);
    REQUIRE(f.pane->currentWorkingDirectory() ==
            string("file://localhost/reported"));
    REQUIRE(f.probe->lookups == 0);
  }

  SECTION("falls back to probing the process group leader") {
    f.pty->leader = pid_t(99);
    REQUIRE(f.pane->currentWorkingDirectory() ==
            string("file://localhost/probed"));
  }

  SECTION("is empty without a process group leader") {
    REQUIRE(!f.pane->currentWorkingDirectory());
    REQUIRE(f.probe->lookups == 0);
  }

  SECTION("is empty when the probe knows nothing") {
    f.pty->leader = pid_t(100);
    REQUIRE(!f.pane->currentWorkingDirectory());
  }
}

TEST_CASE("Termination state", "[PaneSession]") {
  PaneFixture f;

  SECTION("a running child is not terminated") {
    REQUIRE(!f.pane->isTerminated());
    REQUIRE(f.pane->exitState() == ExitState::Running);
  }

  SECTION("death is sticky") {
    f.child->exited = true;
    f.child->status = ExitStatus(2, 0);
    REQUIRE(f.pane->isTerminated());
    f.child->exited = false;
    REQUIRE(f.pane->isTerminated());
    REQUIRE(f.pane->exitState() == ExitState::Exited);
    REQUIRE(f.pane->exitStatus()->code == 2);
  }

  SECTION("a failed poll counts as dead") {
    f.child->pollFails = true;
    REQUIRE(f.pane->isTerminated());
    REQUIRE(f.pane->exitState() == ExitState::Unknown);
    f.child->pollFails = false;
    REQUIRE(f.pane->isTerminated());
  }

  SECTION("terminate ignores kill failures") {
    f.child->killFails = true;
    f.pane->terminate();
    REQUIRE(f.child->killCalls == 1);
  }
}

TEST_CASE("Destroying a pane kills and reaps the child", "[PaneSession]") {
  PaneFixture f;

  SECTION("without a prior terminate") {
    f.pane.reset();
    REQUIRE(f.child->killCalls == 1);
    REQUIRE(f.child->waitCalls == 1);
  }

  SECTION("after terminate") {
    f.pane->terminate();
    f.pane.reset();
    REQUIRE(f.child->killCalls == 2);
    REQUIRE(f.child->waitCalls == 1);
  }

  SECTION("even if kill fails") {
    f.child->killFails = true;
    f.pane.reset();
    REQUIRE(f.child->waitCalls == 1);
  }
}

TEST_CASE("Search runs over the emulator screen", "[PaneSession]") {
  auto child = make_shared<FakeChildState>();
  auto pty = make_shared<FakePtyState>();
  PaneSession pane(
      allocPaneId(), 0,
      unique_ptr<TerminalEmulator>(
          new PlainTextEmulator(ScreenSize(4, 20), 100, pty->writer)),
      unique_ptr<ChildProcess>(new FakeChildProcess(child)),
      unique_ptr<MasterPty>(new FakeMasterPty(pty)),
      make_shared<UnsupportedProbe>());
  pane.feed("make: *** Error 1\r\ncompiling\r\nERROR again");

  auto results = pane.search(Pattern::caseInsensitive("error"));
  REQUIRE(results.size() == 2);
  REQUIRE(results[0] == SearchResult(10, 0, 15, 0));
  REQUIRE(results[1] == SearchResult(0, 2, 5, 2));

  auto pending = pane.searchAsync(Pattern::regex("comp[a-z]+"));
  // Deferred: nothing runs until get(), so the pane can still be borrowed
  pane.feed("\r\ncompiled");
  auto asyncResults = pending.get();
  REQUIRE(asyncResults.size() == 2);

  pane.eraseScrollback();
  REQUIRE(pane.search(Pattern::caseSensitive("make")).size() == 1);
}

#ifndef __APPLE__
TEST_CASE("Real children are reaped", "[PaneSession][pty]") {
  UnixPtySpawner spawner;

  SECTION("exit status of a finished command") {
    SpawnedPty spawned =
        spawner.spawn({"/bin/sh", "-c", "exit 3"}, ScreenSize(24, 80));
    auto writer = spawned.master->tryCloneWriter();
    PaneSession pane(
        allocPaneId(), 0,
        unique_ptr<TerminalEmulator>(
            new PlainTextEmulator(ScreenSize(24, 80), 100, writer)),
        std::move(spawned.child), std::move(spawned.master));
    REQUIRE(waitFor([&pane]() { return pane.isTerminated(); }, 5000));
    REQUIRE(pane.exitState() == ExitState::Exited);
    REQUIRE(pane.exitStatus()->code == 3);
  }

  SECTION("a running child is killed when the pane goes away") {
    SpawnedPty spawned =
        spawner.spawn({"/bin/sleep", "30"}, ScreenSize(24, 80));
    pid_t pid = *spawned.child->processId();
    auto writer = spawned.master->tryCloneWriter();
    {
      PaneSession pane(
          allocPaneId(), 0,
          unique_ptr<TerminalEmulator>(
              new PlainTextEmulator(ScreenSize(24, 80), 100, writer)),
          std::move(spawned.child), std::move(spawned.master));
      REQUIRE(!pane.isTerminated());
    }
    // Already reaped, so there is nothing left to wait for
    int status = 0;
    REQUIRE(::waitpid(pid, &status, WNOHANG) == -1);
    REQUIRE(GetErrno() == ECHILD);
  }

  SECTION("output flows through the reader into the emulator") {
    SpawnedPty spawned =
        spawner.spawn({"/bin/echo", "pane-output"}, ScreenSize(24, 80));
    auto writer = spawned.master->tryCloneWriter();
    PaneSession pane(
        allocPaneId(), 0,
        unique_ptr<TerminalEmulator>(
            new PlainTextEmulator(ScreenSize(24, 80), 100, writer)),
        std::move(spawned.child), std::move(spawned.master));
    auto reader = pane.reader();
    char buf[1024];
    while (true) {
      size_t n = reader->read(buf, sizeof(buf));
      if (n == 0) {
        break;
      }
      pane.feed(string(buf, n));
    }
    REQUIRE(pane.search(Pattern::caseSensitive("pane-output")).size() == 1);
  }
}
#endif

#ifdef __linux__
TEST_CASE("Working directory of a real child", "[PaneSession][pty]") {
  string dir = fs::canonical(fs::temp_directory_path()).string();
  UnixPtySpawner spawner;
  SpawnedPty spawned =
      spawner.spawn({"/bin/sleep", "30"}, ScreenSize(24, 80), dir);
  auto writer = spawned.master->tryCloneWriter();
  PaneSession pane(allocPaneId(), 0,
                   unique_ptr<TerminalEmulator>(new PlainTextEmulator(
                       ScreenSize(24, 80), 100, writer)),
                   std::move(spawned.child), std::move(spawned.master),
                   make_shared<LinuxProbe>());
  string expected = WorkingDirectoryProbe::fileUrlFromPath(dir);
  REQUIRE(waitFor(
      [&pane, &expected]() {
        return pane.currentWorkingDirectory() == expected;
      },
      5000));
}
#endif
