#include "PaneSession.hpp"

#include "ScreenSearch.hpp"

namespace lpane {
PaneSession::PaneSession(PaneId _paneId, DomainId _domainId,
                         unique_ptr<TerminalEmulator> _terminal,
                         unique_ptr<ChildProcess> _process,
                         unique_ptr<MasterPty> _pty,
                         shared_ptr<WorkingDirectoryProbe> _probe)
    : id(_paneId),
      domain(_domainId),
      terminal(std::move(_terminal), "terminal"),
      pty(std::move(_pty), "pty"),
      probe(_probe),
      process(unique_ptr<ProcessLifecycle>(
                  new ProcessLifecycle(std::move(_process))),
              "process") {
  if (!probe) {
    probe.reset(new UnsupportedProbe());
  }
  VLOG(1) << "Created pane " << id << " in domain " << domain;
}

PaneSession::~PaneSession() { VLOG(1) << "Destroying pane " << id; }

BorrowGuard<Renderable> PaneSession::renderableView() {
  return terminal.borrowMut();
}

void PaneSession::terminate() {
  VLOG(1) << "Terminating pane " << id;
  process.borrowMut()->terminate();
}

bool PaneSession::isTerminated() { return process.borrowMut()->isTerminated(); }

ExitState PaneSession::exitState() { return process.borrowMut()->exitState(); }

optional<ExitStatus> PaneSession::exitStatus() {
  return process.borrowMut()->exitStatus();
}

void PaneSession::feed(const string& bytes) {
  terminal.borrowMut()->advanceBytes(bytes);
}

void PaneSession::dispatchMouse(const MouseEvent& event) {
  terminal.borrowMut()->mouseEvent(event);
}

void PaneSession::dispatchKey(const KeyCode& key, KeyModifiers mods) {
  terminal.borrowMut()->keyDown(key, mods);
}

void PaneSession::resize(const ScreenSize& size) {
  auto ptyGuard = pty.borrowMut();
  auto terminalGuard = terminal.borrowMut();
  try {
    ptyGuard->resize(size);
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Pane " << id << " cannot resize pty to " << size << ": "
                 << ex.what();
    throw;
  }
  terminalGuard->resize(size.rows, size.cols, size.pixelWidth,
                        size.pixelHeight);
}

BorrowGuard<PtyWriter> PaneSession::writer() {
  auto guard = pty.borrowMut();
  PtyWriter* w = &guard->writer();
  return std::move(guard).project(w);
}

unique_ptr<PtyReader> PaneSession::reader() {
  return pty.borrowMut()->tryCloneReader();
}

void PaneSession::paste(const string& text) {
  terminal.borrowMut()->sendPaste(text);
}

string PaneSession::title() { return terminal.borrowMut()->getTitle(); }

ColorPalette PaneSession::palette() { return terminal.borrowMut()->palette(); }

void PaneSession::eraseScrollback() {
  terminal.borrowMut()->eraseScrollback();
}

void PaneSession::focusChanged(bool focused) {
  terminal.borrowMut()->focusChanged(focused);
}

bool PaneSession::isMouseGrabbed() {
  return terminal.borrowMut()->isMouseGrabbed();
}

void PaneSession::setClipboard(shared_ptr<Clipboard> clipboard) {
  terminal.borrowMut()->setClipboard(clipboard);
}

optional<string> PaneSession::currentWorkingDirectory() {
  {
    auto terminalGuard = terminal.borrowMut();
    auto reported = terminalGuard->getCurrentDir();
    if (reported) {
      return reported;
    }
  }
  optional<pid_t> leader = pty.borrowMut()->processGroupLeader();
  return probe->resolve(leader);
}

vector<SemanticZone> PaneSession::semanticZones() {
  return terminal.borrowMut()->getSemanticZones();
}

vector<SearchResult> PaneSession::search(const Pattern& pattern) {
  ScreenSearchEngine engine(pattern);
  auto terminalGuard = terminal.borrowMut();
  return engine.search(terminalGuard->screen());
}

std::future<vector<SearchResult>> PaneSession::searchAsync(
    const Pattern& pattern) {
  return std::async(std::launch::deferred,
                    [this, pattern]() { return search(pattern); });
}
}  // namespace lpane
