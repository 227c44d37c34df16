#ifndef __LPANE_PANE_SESSION__
#define __LPANE_PANE_SESSION__

#include "ChildProcess.hpp"
#include "ExclusiveCell.hpp"
#include "Headers.hpp"
#include "MasterPty.hpp"
#include "PaneTypes.hpp"
#include "ProcessLifecycle.hpp"
#include "TerminalEmulator.hpp"
#include "WorkingDirectoryProbe.hpp"

namespace lpane {
/**
 * @brief One pane: a child process running on a pty whose output drives a
 * terminal emulator.
 *
 * The emulator, the process and the pty each live in their own
 * `ExclusiveCell`.  Calling back into the same pane while one of its borrows
 * is held on this thread throws `std::logic_error`; another thread waits for
 * the borrow to be released.  When two borrows are needed the pty is always
 * taken before the emulator.
 *
 * Destroying the pane kills the child and waits for it.
 */
class PaneSession {
 public:
  PaneSession(PaneId _paneId, DomainId _domainId,
              unique_ptr<TerminalEmulator> _terminal,
              unique_ptr<ChildProcess> _process, unique_ptr<MasterPty> _pty,
              shared_ptr<WorkingDirectoryProbe> _probe =
                  WorkingDirectoryProbe::create());
  ~PaneSession();

  PaneId paneId() const { return id; }
  DomainId domainId() const { return domain; }
  pair<PaneId, DomainId> identity() const { return make_pair(id, domain); }

  /**
   * @brief Exclusive access to the emulator's rendering state.  Release the
   * guard before calling anything else on this pane.
   */
  BorrowGuard<Renderable> renderableView();

  /** @brief Asks the child to exit, does not wait. */
  void terminate();
  /** @brief True once the child has exited or cannot be polled. */
  bool isTerminated();
  ExitState exitState();
  /** @brief How the child ended, once it has been reaped. */
  optional<ExitStatus> exitStatus();

  /** @brief Hands output read from the pty to the emulator. */
  void feed(const string& bytes);

  /** @throws std::runtime_error if the emulator rejects the event. */
  void dispatchMouse(const MouseEvent& event);
  /** @throws std::runtime_error if the emulator rejects the key. */
  void dispatchKey(const KeyCode& key, KeyModifiers mods);

  /**
   * @brief Resizes the pty and then the emulator.  If the pty refuses the
   * new size the emulator is left alone and the error is rethrown.
   */
  void resize(const ScreenSize& size);

  /** @brief Exclusive access to the child's input. */
  BorrowGuard<PtyWriter> writer();
  /** @brief An independent reader of the child's output, for a pump thread. */
  unique_ptr<PtyReader> reader();

  void paste(const string& text);
  string title();
  ColorPalette palette();
  void eraseScrollback();
  void focusChanged(bool focused);
  bool isMouseGrabbed();
  void setClipboard(shared_ptr<Clipboard> clipboard);

  /**
   * @brief The directory the shell reported, or failing that the one the OS
   * reports for the pty's foreground process.
   */
  optional<string> currentWorkingDirectory();
  vector<SemanticZone> semanticZones();

  /** @brief Matches of `pattern` in scrollback and screen, in scan order. */
  vector<SearchResult> search(const Pattern& pattern);
  /**
   * @brief Deferred `search()`.  The scan runs on whichever thread calls
   * `get()`, which must happen while the pane is alive.
   */
  std::future<vector<SearchResult>> searchAsync(const Pattern& pattern);

 protected:
  PaneId id;
  DomainId domain;
  ExclusiveCell<TerminalEmulator> terminal;
  ExclusiveCell<MasterPty> pty;
  shared_ptr<WorkingDirectoryProbe> probe;
  // Declared last so the child is killed and reaped before the pty closes
  ExclusiveCell<ProcessLifecycle> process;
};
}  // namespace lpane

#endif  // __LPANE_PANE_SESSION__
