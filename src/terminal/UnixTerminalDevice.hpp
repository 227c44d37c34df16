#ifndef __LPANE_UNIX_TERMINAL_DEVICE__
#define __LPANE_UNIX_TERMINAL_DEVICE__

#include "Capabilities.hpp"
#include "ChangeRenderer.hpp"
#include "Headers.hpp"
#include "InputParser.hpp"
#include "RawTerminalDevice.hpp"
#include "RawFdUtils.hpp"

namespace lpane {
/**
 * @brief termios backed terminal device.
 *
 * Window size changes are picked up through a SIGWINCH handler that writes to
 * a process wide self-pipe, so a blocked `pollInput` wakes up and reports a
 * Resized event.
 */
class UnixTerminalDevice : public RawTerminalDevice {
 public:
  /**
   * @brief Wraps already open descriptors.  Neither descriptor is closed by
   * the device.
   */
  UnixTerminalDevice(int _readFd, int _writeFd, const Capabilities& _caps);
  /** @brief Opens the controlling terminal (/dev/tty). */
  static unique_ptr<UnixTerminalDevice> openControllingTerminal(
      const Capabilities& caps);

  virtual ~UnixTerminalDevice();

  virtual void setRawMode();
  virtual void setCookedMode();
  virtual TerminalMode getMode() const { return mode; }

  virtual ScreenSize getScreenSize();
  virtual void setScreenSize(const ScreenSize& size);

  virtual void render(const vector<Change>& changes);
  virtual void flush();

  virtual optional<InputEvent> pollInput(Blocking blocking);

  /** @brief Milliseconds to wait for the rest of an escape sequence. */
  static const int ESCAPE_TIMEOUT_MS = 25;

 protected:
  int readFd;
  int writeFd;
  UniqueFd ownedFd;
  termios originalTermios;
  TerminalMode originalMode;
  TerminalMode mode;
  ChangeRenderer renderer;
  string outputBuffer;
  InputParser parser;
  ScreenSize lastSize;
  bool closed;
  uint64_t lastGeneration;

  void applyTermios(const termios& t, const char* what);
  bool readIntoParser();
  optional<InputEvent> checkForResize();
};
}  // namespace lpane

#endif  // __LPANE_UNIX_TERMINAL_DEVICE__
