#ifndef __LPANE_RAW_TERMINAL_DEVICE__
#define __LPANE_RAW_TERMINAL_DEVICE__

#include "Change.hpp"
#include "Headers.hpp"
#include "TerminalTypes.hpp"

namespace lpane {
enum class Blocking { DoNotWait, Wait };

enum class TerminalMode { Cooked, Raw };

/**
 * @brief A physical terminal the process talks to directly.
 *
 * The device starts in whatever mode the OS reports and puts that mode back
 * when it is destroyed.
 */
class RawTerminalDevice {
 public:
  virtual ~RawTerminalDevice() {}

  /**
   * @brief Disables line buffering, echo and newline translation.
   * @throws std::system_error if the device rejects the change.
   */
  virtual void setRawMode() = 0;
  /** @brief Re-enables line discipline processing. */
  virtual void setCookedMode() = 0;
  virtual TerminalMode getMode() const = 0;

  virtual ScreenSize getScreenSize() = 0;
  virtual void setScreenSize(const ScreenSize& size) = 0;

  /** @brief Queues `changes` in order.  Nothing reaches the device until
   * `flush()`. */
  virtual void render(const vector<Change>& changes) = 0;
  virtual void flush() = 0;

  /**
   * @brief Returns the next input event.
   *
   * `Blocking::Wait` sleeps until an event arrives and returns nullopt only
   * once the device has closed.  `Blocking::DoNotWait` returns nullopt when
   * nothing is ready.
   */
  virtual optional<InputEvent> pollInput(Blocking blocking) = 0;
};
}  // namespace lpane

#endif  // __LPANE_RAW_TERMINAL_DEVICE__
