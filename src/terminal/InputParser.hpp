#ifndef __LPANE_INPUT_PARSER__
#define __LPANE_INPUT_PARSER__

#include "Headers.hpp"
#include "TerminalTypes.hpp"

namespace lpane {
/**
 * @brief Decodes bytes read from a raw terminal into input events.
 *
 * Understands printable UTF-8, C0 control keys, CSI and SS3 cursor/function
 * keys with xterm modifier parameters, SGR mouse reports and bracketed
 * paste.  Incomplete sequences stay buffered until more bytes arrive or
 * `flush()` is called.
 */
class InputParser {
 public:
  InputParser() {}

  /** @brief Appends bytes and decodes every complete event they finish. */
  void feed(const string& bytes);

  /**
   * @brief Treats whatever is still buffered as complete.  A lone ESC becomes
   * the Escape key.
   */
  void flush();

  /** @brief Removes and returns the oldest decoded event. */
  optional<InputEvent> pop();

  /** @brief True while an incomplete sequence is buffered. */
  bool hasPartial() const { return !buffer.empty(); }

 protected:
  string buffer;
  deque<InputEvent> events;

  // Each parse function returns the number of bytes consumed, 0 when the
  // buffer ends in the middle of the sequence.
  size_t parseOne(bool final);
  size_t parseEscape(bool final);
  size_t parseCsi();
  size_t parseSs3();
  size_t parsePaste();
  size_t parseChar(size_t pos, KeyModifiers extraMods, bool final);

  bool parseSgrMouse(const string& params, char final);
  void pushKey(KeyCode code, KeyModifiers mods) {
    events.push_back(InputEvent::keyEvent(code, mods));
  }
};
}  // namespace lpane

#endif  // __LPANE_INPUT_PARSER__
