#ifndef __LPANE_CHANGE__
#define __LPANE_CHANGE__

#include "Headers.hpp"
#include "Screen.hpp"

namespace lpane {
enum class ChangeType {
  Text,
  CursorPosition,
  Attributes,
  ClearScreen,
  CursorVisibility,
  Title,
};

/**
 * @brief One display operation sent to a raw terminal device.
 */
struct Change {
  ChangeType type;
  string text;
  size_t x;
  size_t y;
  CellAttributes attrs;
  bool visible;

  Change() : type(ChangeType::Text), x(0), y(0), visible(true) {}

  /** @brief Writes text at the cursor.  "\n" moves to the next line start. */
  static Change makeText(const string& text) {
    Change c;
    c.type = ChangeType::Text;
    c.text = text;
    return c;
  }
  /** @brief Zero-based cursor move. */
  static Change moveCursor(size_t x, size_t y) {
    Change c;
    c.type = ChangeType::CursorPosition;
    c.x = x;
    c.y = y;
    return c;
  }
  /** @brief Replaces every attribute of the pen. */
  static Change setAttributes(const CellAttributes& attrs) {
    Change c;
    c.type = ChangeType::Attributes;
    c.attrs = attrs;
    return c;
  }
  static Change clear() {
    Change c;
    c.type = ChangeType::ClearScreen;
    return c;
  }
  static Change showCursor(bool visible) {
    Change c;
    c.type = ChangeType::CursorVisibility;
    c.visible = visible;
    return c;
  }
  static Change setTitle(const string& title) {
    Change c;
    c.type = ChangeType::Title;
    c.text = title;
    return c;
  }
};
}  // namespace lpane

#endif  // __LPANE_CHANGE__
