#ifndef __LPANE_TERMINAL_TYPES__
#define __LPANE_TERMINAL_TYPES__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Size of a terminal screen in character cells.
 *
 * Pixel dimensions are zero on platforms (or devices) that cannot report
 * them.
 */
struct ScreenSize {
  size_t rows;
  size_t cols;
  size_t pixelWidth;
  size_t pixelHeight;

  ScreenSize() : rows(0), cols(0), pixelWidth(0), pixelHeight(0) {}
  ScreenSize(size_t _rows, size_t _cols, size_t _pixelWidth = 0,
             size_t _pixelHeight = 0)
      : rows(_rows),
        cols(_cols),
        pixelWidth(_pixelWidth),
        pixelHeight(_pixelHeight) {}

  bool operator==(const ScreenSize& other) const {
    return rows == other.rows && cols == other.cols &&
           pixelWidth == other.pixelWidth && pixelHeight == other.pixelHeight;
  }
  bool operator!=(const ScreenSize& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const ScreenSize& size) {
  os << size.rows << "x" << size.cols;
  if (size.pixelWidth || size.pixelHeight) {
    os << " (" << size.pixelWidth << "x" << size.pixelHeight << "px)";
  }
  return os;
}

enum class Key {
  Char,
  Enter,
  Tab,
  Backspace,
  Escape,
  UpArrow,
  DownArrow,
  LeftArrow,
  RightArrow,
  Home,
  End,
  PageUp,
  PageDown,
  Insert,
  Delete,
  Function,
};

/**
 * @brief A key independent of the modifiers held with it.
 *
 * `ch` is only meaningful for `Key::Char`, `functionNumber` for
 * `Key::Function`.
 */
struct KeyCode {
  Key key;
  char32_t ch;
  int functionNumber;

  KeyCode() : key(Key::Char), ch(0), functionNumber(0) {}
  explicit KeyCode(Key _key) : key(_key), ch(0), functionNumber(0) {}

  static KeyCode character(char32_t c) {
    KeyCode k(Key::Char);
    k.ch = c;
    return k;
  }
  static KeyCode function(int n) {
    KeyCode k(Key::Function);
    k.functionNumber = n;
    return k;
  }

  bool operator==(const KeyCode& other) const {
    return key == other.key && ch == other.ch &&
           functionNumber == other.functionNumber;
  }
};

typedef uint8_t KeyModifiers;
const KeyModifiers MOD_NONE = 0;
const KeyModifiers MOD_SHIFT = 1 << 0;
const KeyModifiers MOD_ALT = 1 << 1;
const KeyModifiers MOD_CTRL = 1 << 2;
const KeyModifiers MOD_SUPER = 1 << 3;

struct KeyEvent {
  KeyCode key;
  KeyModifiers modifiers;

  KeyEvent() : modifiers(MOD_NONE) {}
  KeyEvent(KeyCode _key, KeyModifiers _modifiers)
      : key(_key), modifiers(_modifiers) {}
};

enum class MouseButton { None, Left, Middle, Right, WheelUp, WheelDown };

enum class MouseEventKind { Press, Release, Move };

/**
 * @brief A mouse event in zero-based cell coordinates of the visible screen.
 */
struct MouseEvent {
  MouseEventKind kind;
  MouseButton button;
  size_t x;
  size_t y;
  KeyModifiers modifiers;

  MouseEvent()
      : kind(MouseEventKind::Press),
        button(MouseButton::None),
        x(0),
        y(0),
        modifiers(MOD_NONE) {}
  MouseEvent(MouseEventKind _kind, MouseButton _button, size_t _x, size_t _y,
             KeyModifiers _modifiers = MOD_NONE)
      : kind(_kind), button(_button), x(_x), y(_y), modifiers(_modifiers) {}
};

enum class InputEventType { KEY, MOUSE, RESIZED, PASTE };

/**
 * @brief An event read from a raw terminal device.
 */
struct InputEvent {
  InputEventType type;
  KeyEvent key;
  MouseEvent mouse;
  ScreenSize size;
  string paste;

  InputEvent() : type(InputEventType::KEY) {}

  static InputEvent keyEvent(KeyCode code, KeyModifiers mods = MOD_NONE) {
    InputEvent e;
    e.type = InputEventType::KEY;
    e.key = KeyEvent(code, mods);
    return e;
  }
  static InputEvent mouseEvent(const MouseEvent& m) {
    InputEvent e;
    e.type = InputEventType::MOUSE;
    e.mouse = m;
    return e;
  }
  static InputEvent resized(const ScreenSize& s) {
    InputEvent e;
    e.type = InputEventType::RESIZED;
    e.size = s;
    return e;
  }
  static InputEvent pasted(const string& text) {
    InputEvent e;
    e.type = InputEventType::PASTE;
    e.paste = text;
    return e;
  }
};
}  // namespace lpane

#endif  // __LPANE_TERMINAL_TYPES__
