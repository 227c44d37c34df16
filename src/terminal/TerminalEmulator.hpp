#ifndef __LPANE_TERMINAL_EMULATOR__
#define __LPANE_TERMINAL_EMULATOR__

#include "Clipboard.hpp"
#include "Headers.hpp"
#include "Screen.hpp"
#include "TerminalTypes.hpp"

namespace lpane {
struct RgbColor {
  uint8_t red;
  uint8_t green;
  uint8_t blue;

  RgbColor() : red(0), green(0), blue(0) {}
  RgbColor(uint8_t r, uint8_t g, uint8_t b) : red(r), green(g), blue(b) {}

  bool operator==(const RgbColor& other) const {
    return red == other.red && green == other.green && blue == other.blue;
  }
};

/**
 * @brief Snapshot of the colors an emulator renders with.
 */
struct ColorPalette {
  array<RgbColor, 16> ansi;
  RgbColor foreground;
  RgbColor background;
  RgbColor cursor;

  /** @brief The xterm default palette. */
  static ColorPalette defaults();
};

enum class SemanticType { Prompt, Input, Output };

/**
 * @brief A shell-integration zone reported through OSC 133.
 * Coordinates are inclusive and addressed by (column, stable row).
 */
struct SemanticZone {
  size_t startX;
  StableRowIndex startY;
  size_t endX;
  StableRowIndex endY;
  SemanticType type;
};

/**
 * @brief The state a renderer needs to draw a pane.
 */
class Renderable {
 public:
  virtual ~Renderable() {}

  /** @brief Cursor position in visible-screen coordinates (x, y). */
  virtual pair<size_t, size_t> getCursorPosition() const = 0;
  /** @brief Visible geometry as (rows, cols). */
  virtual pair<size_t, size_t> getDimensions() const = 0;
  /** @brief Scrollback plus visible rows. */
  virtual const Screen& screen() const = 0;
  /**
   * @brief Monotonic counter bumped by every mutation, lets a renderer skip
   * repainting an unchanged pane.
   */
  virtual uint64_t getSeqNo() const = 0;
};

/**
 * @brief The virtual terminal a pane feeds its pty output into.
 *
 * Fallible operations throw `std::runtime_error` when the emulator rejects the
 * request.
 */
class TerminalEmulator : public Renderable {
 public:
  virtual ~TerminalEmulator() {}

  /** @brief Interprets a chunk of bytes read from the pty. */
  virtual void advanceBytes(const string& bytes) = 0;
  virtual void mouseEvent(const MouseEvent& event) = 0;
  virtual void keyDown(const KeyCode& key, KeyModifiers mods) = 0;
  /** @brief Sends `text` to the child, bracketed if the child asked for it. */
  virtual void sendPaste(const string& text) = 0;
  virtual void resize(size_t rows, size_t cols, size_t pixelWidth,
                      size_t pixelHeight) = 0;

  virtual string getTitle() const = 0;
  virtual ColorPalette palette() const = 0;
  virtual vector<SemanticZone> getSemanticZones() const = 0;
  /** @brief Directory reported by the shell (OSC 7), as a file URL. */
  virtual optional<string> getCurrentDir() const = 0;

  virtual void setClipboard(shared_ptr<Clipboard> clipboard) = 0;
  virtual void eraseScrollback() = 0;
  virtual void focusChanged(bool focused) = 0;
  virtual bool isMouseGrabbed() const = 0;
};
}  // namespace lpane

#endif  // __LPANE_TERMINAL_EMULATOR__
