#ifndef __LPANE_PLAIN_TEXT_EMULATOR__
#define __LPANE_PLAIN_TEXT_EMULATOR__

#include "Headers.hpp"
#include "PtyIo.hpp"
#include "TerminalEmulator.hpp"

namespace lpane {
/**
 * @brief A deliberately small emulator: printable UTF-8, C0 controls, soft
 * wrapping, basic cursor/erase CSI sequences, SGR attributes and the OSC
 * sequences a multiplexer cares about (title, cwd, clipboard, prompt zones).
 *
 * Anything it does not understand is parsed and dropped so the screen does
 * not fill up with escape sequence garbage.
 */
class PlainTextEmulator : public TerminalEmulator {
 public:
  PlainTextEmulator(const ScreenSize& size, size_t scrollbackSize,
                    shared_ptr<PtyWriter> _writer);
  virtual ~PlainTextEmulator() {}

  virtual pair<size_t, size_t> getCursorPosition() const {
    return make_pair(cursorX, cursorY);
  }
  virtual pair<size_t, size_t> getDimensions() const {
    return make_pair(grid.getPhysicalRows(), grid.getPhysicalCols());
  }
  virtual const Screen& screen() const { return grid; }
  virtual uint64_t getSeqNo() const { return seqNo; }

  virtual void advanceBytes(const string& bytes);
  virtual void mouseEvent(const MouseEvent& event);
  virtual void keyDown(const KeyCode& key, KeyModifiers mods);
  virtual void sendPaste(const string& text);
  virtual void resize(size_t rows, size_t cols, size_t pixelWidth,
                      size_t pixelHeight);

  virtual string getTitle() const { return title; }
  virtual ColorPalette palette() const { return colors; }
  virtual vector<SemanticZone> getSemanticZones() const;
  virtual optional<string> getCurrentDir() const { return currentDir; }

  virtual void setClipboard(shared_ptr<Clipboard> _clipboard) {
    clipboard = _clipboard;
  }
  virtual void eraseScrollback();
  virtual void focusChanged(bool focused);
  virtual bool isMouseGrabbed() const { return mouseTracking != 0; }

  bool isBracketedPaste() const { return bracketedPaste; }

  /** @brief Longest OSC payload that is buffered before it is dropped. */
  static const size_t MAX_OSC_LENGTH = 1024 * 1024;

 protected:
  enum class ParseState { Ground, Escape, EscapeCharset, Csi, Osc, OscEscape };

  Screen grid;
  size_t cursorX;
  size_t cursorY;
  size_t savedCursorX;
  size_t savedCursorY;
  bool pendingWrap;
  CellAttributes pen;
  size_t pixelWidth;
  size_t pixelHeight;
  uint64_t seqNo;

  ParseState state;
  string utf8Pending;
  string csiParams;
  string oscBuffer;

  string title;
  optional<string> currentDir;
  ColorPalette colors;
  shared_ptr<Clipboard> clipboard;
  shared_ptr<PtyWriter> writer;

  bool applicationCursorKeys;
  bool bracketedPaste;
  bool focusReporting;
  bool sgrMouse;
  // 0, 1000, 1002 or 1003
  int mouseTracking;

  vector<SemanticZone> zones;
  optional<SemanticZone> openZone;

  void advanceByte(uint8_t ch);
  void groundByte(uint8_t ch);
  void escapeByte(uint8_t ch);
  void csiByte(uint8_t ch);
  void oscByte(uint8_t ch);

  void print(char32_t cp);
  void lineFeed();
  void wrapToNextLine();
  void clampCursor();

  void dispatchCsi(char final);
  void setPrivateMode(int mode, bool enabled);
  void selectGraphicRendition(const vector<int>& params);
  void eraseInDisplay(int mode);
  void eraseInLine(int mode);
  void dispatchOsc();
  void handleClipboardOsc(const string& payload);
  void markSemanticZone(char marker);
  /** @brief Forgets closed zones that ended above the oldest retained row. */
  void pruneZones();

  StableRowIndex cursorStableRow() const;
  void respond(const string& data);
  void writeToChild(const string& data);
};
}  // namespace lpane

#endif  // __LPANE_PLAIN_TEXT_EMULATOR__
