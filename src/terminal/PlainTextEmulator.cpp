#include "PlainTextEmulator.hpp"

#include "Utf8.hpp"
#include "base64.h"

namespace lpane {
namespace {
const char ESC = 0x1b;
const size_t TAB_WIDTH = 8;

vector<int> parseParams(const string& params) {
  vector<int> retval;
  if (params.empty()) {
    return retval;
  }
  for (auto& token : split(params, ';')) {
    if (token.empty()) {
      retval.push_back(0);
      continue;
    }
    try {
      retval.push_back(stoi(token));
    } catch (const std::logic_error&) {
      retval.push_back(0);
    }
  }
  // "1;" has an empty trailing parameter that getline does not report
  if (params.back() == ';') {
    retval.push_back(0);
  }
  return retval;
}

int paramOr(const vector<int>& params, size_t index, int defaultValue) {
  if (index >= params.size() || params[index] == 0) {
    return defaultValue;
  }
  return params[index];
}

// xterm's modifier parameter: 1 + shift + 2*alt + 4*ctrl
int modifierParam(KeyModifiers mods) {
  int retval = 1;
  if (mods & MOD_SHIFT) retval += 1;
  if (mods & MOD_ALT) retval += 2;
  if (mods & MOD_CTRL) retval += 4;
  return retval;
}
}  // namespace

PlainTextEmulator::PlainTextEmulator(const ScreenSize& size,
                                     size_t scrollbackSize,
                                     shared_ptr<PtyWriter> _writer)
    : grid(size.rows, size.cols, scrollbackSize),
      cursorX(0),
      cursorY(0),
      savedCursorX(0),
      savedCursorY(0),
      pendingWrap(false),
      pixelWidth(size.pixelWidth),
      pixelHeight(size.pixelHeight),
      seqNo(0),
      state(ParseState::Ground),
      colors(ColorPalette::defaults()),
      writer(_writer),
      applicationCursorKeys(false),
      bracketedPaste(false),
      focusReporting(false),
      sgrMouse(false),
      mouseTracking(0) {}

void PlainTextEmulator::advanceBytes(const string& bytes) {
  for (char c : bytes) {
    advanceByte(uint8_t(c));
  }
  seqNo++;
}

void PlainTextEmulator::advanceByte(uint8_t ch) {
  switch (state) {
    case ParseState::Ground:
      groundByte(ch);
      break;
    case ParseState::Escape:
      escapeByte(ch);
      break;
    case ParseState::EscapeCharset:
      // ESC ( B and friends designate a charset, which we ignore
      state = ParseState::Ground;
      break;
    case ParseState::Csi:
      csiByte(ch);
      break;
    case ParseState::Osc:
    case ParseState::OscEscape:
      oscByte(ch);
      break;
  }
}

void PlainTextEmulator::groundByte(uint8_t ch) {
  if (!utf8Pending.empty()) {
    if (utf8::isContinuation(ch)) {
      utf8Pending.push_back(char(ch));
      if (utf8Pending.size() ==
          utf8::sequenceLength(uint8_t(utf8Pending[0]))) {
        size_t consumed;
        char32_t cp = utf8::decode(utf8Pending, 0, &consumed);
        utf8Pending.clear();
        print(cp);
      }
      return;
    }
    // Truncated sequence
    utf8Pending.clear();
    print(0xFFFD);
  }

  if (ch >= 0x80) {
    if (utf8::sequenceLength(ch) == 1) {
      print(0xFFFD);
    } else {
      utf8Pending.push_back(char(ch));
    }
    return;
  }

  switch (ch) {
    case 0x1b:
      state = ParseState::Escape;
      return;
    case '\r':
      cursorX = 0;
      pendingWrap = false;
      return;
    case '\n':
    case 0x0b:
    case 0x0c:
      lineFeed();
      return;
    case '\b':
      if (cursorX > 0) {
        cursorX--;
      }
      pendingWrap = false;
      return;
    case '\t':
      cursorX = min(grid.getPhysicalCols() - 1,
                    (cursorX / TAB_WIDTH + 1) * TAB_WIDTH);
      return;
    default:
      break;
  }
  if (ch < 0x20 || ch == 0x7f) {
    // BEL and the remaining C0 controls
    return;
  }
  print(char32_t(ch));
}

void PlainTextEmulator::escapeByte(uint8_t ch) {
  state = ParseState::Ground;
  switch (ch) {
    case '[':
      csiParams.clear();
      state = ParseState::Csi;
      break;
    case ']':
      oscBuffer.clear();
      state = ParseState::Osc;
      break;
    case '(':
    case ')':
    case '*':
    case '+':
      state = ParseState::EscapeCharset;
      break;
    case '7':
      savedCursorX = cursorX;
      savedCursorY = cursorY;
      break;
    case '8':
      cursorX = savedCursorX;
      cursorY = savedCursorY;
      clampCursor();
      break;
    case 'D':
      lineFeed();
      break;
    case 'E':
      cursorX = 0;
      lineFeed();
      break;
    case 'M':
      if (cursorY > 0) {
        cursorY--;
      }
      break;
    case 'c':
      for (size_t y = 0; y < grid.getPhysicalRows(); y++) {
        grid.clearVisibleLine(y);
      }
      cursorX = cursorY = 0;
      pen = CellAttributes();
      pendingWrap = false;
      break;
    default:
      VLOG(2) << "Ignoring escape sequence ESC " << char(ch);
      break;
  }
}

void PlainTextEmulator::csiByte(uint8_t ch) {
  if (ch >= 0x40 && ch <= 0x7e) {
    state = ParseState::Ground;
    dispatchCsi(char(ch));
    return;
  }
  if (ch == 0x1b) {
    // Sequence aborted by a new escape
    state = ParseState::Escape;
    return;
  }
  if (ch < 0x20) {
    // C0 controls execute in the middle of a CSI sequence
    groundByte(ch);
    return;
  }
  csiParams.push_back(char(ch));
}

void PlainTextEmulator::oscByte(uint8_t ch) {
  if (state == ParseState::OscEscape) {
    if (ch == '\\') {
      state = ParseState::Ground;
      dispatchOsc();
      return;
    }
    // ESC followed by something other than ST aborts the OSC
    state = ParseState::Ground;
    escapeByte(ch);
    return;
  }
  if (ch == 0x07) {
    state = ParseState::Ground;
    dispatchOsc();
    return;
  }
  if (ch == 0x1b) {
    state = ParseState::OscEscape;
    return;
  }
  if (oscBuffer.size() < MAX_OSC_LENGTH) {
    oscBuffer.push_back(char(ch));
  }
}

void PlainTextEmulator::print(char32_t cp) {
  int width = utf8::columnWidth(cp);
  size_t cols = grid.getPhysicalCols();
  if (width == 0) {
    // Combining mark, extend the previous grapheme
    if (cursorX > 0 || pendingWrap) {
      size_t x = pendingWrap ? cursorX : cursorX - 1;
      auto& cells = grid.visibleLine(cursorY).getCells();
      while (x > 0 && x < cells.size() && cells[x].getWidth() == 0) {
        x--;
      }
      if (x < cells.size()) {
        Cell& cell = cells[x];
        cell = Cell(cell.str() + utf8::encode(cp), cell.getWidth(),
                    cell.getAttrs());
      }
    }
    return;
  }
  if (pendingWrap || cursorX + size_t(width) > cols) {
    wrapToNextLine();
  }
  CellAttributes attrs = pen;
  attrs.wrapped = false;
  grid.visibleLine(cursorY).setCell(cursorX, Cell(utf8::encode(cp), width,
                                                  attrs));
  cursorX += size_t(width);
  if (cursorX >= cols) {
    cursorX = cols - 1;
    pendingWrap = true;
  }
}

void PlainTextEmulator::wrapToNextLine() {
  grid.visibleLine(cursorY).setWrapped(true);
  pendingWrap = false;
  cursorX = 0;
  lineFeed();
}

void PlainTextEmulator::lineFeed() {
  pendingWrap = false;
  if (cursorY + 1 < grid.getPhysicalRows()) {
    cursorY++;
  } else {
    grid.scrollUp();
    pruneZones();
  }
}

void PlainTextEmulator::clampCursor() {
  cursorX = min(cursorX, grid.getPhysicalCols() - 1);
  cursorY = min(cursorY, grid.getPhysicalRows() - 1);
  pendingWrap = false;
}

void PlainTextEmulator::dispatchCsi(char final) {
  bool privateMode = !csiParams.empty() && csiParams[0] == '?';
  string rawParams = privateMode ? csiParams.substr(1) : csiParams;
  if (!rawParams.empty() &&
      rawParams.find_first_not_of("0123456789;:") != string::npos) {
    // Intermediates or other private markers we do not implement
    VLOG(2) << "Ignoring CSI " << csiParams << final;
    return;
  }
  vector<int> params = parseParams(rawParams);
  size_t rows = grid.getPhysicalRows();
  size_t cols = grid.getPhysicalCols();

  switch (final) {
    case 'A':
      cursorY -= min(cursorY, size_t(paramOr(params, 0, 1)));
      pendingWrap = false;
      break;
    case 'B':
      cursorY = min(rows - 1, cursorY + size_t(paramOr(params, 0, 1)));
      pendingWrap = false;
      break;
    case 'C':
      cursorX = min(cols - 1, cursorX + size_t(paramOr(params, 0, 1)));
      pendingWrap = false;
      break;
    case 'D':
      cursorX -= min(cursorX, size_t(paramOr(params, 0, 1)));
      pendingWrap = false;
      break;
    case 'G':
      cursorX = size_t(paramOr(params, 0, 1) - 1);
      clampCursor();
      break;
    case 'd':
      cursorY = size_t(paramOr(params, 0, 1) - 1);
      clampCursor();
      break;
    case 'H':
    case 'f':
      cursorY = size_t(paramOr(params, 0, 1) - 1);
      cursorX = size_t(paramOr(params, 1, 1) - 1);
      clampCursor();
      break;
    case 'J':
      eraseInDisplay(params.empty() ? 0 : params[0]);
      break;
    case 'K':
      eraseInLine(params.empty() ? 0 : params[0]);
      break;
    case 'm':
      selectGraphicRendition(params);
      break;
    case 'h':
    case 'l':
      if (privateMode) {
        for (int mode : params) {
          setPrivateMode(mode, final == 'h');
        }
      }
      break;
    case 'n':
      if (!params.empty() && params[0] == 6) {
        respond(string("\x1b[") + to_string(cursorY + 1) + ";" +
                to_string(cursorX + 1) + "R");
      } else if (!params.empty() && params[0] == 5) {
        respond("\x1b[0n");
      }
      break;
    case 'c':
      if (!privateMode) {
        respond("\x1b[?1;2c");
      }
      break;
    case 's':
      savedCursorX = cursorX;
      savedCursorY = cursorY;
      break;
    case 'u':
      cursorX = savedCursorX;
      cursorY = savedCursorY;
      clampCursor();
      break;
    default:
      VLOG(2) << "Ignoring CSI " << csiParams << final;
      break;
  }
}

void PlainTextEmulator::setPrivateMode(int mode, bool enabled) {
  switch (mode) {
    case 1:
      applicationCursorKeys = enabled;
      break;
    case 1000:
    case 1002:
    case 1003:
      if (enabled) {
        mouseTracking = mode;
      } else if (mouseTracking == mode) {
        mouseTracking = 0;
      }
      break;
    case 1004:
      focusReporting = enabled;
      break;
    case 1006:
      sgrMouse = enabled;
      break;
    case 2004:
      bracketedPaste = enabled;
      break;
    default:
      VLOG(2) << "Ignoring private mode " << mode;
      break;
  }
}

void PlainTextEmulator::selectGraphicRendition(const vector<int>& params) {
  if (params.empty()) {
    pen = CellAttributes();
    return;
  }
  for (size_t i = 0; i < params.size(); i++) {
    int p = params[i];
    if (p == 0) {
      pen = CellAttributes();
    } else if (p == 1) {
      pen.bold = true;
    } else if (p == 4) {
      pen.underline = true;
    } else if (p == 7) {
      pen.reverse = true;
    } else if (p == 22) {
      pen.bold = false;
    } else if (p == 24) {
      pen.underline = false;
    } else if (p == 27) {
      pen.reverse = false;
    } else if (p >= 30 && p <= 37) {
      pen.foreground = p - 30;
    } else if (p == 39) {
      pen.foreground = -1;
    } else if (p >= 40 && p <= 47) {
      pen.background = p - 40;
    } else if (p == 49) {
      pen.background = -1;
    } else if (p >= 90 && p <= 97) {
      pen.foreground = p - 90 + 8;
    } else if (p >= 100 && p <= 107) {
      pen.background = p - 100 + 8;
    } else if (p == 38 || p == 48) {
      // 38;5;n selects a palette index, 38;2;r;g;b a true color that we
      // cannot store
      if (i + 2 < params.size() && params[i + 1] == 5) {
        int index = params[i + 2];
        if (p == 38) {
          pen.foreground = index;
        } else {
          pen.background = index;
        }
        i += 2;
      } else if (i + 4 < params.size() && params[i + 1] == 2) {
        i += 4;
      } else {
        break;
      }
    }
  }
}

void PlainTextEmulator::eraseInDisplay(int mode) {
  size_t rows = grid.getPhysicalRows();
  switch (mode) {
    case 0:
      eraseInLine(0);
      for (size_t y = cursorY + 1; y < rows; y++) {
        grid.clearVisibleLine(y);
      }
      break;
    case 1:
      eraseInLine(1);
      for (size_t y = 0; y < cursorY; y++) {
        grid.clearVisibleLine(y);
      }
      break;
    case 2:
      for (size_t y = 0; y < rows; y++) {
        grid.clearVisibleLine(y);
      }
      break;
    case 3:
      eraseScrollback();
      break;
    default:
      break;
  }
}

void PlainTextEmulator::eraseInLine(int mode) {
  auto& cells = grid.visibleLine(cursorY).getCells();
  size_t start = 0;
  size_t end = cells.size();
  if (mode == 0) {
    start = cursorX;
  } else if (mode == 1) {
    end = min(cells.size(), cursorX + 1);
  } else if (mode != 2) {
    return;
  }
  for (size_t x = start; x < end; x++) {
    cells[x] = Cell();
  }
}

void PlainTextEmulator::dispatchOsc() {
  auto separator = oscBuffer.find(';');
  string code = oscBuffer.substr(0, separator);
  string payload =
      separator == string::npos ? string() : oscBuffer.substr(separator + 1);
  if (code == "0" || code == "2") {
    title = payload;
  } else if (code == "7") {
    if (payload.empty()) {
      currentDir = std::nullopt;
    } else {
      currentDir = payload;
    }
  } else if (code == "52") {
    handleClipboardOsc(payload);
  } else if (code == "133") {
    if (!payload.empty()) {
      markSemanticZone(payload[0]);
    }
  } else {
    VLOG(2) << "Ignoring OSC " << code;
  }
  oscBuffer.clear();
}

void PlainTextEmulator::handleClipboardOsc(const string& payload) {
  auto separator = payload.find(';');
  if (separator == string::npos) {
    return;
  }
  string data = payload.substr(separator + 1);
  if (!clipboard) {
    VLOG(1) << "OSC 52 without a clipboard, dropping selection";
    return;
  }
  if (data == "?") {
    // Reading the clipboard back is not offered to programs in the pane
    return;
  }
  if (data.empty()) {
    clipboard->setContents(std::nullopt);
    return;
  }
  string decoded;
  if (!Base64::Decode(data, &decoded)) {
    LOG(WARNING) << "Invalid base64 in OSC 52 payload";
    return;
  }
  clipboard->setContents(decoded);
}

StableRowIndex PlainTextEmulator::cursorStableRow() const {
  return grid.physToStableRowIndex(grid.visibleRowToPhys(cursorY));
}

void PlainTextEmulator::markSemanticZone(char marker) {
  StableRowIndex row = cursorStableRow();
  if (openZone) {
    SemanticZone zone = *openZone;
    if (cursorX > 0) {
      zone.endX = cursorX - 1;
      zone.endY = row;
    } else {
      zone.endX = grid.getPhysicalCols() - 1;
      zone.endY = max(zone.startY, row - 1);
    }
    zones.push_back(zone);
    openZone = std::nullopt;
  }
  SemanticType type;
  switch (marker) {
    case 'A':
      type = SemanticType::Prompt;
      break;
    case 'B':
      type = SemanticType::Input;
      break;
    case 'C':
      type = SemanticType::Output;
      break;
    default:
      // 'D' only closes the current zone
      return;
  }
  SemanticZone zone;
  zone.startX = cursorX;
  zone.startY = row;
  zone.endX = cursorX;
  zone.endY = row;
  zone.type = type;
  openZone = zone;
}

vector<SemanticZone> PlainTextEmulator::getSemanticZones() const {
  vector<SemanticZone> retval = zones;
  if (openZone) {
    SemanticZone zone = *openZone;
    zone.endX = cursorX;
    zone.endY = cursorStableRow();
    retval.push_back(zone);
  }
  return retval;
}

void PlainTextEmulator::mouseEvent(const MouseEvent& event) {
  if (event.x >= grid.getPhysicalCols() || event.y >= grid.getPhysicalRows()) {
    throw std::runtime_error("Mouse event at " + to_string(event.x) + "," +
                             to_string(event.y) + " is outside of the screen");
  }
  if (!mouseTracking) {
    return;
  }
  if (event.kind == MouseEventKind::Move) {
    if (mouseTracking == 1000) {
      return;
    }
    if (mouseTracking == 1002 && event.button == MouseButton::None) {
      return;
    }
  }

  int code;
  switch (event.button) {
    case MouseButton::Left:
      code = 0;
      break;
    case MouseButton::Middle:
      code = 1;
      break;
    case MouseButton::Right:
      code = 2;
      break;
    case MouseButton::WheelUp:
      code = 64;
      break;
    case MouseButton::WheelDown:
      code = 65;
      break;
    default:
      code = 3;
      break;
  }
  if (event.kind == MouseEventKind::Move) {
    code += 32;
  }
  if (event.modifiers & MOD_SHIFT) code += 4;
  if (event.modifiers & MOD_ALT) code += 8;
  if (event.modifiers & MOD_CTRL) code += 16;

  if (sgrMouse) {
    writeToChild(string("\x1b[<") + to_string(code) + ";" +
                 to_string(event.x + 1) + ";" + to_string(event.y + 1) +
                 (event.kind == MouseEventKind::Release ? "m" : "M"));
    return;
  }

  if (event.kind == MouseEventKind::Release) {
    code = (code & ~3) | 3;
  }
  if (event.x + 1 + 32 > 255 || event.y + 1 + 32 > 255) {
    throw std::runtime_error(
        "Mouse position cannot be encoded without SGR mouse mode");
  }
  string s = "\x1b[M";
  s.push_back(char(32 + code));
  s.push_back(char(32 + event.x + 1));
  s.push_back(char(32 + event.y + 1));
  writeToChild(s);
}

void PlainTextEmulator::keyDown(const KeyCode& key, KeyModifiers mods) {
  string s;
  auto csiWithModifiers = [mods](const string& prefix, char final) {
    if (mods == MOD_NONE) {
      return prefix + final;
    }
    return string("\x1b[1;") + to_string(modifierParam(mods)) + final;
  };
  switch (key.key) {
    case Key::Char: {
      if (key.ch == 0) {
        throw std::runtime_error("Key event without a character");
      }
      char32_t ch = key.ch;
      if ((mods & MOD_CTRL) && ch < 0x80) {
        if (ch == ' ' || ch == '@') {
          s.push_back('\0');
        } else if ((ch >= 'a' && ch <= 'z') || (ch >= '[' && ch <= '_')) {
          s.push_back(char(ch & 0x1f));
        } else if (ch >= 'A' && ch <= 'Z') {
          s.push_back(char(ch & 0x1f));
        } else {
          utf8::encode(ch, &s);
        }
      } else {
        utf8::encode(ch, &s);
      }
      if (mods & MOD_ALT) {
        s = string(1, ESC) + s;
      }
      break;
    }
    case Key::Enter:
      s = (mods & MOD_ALT) ? "\x1b\r" : "\r";
      break;
    case Key::Tab:
      s = (mods & MOD_SHIFT) ? "\x1b[Z" : "\t";
      break;
    case Key::Backspace:
      s = (mods & MOD_CTRL) ? "\x08" : "\x7f";
      if (mods & MOD_ALT) {
        s = string(1, ESC) + s;
      }
      break;
    case Key::Escape:
      s = "\x1b";
      break;
    case Key::UpArrow:
      s = csiWithModifiers(applicationCursorKeys ? "\x1bO" : "\x1b[", 'A');
      break;
    case Key::DownArrow:
      s = csiWithModifiers(applicationCursorKeys ? "\x1bO" : "\x1b[", 'B');
      break;
    case Key::RightArrow:
      s = csiWithModifiers(applicationCursorKeys ? "\x1bO" : "\x1b[", 'C');
      break;
    case Key::LeftArrow:
      s = csiWithModifiers(applicationCursorKeys ? "\x1bO" : "\x1b[", 'D');
      break;
    case Key::Home:
      s = csiWithModifiers("\x1b[", 'H');
      break;
    case Key::End:
      s = csiWithModifiers("\x1b[", 'F');
      break;
    case Key::Insert:
      s = "\x1b[2~";
      break;
    case Key::Delete:
      s = "\x1b[3~";
      break;
    case Key::PageUp:
      s = "\x1b[5~";
      break;
    case Key::PageDown:
      s = "\x1b[6~";
      break;
    case Key::Function: {
      static const int TILDE_CODES[] = {15, 17, 18, 19, 20, 21, 23, 24};
      int n = key.functionNumber;
      if (n >= 1 && n <= 4) {
        s = csiWithModifiers("\x1bO", char('P' + n - 1));
      } else if (n >= 5 && n <= 12) {
        s = string("\x1b[") + to_string(TILDE_CODES[n - 5]);
        if (mods != MOD_NONE) {
          s += ";" + to_string(modifierParam(mods));
        }
        s += "~";
      } else {
        throw std::runtime_error("Unsupported function key F" + to_string(n));
      }
      break;
    }
  }
  writeToChild(s);
}

void PlainTextEmulator::sendPaste(const string& text) {
  string normalized = text;
  replaceAll(normalized, "\r\n", "\r");
  replaceAll(normalized, "\n", "\r");
  if (bracketedPaste) {
    writeToChild("\x1b[200~" + normalized + "\x1b[201~");
  } else {
    writeToChild(normalized);
  }
}

void PlainTextEmulator::resize(size_t rows, size_t cols, size_t _pixelWidth,
                               size_t _pixelHeight) {
  grid.resize(rows, cols);
  pruneZones();
  pixelWidth = _pixelWidth;
  pixelHeight = _pixelHeight;
  clampCursor();
  seqNo++;
}

void PlainTextEmulator::eraseScrollback() {
  grid.eraseScrollback();
  pruneZones();
  seqNo++;
}

void PlainTextEmulator::pruneZones() {
  StableRowIndex firstRow = grid.physToStableRowIndex(0);
  zones.erase(remove_if(zones.begin(), zones.end(),
                        [firstRow](const SemanticZone& zone) {
                          return zone.endY < firstRow;
                        }),
              zones.end());
}

void PlainTextEmulator::focusChanged(bool focused) {
  if (focusReporting) {
    writeToChild(focused ? "\x1b[I" : "\x1b[O");
  }
}

void PlainTextEmulator::respond(const string& data) {
  // Replies to queries happen while ingesting output, which has no error
  // channel back to the caller.
  try {
    writeToChild(data);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not answer terminal query: " << re.what();
  }
}

void PlainTextEmulator::writeToChild(const string& data) {
  if (!writer) {
    throw std::runtime_error("Emulator has no writer to the child process");
  }
  writer->write(data);
  writer->flush();
}
}  // namespace lpane
