#include "InputParser.hpp"

#include "Utf8.hpp"

namespace lpane {
namespace {
const string PASTE_START = "\x1b[200~";
const string PASTE_END = "\x1b[201~";

// xterm encodes modifiers as 1 + bitmask
KeyModifiers modifiersFromParam(int param) {
  if (param <= 1) {
    return MOD_NONE;
  }
  int bits = param - 1;
  KeyModifiers mods = MOD_NONE;
  if (bits & 1) mods |= MOD_SHIFT;
  if (bits & 2) mods |= MOD_ALT;
  if (bits & 4) mods |= MOD_CTRL;
  if (bits & 8) mods |= MOD_SUPER;
  return mods;
}

vector<int> numericParams(const string& params) {
  vector<int> retval;
  for (auto& p : split(params, ';')) {
    if (p.empty() || p.find_first_not_of("0123456789") != string::npos) {
      retval.push_back(0);
    } else {
      retval.push_back(atoi(p.c_str()));
    }
  }
  return retval;
}

optional<KeyCode> tildeKey(int n) {
  switch (n) {
    case 1:
    case 7:
      return KeyCode(Key::Home);
    case 2:
      return KeyCode(Key::Insert);
    case 3:
      return KeyCode(Key::Delete);
    case 4:
    case 8:
      return KeyCode(Key::End);
    case 5:
      return KeyCode(Key::PageUp);
    case 6:
      return KeyCode(Key::PageDown);
    case 11:
    case 12:
    case 13:
    case 14:
    case 15:
      return KeyCode::function(n == 15 ? 5 : n - 10);
    case 17:
    case 18:
    case 19:
    case 20:
    case 21:
      return KeyCode::function(n - 11);
    case 23:
    case 24:
      return KeyCode::function(n - 12);
    default:
      return nullopt;
  }
}

optional<KeyCode> letterKey(char final) {
  switch (final) {
    case 'A':
      return KeyCode(Key::UpArrow);
    case 'B':
      return KeyCode(Key::DownArrow);
    case 'C':
      return KeyCode(Key::RightArrow);
    case 'D':
      return KeyCode(Key::LeftArrow);
    case 'H':
      return KeyCode(Key::Home);
    case 'F':
      return KeyCode(Key::End);
    case 'P':
      return KeyCode::function(1);
    case 'Q':
      return KeyCode::function(2);
    case 'R':
      return KeyCode::function(3);
    case 'S':
      return KeyCode::function(4);
    default:
      return nullopt;
  }
}
}  // namespace

void InputParser::feed(const string& bytes) {
  buffer.append(bytes);
  while (!buffer.empty()) {
    size_t consumed = parseOne(false);
    if (consumed == 0) {
      break;
    }
    buffer.erase(0, consumed);
  }
}

void InputParser::flush() {
  while (!buffer.empty()) {
    size_t consumed = parseOne(true);
    if (consumed == 0) {
      // Should not happen in final mode, drop a byte to make progress
      consumed = 1;
    }
    buffer.erase(0, consumed);
  }
}

optional<InputEvent> InputParser::pop() {
  if (events.empty()) {
    return nullopt;
  }
  InputEvent e = events.front();
  events.pop_front();
  return e;
}

size_t InputParser::parseOne(bool final) {
  if (uint8_t(buffer[0]) == 0x1b) {
    return parseEscape(final);
  }
  return parseChar(0, MOD_NONE, final);
}

size_t InputParser::parseEscape(bool final) {
  if (buffer.size() == 1) {
    if (!final) {
      return 0;
    }
    pushKey(KeyCode(Key::Escape), MOD_NONE);
    return 1;
  }
  if (buffer.compare(0, PASTE_START.size(), PASTE_START) == 0) {
    size_t consumed = parsePaste();
    if (consumed || !final) {
      return consumed;
    }
    // Unterminated paste at flush time: deliver what arrived
    events.push_back(InputEvent::pasted(buffer.substr(PASTE_START.size())));
    return buffer.size();
  }
  char next = buffer[1];
  if (next == '[') {
    size_t consumed = parseCsi();
    if (consumed || !final) {
      return consumed;
    }
    pushKey(KeyCode::character('['), MOD_ALT);
    return 2;
  }
  if (next == 'O') {
    size_t consumed = parseSs3();
    if (consumed || !final) {
      return consumed;
    }
    pushKey(KeyCode::character('O'), MOD_ALT);
    return 2;
  }
  if (uint8_t(next) == 0x1b) {
    pushKey(KeyCode(Key::Escape), MOD_ALT);
    return 2;
  }
  size_t consumed = parseChar(1, MOD_ALT, final);
  return consumed ? consumed + 1 : 0;
}

size_t InputParser::parseCsi() {
  size_t end = 2;
  while (end < buffer.size()) {
    uint8_t ch = buffer[end];
    if (ch >= 0x40 && ch <= 0x7e) {
      break;
    }
    end++;
  }
  if (end >= buffer.size()) {
    return 0;
  }
  char final = buffer[end];
  string params = buffer.substr(2, end - 2);
  size_t consumed = end + 1;

  if (!params.empty() && params[0] == '<' && (final == 'M' || final == 'm')) {
    if (!parseSgrMouse(params.substr(1), final)) {
      VLOG(1) << "Dropping malformed mouse report";
    }
    return consumed;
  }
  vector<int> nums = numericParams(params);
  if (final == 'Z') {
    pushKey(KeyCode(Key::Tab), MOD_SHIFT);
    return consumed;
  }
  if (final == '~') {
    optional<KeyCode> key;
    if (!nums.empty()) {
      key = tildeKey(nums[0]);
    }
    if (key) {
      pushKey(*key, nums.size() > 1 ? modifiersFromParam(nums[1]) : MOD_NONE);
    } else {
      VLOG(1) << "Unknown CSI ~ sequence: " << params;
    }
    return consumed;
  }
  auto key = letterKey(final);
  if (key) {
    pushKey(*key, nums.size() > 1 ? modifiersFromParam(nums[1]) : MOD_NONE);
  } else {
    VLOG(1) << "Unknown CSI sequence: " << params << final;
  }
  return consumed;
}

size_t InputParser::parseSs3() {
  if (buffer.size() < 3) {
    return 0;
  }
  auto key = letterKey(buffer[2]);
  if (key) {
    pushKey(*key, MOD_NONE);
  } else {
    VLOG(1) << "Unknown SS3 sequence: " << buffer[2];
  }
  return 3;
}

size_t InputParser::parsePaste() {
  size_t end = buffer.find(PASTE_END, PASTE_START.size());
  if (end == string::npos) {
    return 0;
  }
  events.push_back(InputEvent::pasted(
      buffer.substr(PASTE_START.size(), end - PASTE_START.size())));
  return end + PASTE_END.size();
}

size_t InputParser::parseChar(size_t pos, KeyModifiers extraMods,
                              bool final) {
  uint8_t ch = buffer[pos];
  if (ch == '\r' || ch == '\n') {
    pushKey(KeyCode(Key::Enter), extraMods);
    return 1;
  }
  if (ch == '\t') {
    pushKey(KeyCode(Key::Tab), extraMods);
    return 1;
  }
  if (ch == 0x7f || ch == 0x08) {
    pushKey(KeyCode(Key::Backspace), extraMods);
    return 1;
  }
  if (ch == 0) {
    pushKey(KeyCode::character(' '), extraMods | MOD_CTRL);
    return 1;
  }
  if (ch < 0x1b) {
    pushKey(KeyCode::character('a' + ch - 1), extraMods | MOD_CTRL);
    return 1;
  }
  if (ch < 0x20) {
    pushKey(KeyCode::character(ch + 0x40), extraMods | MOD_CTRL);
    return 1;
  }
  size_t len = utf8::sequenceLength(ch);
  if (pos + len > buffer.size() && !final) {
    return 0;
  }
  size_t consumed = 0;
  char32_t cp = utf8::decode(buffer, pos, &consumed);
  pushKey(KeyCode::character(cp), extraMods);
  return consumed;
}

bool InputParser::parseSgrMouse(const string& params, char final) {
  vector<int> nums = numericParams(params);
  if (nums.size() != 3 || nums[1] < 1 || nums[2] < 1) {
    return false;
  }
  int code = nums[0];
  MouseEvent m;
  m.x = size_t(nums[1] - 1);
  m.y = size_t(nums[2] - 1);
  if (code & 4) m.modifiers |= MOD_SHIFT;
  if (code & 8) m.modifiers |= MOD_ALT;
  if (code & 16) m.modifiers |= MOD_CTRL;
  bool motion = (code & 32) != 0;
  bool wheel = (code & 64) != 0;
  int button = code & 3;
  if (wheel) {
    m.kind = MouseEventKind::Press;
    m.button = button == 0 ? MouseButton::WheelUp : MouseButton::WheelDown;
  } else {
    switch (button) {
      case 0:
        m.button = MouseButton::Left;
        break;
      case 1:
        m.button = MouseButton::Middle;
        break;
      case 2:
        m.button = MouseButton::Right;
        break;
      default:
        m.button = MouseButton::None;
        break;
    }
    if (motion) {
      m.kind = MouseEventKind::Move;
    } else if (final == 'm') {
      m.kind = MouseEventKind::Release;
    } else {
      m.kind = MouseEventKind::Press;
    }
  }
  events.push_back(InputEvent::mouseEvent(m));
  return true;
}
}  // namespace lpane
