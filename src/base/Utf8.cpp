#include "Utf8.hpp"

#include <langinfo.h>
#include <wchar.h>

#include <clocale>

namespace lpane {
namespace utf8 {
namespace {
const char32_t REPLACEMENT_CHARACTER = 0xFFFD;
}

size_t sequenceLength(uint8_t lead) {
  // 0xxxxxxx
  if ((lead >> 7) == 0x0) return 1;
  // 110xxxxx
  if ((lead >> 5) == 0x6) return 2;
  // 1110xxxx
  if ((lead >> 4) == 0xe) return 3;
  // 11110xxx
  if ((lead >> 3) == 0x1e) return 4;
  // stray continuation bytes and garbage
  return 1;
}

char32_t decode(const string& s, size_t pos, size_t* consumed) {
  uint8_t lead = uint8_t(s[pos]);
  size_t len = sequenceLength(lead);
  if (len == 1) {
    *consumed = 1;
    return lead < 0x80 ? char32_t(lead) : REPLACEMENT_CHARACTER;
  }
  if (pos + len > s.size()) {
    *consumed = 1;
    return REPLACEMENT_CHARACTER;
  }
  char32_t cp;
  switch (len) {
    case 2:
      cp = lead & 0x1f;
      break;
    case 3:
      cp = lead & 0x0f;
      break;
    default:
      cp = lead & 0x07;
      break;
  }
  for (size_t i = 1; i < len; i++) {
    uint8_t ch = uint8_t(s[pos + i]);
    if (!isContinuation(ch)) {
      *consumed = 1;
      return REPLACEMENT_CHARACTER;
    }
    cp = (cp << 6) | (ch & 0x3f);
  }
  *consumed = len;
  return cp;
}

void encode(char32_t cp, string* out) {
  if (cp < 0x80) {
    out->push_back(char(cp));
  } else if (cp < 0x800) {
    out->push_back(char(0xc0 | (cp >> 6)));
    out->push_back(char(0x80 | (cp & 0x3f)));
  } else if (cp < 0x10000) {
    out->push_back(char(0xe0 | (cp >> 12)));
    out->push_back(char(0x80 | ((cp >> 6) & 0x3f)));
    out->push_back(char(0x80 | (cp & 0x3f)));
  } else if (cp < 0x110000) {
    out->push_back(char(0xf0 | (cp >> 18)));
    out->push_back(char(0x80 | ((cp >> 12) & 0x3f)));
    out->push_back(char(0x80 | ((cp >> 6) & 0x3f)));
    out->push_back(char(0x80 | (cp & 0x3f)));
  } else {
    encode(REPLACEMENT_CHARACTER, out);
  }
}

string toLower(const string& s) {
  string retval;
  retval.reserve(s.size());
  size_t pos = 0;
  while (pos < s.size()) {
    uint8_t ch = uint8_t(s[pos]);
    if (ch < 0x80) {
      // ASCII fast path, also keeps the result independent of the locale
      retval.push_back(char(ch >= 'A' && ch <= 'Z' ? ch + ('a' - 'A') : ch));
      pos++;
      continue;
    }
    size_t consumed;
    char32_t cp = decode(s, pos, &consumed);
    if (cp == REPLACEMENT_CHARACTER) {
      // Keep the original bytes so offsets in the haystack stay meaningful
      retval.append(s, pos, consumed);
    } else {
      encode(char32_t(::towlower(wint_t(cp))), &retval);
    }
    pos += consumed;
  }
  return retval;
}

int columnWidth(char32_t cp) {
  if (cp < 0x20 || (cp >= 0x7f && cp < 0xa0)) {
    return 0;
  }
  int w = ::wcwidth(wchar_t(cp));
  if (w < 0) {
    return 1;
  }
  return w;
}

bool localeIsUtf8() {
  const char* codeset = ::nl_langinfo(CODESET);
  if (codeset == NULL) {
    return false;
  }
  return strcmp(codeset, "UTF-8") == 0 || strcmp(codeset, "utf8") == 0;
}

bool setupLocale() {
  if (::setlocale(LC_ALL, "") == NULL) {
    LOG(WARNING) << "Cannot apply the locale from the environment";
  }
  if (localeIsUtf8()) {
    return true;
  }
  if (::setlocale(LC_CTYPE, "C.UTF-8") == NULL) {
    LOG(WARNING) << "No UTF-8 locale, wide characters will take one column";
    return false;
  }
  VLOG(1) << "Using C.UTF-8 for character types";
  return localeIsUtf8();
}
}  // namespace utf8
}  // namespace lpane
