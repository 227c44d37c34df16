#ifndef __LPANE_UTF8__
#define __LPANE_UTF8__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Small UTF-8 helpers shared by the emulator, the input parser and the
 * search engine.
 */
namespace utf8 {
/** @brief Length of the sequence introduced by `lead`, 1 for invalid bytes. */
size_t sequenceLength(uint8_t lead);

/** @brief True for bytes of the form 10xxxxxx. */
inline bool isContinuation(uint8_t ch) { return (ch >> 6) == 0x2; }

/**
 * @brief Decodes one code point from `s` starting at `pos`.
 * Malformed input decodes to U+FFFD and consumes a single byte.
 * @param consumed Receives the number of bytes consumed.
 */
char32_t decode(const string& s, size_t pos, size_t* consumed);

/** @brief Appends the UTF-8 encoding of `cp` to `out`. */
void encode(char32_t cp, string* out);

inline string encode(char32_t cp) {
  string s;
  encode(cp, &s);
  return s;
}

/** @brief Lowercases every code point the C library knows a mapping for. */
string toLower(const string& s);

/**
 * @brief Number of terminal columns a code point occupies (0, 1 or 2).
 * Depends on LC_CTYPE, see `setupLocale()`.
 */
int columnWidth(char32_t cp);

/**
 * @brief Applies the locale from the environment and falls back to C.UTF-8
 * for LC_CTYPE when that one is not UTF-8.
 * @return true when the active character type locale is UTF-8.
 */
bool setupLocale();

bool localeIsUtf8();
}  // namespace utf8
}  // namespace lpane

#endif  // __LPANE_UTF8__
