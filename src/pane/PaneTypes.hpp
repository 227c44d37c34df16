#ifndef __LPANE_PANE_TYPES__
#define __LPANE_PANE_TYPES__

#include "Headers.hpp"
#include "Screen.hpp"

namespace lpane {
typedef uint64_t PaneId;
typedef uint64_t DomainId;

/** @brief Returns a pane id never handed out before in this process. */
inline PaneId allocPaneId() {
  static std::atomic<PaneId> nextPaneId(0);
  return nextPaneId++;
}

enum class PatternType {
  CaseSensitiveString,
  CaseInsensitiveString,
  Regex,
};

struct Pattern {
  PatternType type;
  string text;

  Pattern() : type(PatternType::CaseSensitiveString) {}
  Pattern(PatternType _type, const string& _text) : type(_type), text(_text) {}

  static Pattern caseSensitive(const string& text) {
    return Pattern(PatternType::CaseSensitiveString, text);
  }
  static Pattern caseInsensitive(const string& text) {
    return Pattern(PatternType::CaseInsensitiveString, text);
  }
  static Pattern regex(const string& text) {
    return Pattern(PatternType::Regex, text);
  }
};

/**
 * @brief One match.  X values are grapheme indices within their row.
 *
 * The start is the first grapheme of the match.  The end is the grapheme just
 * after the match, or the last grapheme of the paragraph when the match runs
 * to its end.
 */
struct SearchResult {
  size_t startX;
  StableRowIndex startY;
  size_t endX;
  StableRowIndex endY;

  SearchResult() : startX(0), startY(0), endX(0), endY(0) {}
  SearchResult(size_t _startX, StableRowIndex _startY, size_t _endX,
               StableRowIndex _endY)
      : startX(_startX), startY(_startY), endX(_endX), endY(_endY) {}

  bool operator==(const SearchResult& other) const {
    return startX == other.startX && startY == other.startY &&
           endX == other.endX && endY == other.endY;
  }
};

inline std::ostream& operator<<(std::ostream& os, const SearchResult& r) {
  return os << "(" << r.startX << "," << r.startY << ")-(" << r.endX << ","
            << r.endY << ")";
}

/** @brief Whether the pane's child is known to be alive. */
enum class ExitState { Running, Exited, Unknown };
}  // namespace lpane

#endif  // __LPANE_PANE_TYPES__
