#ifndef __LPANE_SCREEN_SEARCH__
#define __LPANE_SCREEN_SEARCH__

#include "Headers.hpp"
#include "PaneTypes.hpp"
#include "Screen.hpp"

namespace lpane {
/**
 * @brief Where a grapheme's text starts in the search haystack.
 */
struct SearchCoord {
  size_t byteIdx;
  size_t graphemeIdx;
  StableRowIndex stableRow;

  SearchCoord(size_t _byteIdx, size_t _graphemeIdx, StableRowIndex _stableRow)
      : byteIdx(_byteIdx), graphemeIdx(_graphemeIdx), stableRow(_stableRow) {}
};

/**
 * @brief Finds a pattern in the lines of a screen, scrollback included.
 *
 * Soft-wrapped rows are joined so a match may span them.  Literal patterns
 * are matched one paragraph at a time; a regex sees the whole screen with a
 * newline between paragraphs.
 */
class ScreenSearchEngine {
 public:
  explicit ScreenSearchEngine(const Pattern& pattern);

  /** @brief All matches, top to bottom and left to right. */
  vector<SearchResult> search(const Screen& screen) const;

  /**
   * @brief Maps a haystack offset back to (grapheme index, stable row).
   *
   * An offset between two entries resolves to the preceding one, an offset
   * at or past the last entry resolves to the last one.  `coords` must be
   * non-empty and sorted by `byteIdx`.
   */
  static pair<size_t, StableRowIndex> haystackIdxToCoord(
      size_t idx, const vector<SearchCoord>& coords);

 protected:
  Pattern pattern;
  // Set only for valid regex patterns
  unique_ptr<std::regex> compiled;

  void collectMatches(const string& haystack,
                      const vector<SearchCoord>& coords,
                      vector<SearchResult>* results) const;
  void addResult(size_t start, size_t end, const vector<SearchCoord>& coords,
                 vector<SearchResult>* results) const;
};
}  // namespace lpane

#endif  // __LPANE_SCREEN_SEARCH__
