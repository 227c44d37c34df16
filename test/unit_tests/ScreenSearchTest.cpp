#include "PlainTextEmulator.hpp"
#include "ScreenSearch.hpp"
#include "TestHeaders.hpp"
#include "Utf8.hpp"

using namespace lpane;

namespace {
vector<SearchResult> searchFor(PlainTextEmulator& emulator,
                               const Pattern& pattern) {
  ScreenSearchEngine engine(pattern);
  return engine.search(emulator.screen());
}
}  // namespace

TEST_CASE("Literal match reports its start and the cell after it",
          "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(5, 20), 100, nullptr);
  emulator.advanceBytes("hello world\r\nfoo bar");

  auto results = searchFor(emulator, Pattern::caseSensitive("world"));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0] == SearchResult(6, 0, 11, 0));

  auto bar = searchFor(emulator, Pattern::caseSensitive("bar"));
  REQUIRE(bar.size() == 1);
  REQUIRE(bar[0] == SearchResult(4, 1, 7, 1));
}

TEST_CASE("Case insensitive search folds non-ASCII letters",
          "[ScreenSearch]") {
  REQUIRE(utf8::localeIsUtf8());
  PlainTextEmulator emulator(ScreenSize(3, 10), 100, nullptr);
  // "CAF\u00c9" on screen, "caf\u00e9" in the pattern
  emulator.advanceBytes("x CAF\xc3\x89");

  auto results =
      searchFor(emulator, Pattern::caseInsensitive("caf\xc3\xa9"));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0] == SearchResult(2, 0, 6, 0));
}

TEST_CASE("Case sensitive search does not fold case", "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(3, 10), 100, nullptr);
  emulator.advanceBytes("xxABCyy");

  REQUIRE(searchFor(emulator, Pattern::caseSensitive("abc")).empty());
  REQUIRE(searchFor(emulator, Pattern::caseSensitive("ABC")).size() == 1);
}

TEST_CASE("Case insensitive search lowercases pattern and screen",
          "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(3, 10), 100, nullptr);
  emulator.advanceBytes("xxABCyy");

  auto results = searchFor(emulator, Pattern::caseInsensitive("abc"));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0] == SearchResult(2, 0, 5, 0));

  auto upper = searchFor(emulator, Pattern::caseInsensitive("ABC"));
  REQUIRE(upper.size() == 1);
  REQUIRE(upper[0] == results[0]);
}

TEST_CASE("Results come back in scan order", "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(4, 12), 100, nullptr);
  emulator.advanceBytes("ab ab\r\nxx\r\nab");

  auto results = searchFor(emulator, Pattern::caseSensitive("ab"));
  REQUIRE(results.size() == 3);
  REQUIRE(results[0].startY == 0);
  REQUIRE(results[0].startX == 0);
  REQUIRE(results[1].startY == 0);
  REQUIRE(results[1].startX == 3);
  REQUIRE(results[2].startY == 2);
  REQUIRE(results[2].startX == 0);
  for (size_t i = 1; i < results.size(); i++) {
    auto prev = make_pair(results[i - 1].startY, results[i - 1].startX);
    auto cur = make_pair(results[i].startY, results[i].startX);
    REQUIRE(prev < cur);
  }
}

TEST_CASE("Matches continue across soft wrapped rows", "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(2, 3), 100, nullptr);
  emulator.advanceBytes("hello");
  REQUIRE(emulator.screen().visibleLine(0).isWrapped());
  REQUIRE(emulator.screen().visibleLine(0).asString() == "hel");
  REQUIRE(emulator.screen().visibleLine(1).asString() == "lo");

  auto results = searchFor(emulator, Pattern::caseSensitive("hello"));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0] == SearchResult(0, 0, 2, 1));
}

TEST_CASE("Soft wraps after a wide grapheme keep the paragraph",
          "[ScreenSearch]") {
  REQUIRE(utf8::localeIsUtf8());
  PlainTextEmulator emulator(ScreenSize(3, 4), 100, nullptr);
  // U+4E2D takes the last two columns of the first row
  emulator.advanceBytes("ab\xe4\xb8\xad" "de");
  REQUIRE(emulator.screen().visibleLine(0).asString() == "ab\xe4\xb8\xad");
  REQUIRE(emulator.screen().visibleLine(0).isWrapped());
  REQUIRE(emulator.screen().visibleLine(1).asString() == "de");

  auto results =
      searchFor(emulator, Pattern::caseSensitive("\xe4\xb8\xad" "d"));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0] == SearchResult(2, 0, 1, 1));

  auto regex = searchFor(emulator, Pattern::regex("b.+d"));
  REQUIRE(regex.size() == 1);
  REQUIRE(regex[0] == SearchResult(1, 0, 1, 1));
}

TEST_CASE("Hard line breaks split literal matches", "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(3, 10), 100, nullptr);
  emulator.advanceBytes("hel\r\nlo");

  REQUIRE(searchFor(emulator, Pattern::caseSensitive("hello")).empty());
}

TEST_CASE("Regex search", "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(3, 16), 100, nullptr);
  emulator.advanceBytes("foo 123\r\nbar 4567");

  SECTION("finds every non-overlapping match") {
    auto results = searchFor(emulator, Pattern::regex("[0-9]+"));
    REQUIRE(results.size() == 2);
    REQUIRE(results[0] == SearchResult(4, 0, 7, 0));
    REQUIRE(results[1] == SearchResult(4, 1, 8, 1));
  }

  SECTION("sees paragraphs separated by newlines") {
    auto results = searchFor(emulator, Pattern::regex("123 *\nbar"));
    REQUIRE(results.size() == 1);
    REQUIRE(results[0] == SearchResult(4, 0, 3, 1));
  }

  SECTION("invalid syntax yields no matches") {
    REQUIRE(searchFor(emulator, Pattern::regex("(unclosed")).empty());
    REQUIRE(searchFor(emulator, Pattern::regex("[z-a]")).empty());
  }
}

TEST_CASE("Empty literal pattern matches nothing", "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(3, 10), 100, nullptr);
  emulator.advanceBytes("anything");

  REQUIRE(searchFor(emulator, Pattern::caseSensitive("")).empty());
  REQUIRE(searchFor(emulator, Pattern::caseInsensitive("")).empty());
}

TEST_CASE("Matches in scrollback use stable rows", "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(2, 10), 2, nullptr);
  emulator.advanceBytes("one\r\nneedle\r\nthree\r\nfour\r\nfive");
  // one has been trimmed from history, needle is the oldest retained row
  const Screen& screen = emulator.screen();
  REQUIRE(screen.numLines() == 4);
  REQUIRE(screen.physToStableRowIndex(0) == 1);

  auto results = searchFor(emulator, Pattern::caseSensitive("needle"));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].startY == 1);
  REQUIRE(results[0].startX == 0);

  REQUIRE(searchFor(emulator, Pattern::caseSensitive("one")).empty());
}

TEST_CASE("Haystack offsets map back to coordinates", "[ScreenSearch]") {
  vector<SearchCoord> coords;
  coords.push_back(SearchCoord(0, 0, 10));
  coords.push_back(SearchCoord(3, 1, 10));
  coords.push_back(SearchCoord(5, 0, 11));

  SECTION("an exact offset resolves to its own entry") {
    REQUIRE(ScreenSearchEngine::haystackIdxToCoord(0, coords) ==
            make_pair(size_t(0), StableRowIndex(10)));
    REQUIRE(ScreenSearchEngine::haystackIdxToCoord(3, coords) ==
            make_pair(size_t(1), StableRowIndex(10)));
    REQUIRE(ScreenSearchEngine::haystackIdxToCoord(5, coords) ==
            make_pair(size_t(0), StableRowIndex(11)));
  }

  SECTION("an offset inside a multi-byte grapheme resolves to its start") {
    REQUIRE(ScreenSearchEngine::haystackIdxToCoord(1, coords) ==
            make_pair(size_t(0), StableRowIndex(10)));
    REQUIRE(ScreenSearchEngine::haystackIdxToCoord(4, coords) ==
            make_pair(size_t(1), StableRowIndex(10)));
  }

  SECTION("an offset past the end resolves to the last entry") {
    REQUIRE(ScreenSearchEngine::haystackIdxToCoord(6, coords) ==
            make_pair(size_t(0), StableRowIndex(11)));
    REQUIRE(ScreenSearchEngine::haystackIdxToCoord(1000, coords) ==
            make_pair(size_t(0), StableRowIndex(11)));
  }
}

TEST_CASE("Multi-byte graphemes are addressed by grapheme index",
          "[ScreenSearch]") {
  PlainTextEmulator emulator(ScreenSize(2, 10), 10, nullptr);
  emulator.advanceBytes("\xc3\xa9t\xc3\xa9 ok");

  auto results = searchFor(emulator, Pattern::caseSensitive("ok"));
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].startX == 4);
  REQUIRE(results[0].endX == 6);
}
