#include "ScreenSearch.hpp"

#include "Utf8.hpp"

namespace lpane {
ScreenSearchEngine::ScreenSearchEngine(const Pattern& _pattern)
    : pattern(_pattern) {
  switch (pattern.type) {
    case PatternType::CaseInsensitiveString:
      pattern.text = utf8::toLower(pattern.text);
      break;
    case PatternType::Regex:
      try {
        compiled.reset(
            new std::regex(pattern.text, std::regex::ECMAScript));
      } catch (const std::regex_error& re) {
        VLOG(1) << "Ignoring invalid search regex " << pattern.text << ": "
                << re.what();
      }
      break;
    case PatternType::CaseSensitiveString:
      break;
  }
}

pair<size_t, StableRowIndex> ScreenSearchEngine::haystackIdxToCoord(
    size_t idx, const vector<SearchCoord>& coords) {
  auto it = std::upper_bound(
      coords.begin(), coords.end(), idx,
      [](size_t value, const SearchCoord& c) { return value < c.byteIdx; });
  if (it != coords.begin()) {
    --it;
  }
  return make_pair(it->graphemeIdx, it->stableRow);
}

vector<SearchResult> ScreenSearchEngine::search(const Screen& screen) const {
  vector<SearchResult> results;
  if (pattern.type == PatternType::Regex && !compiled) {
    return results;
  }
  bool lowercase = pattern.type == PatternType::CaseInsensitiveString;
  string haystack;
  vector<SearchCoord> coords;

  const auto& lines = screen.getLines();
  for (size_t physRow = 0; physRow < lines.size(); physRow++) {
    StableRowIndex stableRow = screen.physToStableRowIndex(physRow);
    for (auto& it : lines[physRow].visibleCells()) {
      coords.emplace_back(haystack.size(), it.first, stableRow);
      if (lowercase) {
        haystack.append(utf8::toLower(it.second->str()));
      } else {
        haystack.append(it.second->str());
      }
    }

    if (!lines[physRow].isWrapped()) {
      if (pattern.type == PatternType::Regex) {
        haystack.push_back('\n');
      } else {
        collectMatches(haystack, coords, &results);
        haystack.clear();
        coords.clear();
      }
    }
  }
  collectMatches(haystack, coords, &results);
  return results;
}

void ScreenSearchEngine::collectMatches(const string& haystack,
                                        const vector<SearchCoord>& coords,
                                        vector<SearchResult>* results) const {
  if (haystack.empty() || coords.empty()) {
    return;
  }
  if (pattern.type == PatternType::Regex) {
    try {
      for (auto it = std::sregex_iterator(haystack.begin(), haystack.end(),
                                          *compiled);
           it != std::sregex_iterator(); ++it) {
        size_t start = size_t(it->position(0));
        addResult(start, start + size_t(it->length(0)), coords, results);
      }
    } catch (const std::regex_error& re) {
      // Matching can run out of stack or complexity budget on huge screens
      LOG(WARNING) << "Search regex failed while matching: " << re.what();
    }
    return;
  }
  if (pattern.text.empty()) {
    return;
  }
  size_t pos = haystack.find(pattern.text);
  while (pos != string::npos) {
    addResult(pos, pos + pattern.text.size(), coords, results);
    pos = haystack.find(pattern.text, pos + pattern.text.size());
  }
}

void ScreenSearchEngine::addResult(size_t start, size_t end,
                                   const vector<SearchCoord>& coords,
                                   vector<SearchResult>* results) const {
  auto startCoord = haystackIdxToCoord(start, coords);
  auto endCoord = haystackIdxToCoord(end, coords);
  results->push_back(SearchResult(startCoord.first, startCoord.second,
                                  endCoord.first, endCoord.second));
}
}  // namespace lpane
