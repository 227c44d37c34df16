#include "Screen.hpp"

namespace lpane {
vector<pair<size_t, const Cell*>> Line::visibleCells() const {
  vector<pair<size_t, const Cell*>> retval;
  retval.reserve(cells.size());
  size_t x = 0;
  while (x < cells.size()) {
    const Cell& cell = cells[x];
    retval.push_back(make_pair(x, &cell));
    x += size_t(max(1, cell.getWidth()));
  }
  return retval;
}

bool Line::isWrapped() const {
  if (cells.empty()) {
    return false;
  }
  return cells.back().getAttrs().wrapped;
}

void Line::setWrapped(bool wrapped) {
  if (cells.empty()) {
    cells.push_back(Cell());
  }
  for (auto& cell : cells) {
    cell.getAttrs().wrapped = false;
  }
  cells.back().getAttrs().wrapped = wrapped;
}

void Line::setCell(size_t x, const Cell& cell) {
  size_t needed = x + size_t(max(1, cell.getWidth()));
  if (cells.size() < needed) {
    cells.resize(needed);
  }
  cells[x] = cell;
  if (cell.getWidth() == 2) {
    cells[x + 1] = Cell("", 0, cell.getAttrs());
  }
}

string Line::asString() const {
  string s;
  for (auto& it : visibleCells()) {
    s += it.second->str();
  }
  auto end = s.find_last_not_of(' ');
  if (end == string::npos) {
    return string();
  }
  return s.substr(0, end + 1);
}

Screen::Screen(size_t _physicalRows, size_t _physicalCols,
               size_t _scrollbackSize)
    : physicalRows(max<size_t>(1, _physicalRows)),
      physicalCols(max<size_t>(1, _physicalCols)),
      scrollbackSize(_scrollbackSize),
      stableRowIndexOffset(0) {
  for (size_t a = 0; a < physicalRows; a++) {
    lines.push_back(Line(physicalCols));
  }
}

optional<size_t> Screen::stableToPhysRowIndex(StableRowIndex stableRow) const {
  if (stableRow < stableRowIndexOffset) {
    return std::nullopt;
  }
  size_t phys = size_t(stableRow - stableRowIndexOffset);
  if (phys >= lines.size()) {
    return std::nullopt;
  }
  return phys;
}

void Screen::scrollUp() {
  lines.push_back(Line(physicalCols));
  trimScrollback();
}

void Screen::clearVisibleLine(size_t y) {
  lines[visibleRowToPhys(y)] = Line(physicalCols);
}

void Screen::eraseScrollback() {
  size_t toErase = scrollbackRows();
  lines.erase(lines.begin(), lines.begin() + toErase);
  stableRowIndexOffset += StableRowIndex(toErase);
}

void Screen::resize(size_t rows, size_t cols) {
  rows = max<size_t>(1, rows);
  cols = max<size_t>(1, cols);
  while (lines.size() < rows) {
    lines.push_back(Line(cols));
  }
  physicalRows = rows;
  physicalCols = cols;
  trimScrollback();
}

void Screen::trimScrollback() {
  while (lines.size() > physicalRows + scrollbackSize) {
    lines.pop_front();
    stableRowIndexOffset++;
  }
}
}  // namespace lpane
