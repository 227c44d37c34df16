#include "PanePainter.hpp"

namespace lpane {
namespace {
bool sameLook(const CellAttributes& a, const CellAttributes& b) {
  return a.bold == b.bold && a.underline == b.underline &&
         a.reverse == b.reverse && a.foreground == b.foreground &&
         a.background == b.background;
}
}  // namespace

vector<Change> PanePainter::paint(const Renderable& view) {
  vector<Change> changes;
  auto dims = view.getDimensions();
  size_t rows = dims.first;
  size_t cols = dims.second;
  const Screen& screen = view.screen();

  changes.push_back(Change::showCursor(false));
  for (size_t y = 0; y < rows; y++) {
    changes.push_back(Change::moveCursor(0, y));
    CellAttributes current;
    changes.push_back(Change::setAttributes(current));
    string run;
    size_t width = 0;
    for (auto& it : screen.visibleLine(y).visibleCells()) {
      const Cell* cell = it.second;
      int cellWidth = std::max(cell->getWidth(), 1);
      if (width + size_t(cellWidth) > cols) {
        break;
      }
      if (!sameLook(cell->getAttrs(), current)) {
        if (!run.empty()) {
          changes.push_back(Change::makeText(run));
          run.clear();
        }
        current = cell->getAttrs();
        changes.push_back(Change::setAttributes(current));
      }
      run.append(cell->str());
      width += cellWidth;
    }
    if (width < cols) {
      if (!sameLook(CellAttributes(), current)) {
        if (!run.empty()) {
          changes.push_back(Change::makeText(run));
          run.clear();
        }
        changes.push_back(Change::setAttributes(CellAttributes()));
      }
      run.append(cols - width, ' ');
    }
    if (!run.empty()) {
      changes.push_back(Change::makeText(run));
    }
  }
  changes.push_back(Change::setAttributes(CellAttributes()));
  auto cursor = view.getCursorPosition();
  changes.push_back(Change::moveCursor(cursor.first, cursor.second));
  changes.push_back(Change::showCursor(true));

  lastSeqNo = view.getSeqNo();
  painted = true;
  return changes;
}
}  // namespace lpane
