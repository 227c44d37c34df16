#ifndef __LPANE_SCREEN__
#define __LPANE_SCREEN__

#include "Headers.hpp"

namespace lpane {
/**
 * @brief Logical row identifier that survives scrollback growth and trimming.
 */
typedef int64_t StableRowIndex;

struct CellAttributes {
  /** @brief Set on the last cell of a row that soft-wraps into the next. */
  bool wrapped;
  bool bold;
  bool underline;
  bool reverse;
  /** @brief Palette index, -1 for the default color. */
  int foreground;
  int background;

  CellAttributes()
      : wrapped(false),
        bold(false),
        underline(false),
        reverse(false),
        foreground(-1),
        background(-1) {}
};

/**
 * @brief One screen cell holding a grapheme.
 *
 * A double-width grapheme occupies its own cell plus a continuation cell of
 * width 0 that is hidden from `Line::visibleCells()`.
 */
class Cell {
 public:
  Cell() : text(" "), width(1) {}
  Cell(const string& _text, int _width, const CellAttributes& _attrs)
      : text(_text), width(_width), attrs(_attrs) {}

  const string& str() const { return text; }
  int getWidth() const { return width; }
  const CellAttributes& getAttrs() const { return attrs; }
  CellAttributes& getAttrs() { return attrs; }

 protected:
  string text;
  int width;
  CellAttributes attrs;
};

class Line {
 public:
  Line() {}
  explicit Line(size_t width) : cells(width) {}

  /**
   * @brief Grapheme cells left to right paired with their grapheme index.
   * Continuation cells of wide graphemes are skipped.
   */
  vector<pair<size_t, const Cell*>> visibleCells() const;

  /** @brief Whether the row soft-wraps into the next one. */
  bool isWrapped() const;
  void setWrapped(bool wrapped);

  /** @brief Sets the cell at `x`, growing the line as needed. */
  void setCell(size_t x, const Cell& cell);

  /** @brief Concatenated text of the visible cells, trailing blanks trimmed. */
  string asString() const;

  size_t size() const { return cells.size(); }
  vector<Cell>& getCells() { return cells; }
  const vector<Cell>& getCells() const { return cells; }

 protected:
  vector<Cell> cells;
};

/**
 * @brief Scrollback plus visible rows, oldest first.
 *
 * Physical row 0 is the oldest retained row.  The stable index of a row is
 * its physical index plus the number of rows ever trimmed from the front.
 */
class Screen {
 public:
  Screen(size_t physicalRows, size_t physicalCols, size_t scrollbackSize);

  const deque<Line>& getLines() const { return lines; }
  size_t numLines() const { return lines.size(); }
  const Line& line(size_t physRow) const { return lines.at(physRow); }

  StableRowIndex physToStableRowIndex(size_t physRow) const {
    return stableRowIndexOffset + StableRowIndex(physRow);
  }
  optional<size_t> stableToPhysRowIndex(StableRowIndex stableRow) const;

  size_t getPhysicalRows() const { return physicalRows; }
  size_t getPhysicalCols() const { return physicalCols; }
  size_t getScrollbackSize() const { return scrollbackSize; }
  size_t scrollbackRows() const { return lines.size() - physicalRows; }

  /** @brief Physical index of the visible row `y` (0 is the top row). */
  size_t visibleRowToPhys(size_t y) const {
    return lines.size() - physicalRows + y;
  }
  Line& visibleLine(size_t y) { return lines[visibleRowToPhys(y)]; }
  const Line& visibleLine(size_t y) const {
    return lines[visibleRowToPhys(y)];
  }

  /** @brief Adds a blank row at the bottom, trimming history when full. */
  void scrollUp();
  /** @brief Blanks a visible row. */
  void clearVisibleLine(size_t y);
  /** @brief Drops every row that is not visible. */
  void eraseScrollback();
  /** @brief Changes the visible geometry.  Rows are not reflowed. */
  void resize(size_t rows, size_t cols);

 protected:
  deque<Line> lines;
  size_t physicalRows;
  size_t physicalCols;
  size_t scrollbackSize;
  StableRowIndex stableRowIndexOffset;

  void trimScrollback();
};
}  // namespace lpane

#endif  // __LPANE_SCREEN__
