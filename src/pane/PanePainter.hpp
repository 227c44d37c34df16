#ifndef __LPANE_PANE_PAINTER__
#define __LPANE_PANE_PAINTER__

#include "Change.hpp"
#include "Headers.hpp"
#include "TerminalEmulator.hpp"

namespace lpane {
/**
 * @brief Turns the visible part of a pane into `Change`s that repaint a raw
 * terminal device of the same size.
 */
class PanePainter {
 public:
  PanePainter() : lastSeqNo(0), painted(false) {}

  /** @brief True if `view` changed since the last `paint()`. */
  bool needsPaint(const Renderable& view) const {
    return !painted || view.getSeqNo() != lastSeqNo;
  }

  /** @brief A full repaint of the visible rows plus the cursor. */
  vector<Change> paint(const Renderable& view);

 protected:
  uint64_t lastSeqNo;
  bool painted;
};
}  // namespace lpane

#endif  // __LPANE_PANE_PAINTER__
