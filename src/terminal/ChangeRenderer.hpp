#ifndef __LPANE_CHANGE_RENDERER__
#define __LPANE_CHANGE_RENDERER__

#include "Capabilities.hpp"
#include "Change.hpp"
#include "Headers.hpp"

namespace lpane {
/**
 * @brief Turns `Change` operations into escape sequences for a device with
 * the given capabilities.
 */
class ChangeRenderer {
 public:
  explicit ChangeRenderer(const Capabilities& _caps) : caps(_caps) {}

  /** @brief Appends the bytes for `changes` to `out`. */
  void render(const vector<Change>& changes, string* out) const;

 protected:
  Capabilities caps;

  void renderAttributes(const CellAttributes& attrs, string* out) const;
  void renderColor(int index, bool foreground, string* out) const;
};
}  // namespace lpane

#endif  // __LPANE_CHANGE_RENDERER__
