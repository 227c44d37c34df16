#ifndef __LPANE_CAPABILITIES__
#define __LPANE_CAPABILITIES__

#include "Headers.hpp"

namespace lpane {
enum class ColorLevel { MonoChrome, Sixteen, TwoFiftySix, TrueColor };

/**
 * @brief What the output device can display, used to pick escape sequences
 * when rendering.
 */
struct Capabilities {
  ColorLevel colorLevel;
  bool bracketedPaste;
  bool mouseReporting;
  bool titles;

  Capabilities()
      : colorLevel(ColorLevel::Sixteen),
        bracketedPaste(true),
        mouseReporting(true),
        titles(true) {}

  /** @brief Derives capabilities from TERM and COLORTERM. */
  static Capabilities fromEnvironment();
  static Capabilities fromTermNames(const string& term,
                                    const string& colorTerm);
};
}  // namespace lpane

#endif  // __LPANE_CAPABILITIES__
