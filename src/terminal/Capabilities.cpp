#include "Capabilities.hpp"

namespace lpane {
namespace {
bool endsWith(const string& s, const string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

Capabilities Capabilities::fromEnvironment() {
  const char* term = ::getenv("TERM");
  const char* colorTerm = ::getenv("COLORTERM");
  return fromTermNames(term ? term : "", colorTerm ? colorTerm : "");
}

Capabilities Capabilities::fromTermNames(const string& term,
                                         const string& colorTerm) {
  Capabilities caps;
  if (term.empty() || term == "dumb") {
    caps.colorLevel = ColorLevel::MonoChrome;
    caps.bracketedPaste = false;
    caps.mouseReporting = false;
    caps.titles = false;
    return caps;
  }
  if (colorTerm == "truecolor" || colorTerm == "24bit") {
    caps.colorLevel = ColorLevel::TrueColor;
  } else if (endsWith(term, "256color")) {
    caps.colorLevel = ColorLevel::TwoFiftySix;
  } else {
    caps.colorLevel = ColorLevel::Sixteen;
  }
  if (term == "linux" || term.compare(0, 6, "screen") == 0) {
    caps.titles = false;
  }
  VLOG(1) << "Terminal capabilities for " << term << ": color level "
          << int(caps.colorLevel);
  return caps;
}
}  // namespace lpane
