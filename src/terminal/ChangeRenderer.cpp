#include "ChangeRenderer.hpp"

namespace lpane {
void ChangeRenderer::render(const vector<Change>& changes, string* out) const {
  for (auto& change : changes) {
    switch (change.type) {
      case ChangeType::Text: {
        // Raw mode turns off output newline translation
        string text = change.text;
        replaceAll(text, "\r\n", "\n");
        replaceAll(text, "\n", "\r\n");
        out->append(text);
        break;
      }
      case ChangeType::CursorPosition:
        out->append("\x1b[" + to_string(change.y + 1) + ";" +
                    to_string(change.x + 1) + "H");
        break;
      case ChangeType::Attributes:
        renderAttributes(change.attrs, out);
        break;
      case ChangeType::ClearScreen:
        out->append("\x1b[H\x1b[2J");
        break;
      case ChangeType::CursorVisibility:
        out->append(change.visible ? "\x1b[?25h" : "\x1b[?25l");
        break;
      case ChangeType::Title:
        if (caps.titles) {
          out->append("\x1b]2;" + change.text + "\x07");
        }
        break;
    }
  }
}

void ChangeRenderer::renderAttributes(const CellAttributes& attrs,
                                      string* out) const {
  string sgr = "\x1b[0";
  if (attrs.bold) sgr += ";1";
  if (attrs.underline) sgr += ";4";
  if (attrs.reverse) sgr += ";7";
  if (caps.colorLevel != ColorLevel::MonoChrome) {
    renderColor(attrs.foreground, true, &sgr);
    renderColor(attrs.background, false, &sgr);
  }
  sgr += "m";
  out->append(sgr);
}

void ChangeRenderer::renderColor(int index, bool foreground,
                                 string* out) const {
  if (index < 0) {
    return;
  }
  int base = foreground ? 30 : 40;
  if (index < 8) {
    out->append(";" + to_string(base + index));
    return;
  }
  if (index < 16) {
    out->append(";" + to_string(base + 60 + index - 8));
    return;
  }
  if (caps.colorLevel == ColorLevel::Sixteen) {
    // Nothing sensible to map an extended index to, keep the default color
    return;
  }
  out->append(";" + to_string(foreground ? 38 : 48) + ";5;" +
              to_string(index));
}
}  // namespace lpane
