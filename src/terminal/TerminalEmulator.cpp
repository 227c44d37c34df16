#include "TerminalEmulator.hpp"

namespace lpane {
ColorPalette ColorPalette::defaults() {
  ColorPalette p;
  p.ansi = {{
      RgbColor(0x00, 0x00, 0x00),
      RgbColor(0xcd, 0x00, 0x00),
      RgbColor(0x00, 0xcd, 0x00),
      RgbColor(0xcd, 0xcd, 0x00),
      RgbColor(0x00, 0x00, 0xee),
      RgbColor(0xcd, 0x00, 0xcd),
      RgbColor(0x00, 0xcd, 0xcd),
      RgbColor(0xe5, 0xe5, 0xe5),
      RgbColor(0x7f, 0x7f, 0x7f),
      RgbColor(0xff, 0x00, 0x00),
      RgbColor(0x00, 0xff, 0x00),
      RgbColor(0xff, 0xff, 0x00),
      RgbColor(0x5c, 0x5c, 0xff),
      RgbColor(0xff, 0x00, 0xff),
      RgbColor(0x00, 0xff, 0xff),
      RgbColor(0xff, 0xff, 0xff),
  }};
  p.foreground = RgbColor(0xe5, 0xe5, 0xe5);
  p.background = RgbColor(0x00, 0x00, 0x00);
  p.cursor = RgbColor(0x52, 0xad, 0x70);
  return p;
}
}  // namespace lpane
