#include "ChangeRenderer.hpp"
#include "FakePane.hpp"
#include "PanePainter.hpp"
#include "PlainTextEmulator.hpp"
#include "TestHeaders.hpp"

using namespace lpane;

namespace {
string paintToString(PanePainter* painter, const Renderable& view) {
  string out;
  ChangeRenderer(Capabilities()).render(painter->paint(view), &out);
  return out;
}
}  // namespace

TEST_CASE("Painting the visible rows", "[PanePainter]") {
  auto writer = make_shared<StringPtyWriter>();
  PlainTextEmulator emulator(ScreenSize(2, 4), 10, writer);
  emulator.advanceBytes("ab\x1b[1m" "c");

  PanePainter painter;
  REQUIRE(paintToString(&painter, emulator) ==
          string("\x1b[?25l") +                         //
              "\x1b[1;1H" "\x1b[0m" "ab"                //
              "\x1b[0;1m" "c" "\x1b[0m" " "             //
              "\x1b[2;1H" "\x1b[0m" "    "              //
              "\x1b[0m" "\x1b[1;4H" "\x1b[?25h");
}

TEST_CASE("Only changed panes need a repaint", "[PanePainter]") {
  auto writer = make_shared<StringPtyWriter>();
  PlainTextEmulator emulator(ScreenSize(2, 4), 10, writer);
  PanePainter painter;

  REQUIRE(painter.needsPaint(emulator));
  painter.paint(emulator);
  REQUIRE(!painter.needsPaint(emulator));

  emulator.advanceBytes("x");
  REQUIRE(painter.needsPaint(emulator));
  painter.paint(emulator);
  REQUIRE(!painter.needsPaint(emulator));

  emulator.resize(3, 4, 0, 0);
  REQUIRE(painter.needsPaint(emulator));
}

TEST_CASE("Only the visible part of the screen is painted", "[PanePainter]") {
  auto writer = make_shared<StringPtyWriter>();
  PlainTextEmulator emulator(ScreenSize(1, 3), 10, writer);
  emulator.advanceBytes("old\r\nnew");

  PanePainter painter;
  string out = paintToString(&painter, emulator);
  REQUIRE(out.find("new") != string::npos);
  REQUIRE(out.find("old") == string::npos);
}
