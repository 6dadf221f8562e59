#include "ScreenRenderer.hpp"

#include "TestHeaders.hpp"

using namespace st;

namespace {
TerminalInfo makeInfo(int rows, int columns) {
  TerminalInfo info;
  info.set_row(rows);
  info.set_column(columns);
  return info;
}
}  // namespace

TEST_CASE("Themes", "[ScreenRenderer]") {
  REQUIRE(ScreenRenderer::parseTheme("riot") == THEME_RIOT);
  REQUIRE(ScreenRenderer::parseTheme("Dark") == THEME_DARK);
  REQUIRE(ScreenRenderer::themeName(THEME_LIGHT) == "light");
  REQUIRE_THROWS_AS(ScreenRenderer::parseTheme("solarized"),
                    std::runtime_error);
  // Bytes above 0x7f are not letters to the theme parser
  REQUIRE(ScreenRenderer::parseTheme("RIOT") == THEME_RIOT);
  REQUIRE_THROWS_AS(ScreenRenderer::parseTheme("d\xc3\xa4rk"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(ScreenRenderer::parseTheme("\xff\xfe"), std::runtime_error);

  Palette none = ScreenRenderer::paletteFor(THEME_NONE);
  REQUIRE(none.error.empty());
  REQUIRE(none.statusBar.empty());
  REQUIRE(!ScreenRenderer::paletteFor(THEME_RIOT).error.empty());
}

TEST_CASE("Width fitting counts characters", "[ScreenRenderer]") {
  REQUIRE(ScreenRenderer::fitToWidth("abcdef", 3) == "abc");
  REQUIRE(ScreenRenderer::fitToWidth("ab", 3) == "ab");
  REQUIRE(ScreenRenderer::fitToWidth("\xc3\xbc\xc3\xbc\xc3\xbc", 2) ==
          "\xc3\xbc\xc3\xbc");
  REQUIRE(ScreenRenderer::fitToWidth("abc", 0) == "");
}

TEST_CASE("Status line", "[ScreenRenderer]") {
  ScreenModel model;
  model.device = "/dev/ttyACM0";
  REQUIRE(ScreenRenderer::statusText(model) ==
          " slipterm | /dev/ttyACM0 (disconnected) ");

  model.connected = true;
  model.board = "native";
  model.version = "2023.10";
  model.address = "fe80::1";
  model.outstanding = 2;
  REQUIRE(ScreenRenderer::statusText(model) ==
          " slipterm | /dev/ttyACM0 | native 2023.10 | fe80::1 | 2 pending ");
}

TEST_CASE("Rendering a frame", "[ScreenRenderer]") {
  TerminalLog log;
  log.append(LineKind::DIAGNOSTIC, "boot ok");
  log.append(LineKind::REQUEST, "GET /riot/board");
  log.append(LineKind::ERROR, "timed out");

  ScreenModel model;
  model.device = "/dev/ttyUSB0";
  model.connected = true;
  model.log = &log;
  model.input = "ps";
  model.cursorColumn = 2;

  SECTION("Combined view shows every line and places the cursor") {
    string frame = ScreenRenderer::render(model, makeInfo(10, 80), THEME_NONE);
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[2;1Hboot ok"));
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[3;1HGET /riot/board"));
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[4;1Htimed out"));
    REQUIRE_THAT(frame, ContainsSubstring("F1 Combined"));
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[10;1H> ps"));
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[10;5H"));
  }

  SECTION("Diagnostic view with an unterminated shell line") {
    model.view = VIEW_DIAGNOSTIC;
    model.pendingShellLine = "> ";
    string frame = ScreenRenderer::render(model, makeInfo(10, 80), THEME_NONE);
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[2;1Hboot ok"));
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[3;1H> "));
    REQUIRE(frame.find("GET /riot/board") == string::npos);
  }

  SECTION("Only the newest lines fit") {
    string frame = ScreenRenderer::render(model, makeInfo(4, 80), THEME_NONE);
    REQUIRE(frame.find("boot ok") == string::npos);
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[2;1HGET /riot/board"));
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[3;1Htimed out"));
  }

  SECTION("Long input scrolls to keep the cursor visible") {
    model.input = "abcdefghij";
    model.cursorColumn = 10;
    string frame = ScreenRenderer::render(model, makeInfo(10, 8), THEME_NONE);
    // Six columns are left after the prompt, the cursor needs one of them
    REQUIRE_THAT(frame, ContainsSubstring("> fghij"));
    REQUIRE_THAT(frame, ContainsSubstring("\x1b[10;8H"));
  }

  SECTION("Styled lines are reset") {
    string frame = ScreenRenderer::render(model, makeInfo(10, 80), THEME_RIOT);
    Palette palette = ScreenRenderer::paletteFor(THEME_RIOT);
    REQUIRE_THAT(frame,
                 ContainsSubstring(palette.error + "timed out\x1b[0m"));
  }
}
