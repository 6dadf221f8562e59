#ifndef __ST_SCREEN_RENDERER__
#define __ST_SCREEN_RENDERER__

#include "Headers.hpp"
#include "TerminalLog.hpp"

namespace st {
/**
 * @brief Everything the screen shows, snapshotted from the session.
 */
struct ScreenModel {
  string device;
  bool connected;
  string board;
  string version;
  string address;
  size_t outstanding;
  SessionView view;
  const TerminalLog* log;
  /** @brief Shell output the device has not terminated yet. */
  string pendingShellLine;
  string input;
  size_t cursorColumn;

  ScreenModel()
      : connected(false),
        outstanding(0),
        view(VIEW_COMBINED),
        log(nullptr),
        cursorColumn(0) {}
};

/**
 * @brief SGR sequences for each screen element.  Empty strings mean no
 * styling.
 */
struct Palette {
  string statusBar;
  string activeTab;
  string diagnostic;
  string request;
  string response;
  string notice;
  string error;
  string prompt;
};

/**
 * @brief Draws full-screen ANSI frames.  Every frame repaints the whole
 * screen, so a resize needs no special handling.
 */
class ScreenRenderer {
 public:
  static const char* PROMPT;

  static Palette paletteFor(ColorTheme theme);

  /**
   * @brief Parses a theme name (none, dark, light, riot).
   * @throws std::runtime_error for an unknown name.
   */
  static ColorTheme parseTheme(const string& name);
  static string themeName(ColorTheme theme);

  /** @brief Escape sequences that switch to and from the alternate screen. */
  static string enterScreen();
  static string leaveScreen();

  static string render(const ScreenModel& model, const TerminalInfo& info,
                       ColorTheme theme);

  /** @brief Truncates UTF-8 @p s to at most @p columns characters. */
  static string fitToWidth(const string& s, size_t columns);

  /** @brief The status line text, without styling. */
  static string statusText(const ScreenModel& model);

 protected:
  static const string& styleFor(const Palette& palette, LineKind kind);
};
}  // namespace st

#endif  // __ST_SCREEN_RENDERER__
