#include "ScreenRenderer.hpp"

namespace st {
namespace {
const char* RESET = "\x1b[0m";

string moveTo(int row, int column) {
  return "\x1b[" + to_string(row) + ";" + to_string(column) + "H";
}

const char* viewLabel(SessionView view) {
  switch (view) {
    case VIEW_COMBINED:
      return "F1 Combined";
    case VIEW_DIAGNOSTIC:
      return "F2 Diagnostic";
    case VIEW_STRUCTURED:
      return "F3 Structured";
  }
  return "";
}

// Only ASCII letters change, other bytes (UTF-8 included) pass through
string toLowerAscii(string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return char(std::tolower(c));
  });
  return s;
}
}  // namespace

const char* ScreenRenderer::PROMPT = "> ";

Palette ScreenRenderer::paletteFor(ColorTheme theme) {
  Palette palette;
  switch (theme) {
    case THEME_NONE:
      break;
    case THEME_DARK:
      palette.statusBar = "\x1b[97;100m";
      palette.activeTab = "\x1b[30;107m";
      palette.diagnostic = "\x1b[37m";
      palette.request = "\x1b[96m";
      palette.response = "\x1b[92m";
      palette.notice = "\x1b[93m";
      palette.error = "\x1b[91m";
      palette.prompt = "\x1b[1;97m";
      break;
    case THEME_LIGHT:
      palette.statusBar = "\x1b[30;47m";
      palette.activeTab = "\x1b[97;40m";
      palette.diagnostic = "\x1b[30m";
      palette.request = "\x1b[34m";
      palette.response = "\x1b[32m";
      palette.notice = "\x1b[35m";
      palette.error = "\x1b[31m";
      palette.prompt = "\x1b[1;30m";
      break;
    case THEME_RIOT:
      // RIOT brand colours, magenta and teal
      palette.statusBar = "\x1b[97;48;5;161m";
      palette.activeTab = "\x1b[30;48;5;37m";
      palette.diagnostic = "\x1b[39m";
      palette.request = "\x1b[38;5;37m";
      palette.response = "\x1b[38;5;161m";
      palette.notice = "\x1b[38;5;244m";
      palette.error = "\x1b[1;31m";
      palette.prompt = "\x1b[1;38;5;161m";
      break;
  }
  return palette;
}

ColorTheme ScreenRenderer::parseTheme(const string& name) {
  string lowered = toLowerAscii(name);
  for (int a = ColorTheme_MIN; a <= ColorTheme_MAX; a++) {
    if (ColorTheme_IsValid(a) && themeName(ColorTheme(a)) == lowered) {
      return ColorTheme(a);
    }
  }
  throw std::runtime_error("Unknown color theme: " + name);
}

string ScreenRenderer::themeName(ColorTheme theme) {
  // THEME_DARK -> dark
  return toLowerAscii(ColorTheme_Name(theme).substr(string("THEME_").size()));
}

string ScreenRenderer::enterScreen() { return "\x1b[?1049h\x1b[2J"; }

string ScreenRenderer::leaveScreen() { return "\x1b[0m\x1b[?25h\x1b[?1049l"; }

string ScreenRenderer::fitToWidth(const string& s, size_t columns) {
  size_t characters = 0;
  for (size_t a = 0; a < s.size(); a++) {
    if ((uint8_t(s[a]) & 0xC0) != 0x80) {
      if (characters == columns) {
        return s.substr(0, a);
      }
      characters++;
    }
  }
  return s;
}

string ScreenRenderer::statusText(const ScreenModel& model) {
  std::ostringstream ss;
  ss << " slipterm | " << (model.device.empty() ? "-" : model.device);
  if (!model.connected) {
    ss << " (disconnected)";
  }
  if (!model.board.empty()) {
    ss << " | " << model.board;
    if (!model.version.empty()) {
      ss << " " << model.version;
    }
  }
  if (!model.address.empty()) {
    ss << " | " << model.address;
  }
  if (model.outstanding) {
    ss << " | " << model.outstanding << " pending";
  }
  ss << " ";
  return ss.str();
}

const string& ScreenRenderer::styleFor(const Palette& palette, LineKind kind) {
  switch (kind) {
    case LineKind::DIAGNOSTIC:
      return palette.diagnostic;
    case LineKind::REQUEST:
      return palette.request;
    case LineKind::RESPONSE:
      return palette.response;
    case LineKind::NOTICE:
      return palette.notice;
    case LineKind::ERROR:
      return palette.error;
  }
  return palette.diagnostic;
}

string ScreenRenderer::render(const ScreenModel& model,
                              const TerminalInfo& info, ColorTheme theme) {
  Palette palette = paletteFor(theme);
  int rows = max(info.row(), 1);
  size_t columns = size_t(max(info.column(), 1));
  string out = "\x1b[?25l";

  int inputRow = rows;
  if (rows >= 3) {
    // Status line with the view tabs right aligned
    string status = statusText(model);
    string tabs;
    string styledTabs;
    for (int v = SessionView_MIN; v <= SessionView_MAX; v++) {
      string label = string(" ") + viewLabel(SessionView(v)) + " ";
      tabs += label;
      if (v == model.view) {
        styledTabs += palette.activeTab + label + RESET + palette.statusBar;
      } else {
        styledTabs += label;
      }
    }
    out += moveTo(1, 1) + palette.statusBar;
    if (status.size() + tabs.size() <= columns) {
      out += status + string(columns - status.size() - tabs.size(), ' ') +
             styledTabs;
    } else {
      out += fitToWidth(status, columns);
    }
    out += RESET + string("\x1b[K");

    size_t bodyRows = size_t(rows - 2);
    vector<TerminalLine> visible;
    if (model.log) {
      visible = model.log->tail(model.view, bodyRows);
    }
    if (!model.pendingShellLine.empty() &&
        TerminalLog::isVisible(LineKind::DIAGNOSTIC, model.view)) {
      visible.push_back(
          TerminalLine(LineKind::DIAGNOSTIC, model.pendingShellLine));
      if (visible.size() > bodyRows) {
        visible.erase(visible.begin());
      }
    }
    for (size_t a = 0; a < bodyRows; a++) {
      out += moveTo(int(a) + 2, 1);
      if (a < visible.size()) {
        const string& style = styleFor(palette, visible[a].kind);
        out += style + fitToWidth(visible[a].text, columns);
        if (!style.empty()) {
          out += RESET;
        }
      }
      out += "\x1b[K";
    }
  }

  // Input line, scrolled so the cursor stays visible
  string prompt = PROMPT;
  size_t available = columns > prompt.size() ? columns - prompt.size() : 1;
  size_t skip = 0;
  if (model.cursorColumn >= available) {
    skip = model.cursorColumn - available + 1;
  }
  string input = model.input;
  size_t characters = 0;
  size_t offset = 0;
  while (offset < input.size() && characters < skip) {
    offset++;
    while (offset < input.size() && (uint8_t(input[offset]) & 0xC0) == 0x80) {
      offset++;
    }
    characters++;
  }
  out += moveTo(inputRow, 1) + palette.prompt + prompt;
  if (!palette.prompt.empty()) {
    out += RESET;
  }
  out += fitToWidth(input.substr(offset), available) + "\x1b[K";
  out += moveTo(inputRow,
                int(prompt.size() + model.cursorColumn - skip) + 1);
  out += "\x1b[?25h";
  return out;
}
}  // namespace st
