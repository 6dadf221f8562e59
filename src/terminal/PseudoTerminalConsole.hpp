#ifndef __ST_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __ST_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"

namespace st {
/**
 * @brief The controlling terminal on stdin/stdout, in raw mode while the
 * session runs.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : active(false) {
    if (tcgetattr(STDIN_FILENO, &terminal_backup) == -1) {
      throw std::runtime_error("stdin is not a terminal, try --headless");
    }
  }

  virtual ~PseudoTerminalConsole() {
    if (active) {
      teardown();
    }
  }

  virtual void setup() {
    termios terminal_local;
    FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminal_local));
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));
    active = true;
  }

  virtual void teardown() {
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
    active = false;
  }

  virtual TerminalInfo getTerminalInfo() {
    winsize win;
    TerminalInfo ti;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1) {
      // Not a terminal, fall back to the classic size
      ti.set_row(24);
      ti.set_column(80);
      return ti;
    }
    ti.set_row(win.ws_row);
    ti.set_column(win.ws_col);
    ti.set_width(win.ws_xpixel);
    ti.set_height(win.ws_ypixel);
    return ti;
  }

  virtual int getFd() { return STDOUT_FILENO; }

  virtual int getInputFd() { return STDIN_FILENO; }

 protected:
  /** @brief Backup of the terminal's `termios` state for teardown. */
  termios terminal_backup;
  bool active;
};
}  // namespace st

#endif  // __ST_PSEUDO_TERMINAL_CONSOLE_HPP__
