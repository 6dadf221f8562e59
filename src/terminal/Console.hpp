#ifndef __ST_CONSOLE_HPP__
#define __ST_CONSOLE_HPP__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace st {
/**
 * @brief Abstract local terminal the session is drawn on.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Current size of the console in cells (and pixels if known). */
  virtual TerminalInfo getTerminalInfo() = 0;
  /** @brief Switches the console to raw mode. */
  virtual void setup() = 0;
  /** @brief Restores the console state found by setup(). */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives the rendered frames. */
  virtual int getFd() = 0;
  /** @brief Descriptor keystrokes arrive on. */
  virtual int getInputFd() { return getFd(); }

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(getFd(), &s[0], s.length());
  }
};
}  // namespace st

#endif  // __ST_CONSOLE_HPP__
