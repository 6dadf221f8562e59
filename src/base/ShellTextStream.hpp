#ifndef __ST_SHELL_TEXT_STREAM__
#define __ST_SHELL_TEXT_STREAM__

#include "Headers.hpp"

namespace st {
/**
 * @brief Turns the Diagnostic-Text byte stream of the device into lines.
 *
 * Input is decoded as UTF-8 on a best-effort basis: invalid sequences become
 * U+FFFD and never fail.  Carriage returns are dropped, tabs are expanded to
 * the next multiple of TAB_WIDTH columns.  A multi-byte sequence may be split
 * across calls to append().
 */
class ShellTextStream {
 public:
  static constexpr int TAB_WIDTH = 8;
  static const char* REPLACEMENT_CHARACTER;

  ShellTextStream() : column(0), expectedContinuation(0) {}

  void append(const string& bytes);

  /** @brief Completed lines since the last call, in order. */
  vector<string> takeLines();

  /**
   * @brief Terminates the partial line, if any, so it shows up in
   * takeLines().
   */
  void flush();

  /** @brief The line the device has started but not yet terminated. */
  const string& pending() const { return partialLine; }

  bool hasLines() const { return !lines.empty(); }

 protected:
  void appendByte(uint8_t b);
  void appendCodepoint(const string& utf8);
  void abandonSequence();

  deque<string> lines;
  string partialLine;
  int column;
  // Bytes of an unfinished multi-byte sequence
  string sequence;
  int expectedContinuation;
};
}  // namespace st

#endif  // __ST_SHELL_TEXT_STREAM__
