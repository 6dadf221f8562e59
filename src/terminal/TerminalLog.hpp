#ifndef __ST_TERMINAL_LOG__
#define __ST_TERMINAL_LOG__

#include "Headers.hpp"

namespace st {
enum class LineKind { DIAGNOSTIC, REQUEST, RESPONSE, NOTICE, ERROR };

const char* lineKindName(LineKind kind);

struct TerminalLine {
  LineKind kind;
  string text;

  TerminalLine() : kind(LineKind::NOTICE) {}
  TerminalLine(LineKind _kind, const string& _text)
      : kind(_kind), text(_text) {}
};

/**
 * @brief Append-only scrollback of everything shown in the session.  Once
 * the limit is reached the oldest lines are dropped.
 */
class TerminalLog {
 public:
  explicit TerminalLog(size_t _scrollback = DEFAULT_SCROLLBACK)
      : scrollback(_scrollback), droppedCount(0) {}

  void append(LineKind kind, const string& text);

  /** @brief Whether lines of @p kind show up in @p view. */
  static bool isVisible(LineKind kind, SessionView view);

  /** @brief The last @p count lines visible in @p view, oldest first. */
  vector<TerminalLine> tail(SessionView view, size_t count) const;

  /**
   * @brief Lines appended since @p cursor, which is advanced past them.
   * Start with a cursor of 0.
   */
  vector<TerminalLine> since(int64_t* cursor) const;

  const deque<TerminalLine>& getLines() const { return lines; }
  size_t size() const { return lines.size(); }
  /** @brief Lines ever appended, including dropped ones. */
  int64_t getTotalCount() const { return droppedCount + int64_t(lines.size()); }
  int64_t getDroppedCount() const { return droppedCount; }
  size_t getScrollback() const { return scrollback; }

 protected:
  size_t scrollback;
  deque<TerminalLine> lines;
  int64_t droppedCount;
};
}  // namespace st

#endif  // __ST_TERMINAL_LOG__
