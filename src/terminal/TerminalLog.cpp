#include "TerminalLog.hpp"

namespace st {
const char* lineKindName(LineKind kind) {
  switch (kind) {
    case LineKind::DIAGNOSTIC:
      return "diagnostic";
    case LineKind::REQUEST:
      return "request";
    case LineKind::RESPONSE:
      return "response";
    case LineKind::NOTICE:
      return "notice";
    case LineKind::ERROR:
      return "error";
  }
  return "unknown";
}

void TerminalLog::append(LineKind kind, const string& text) {
  VLOG(3) << "[" << lineKindName(kind) << "] " << text;
  lines.push_back(TerminalLine(kind, text));
  while (lines.size() > scrollback) {
    lines.pop_front();
    droppedCount++;
  }
}

bool TerminalLog::isVisible(LineKind kind, SessionView view) {
  switch (view) {
    case VIEW_DIAGNOSTIC:
      return kind == LineKind::DIAGNOSTIC;
    case VIEW_STRUCTURED:
      return kind == LineKind::REQUEST || kind == LineKind::RESPONSE ||
             kind == LineKind::ERROR;
    case VIEW_COMBINED:
      return true;
  }
  return true;
}

vector<TerminalLine> TerminalLog::tail(SessionView view, size_t count) const {
  vector<TerminalLine> retval;
  for (auto it = lines.rbegin(); it != lines.rend() && retval.size() < count;
       ++it) {
    if (isVisible(it->kind, view)) {
      retval.push_back(*it);
    }
  }
  std::reverse(retval.begin(), retval.end());
  return retval;
}

vector<TerminalLine> TerminalLog::since(int64_t* cursor) const {
  vector<TerminalLine> retval;
  int64_t start = max(*cursor, droppedCount);
  for (int64_t a = start; a < getTotalCount(); a++) {
    retval.push_back(lines[a - droppedCount]);
  }
  *cursor = getTotalCount();
  return retval;
}
}  // namespace st
