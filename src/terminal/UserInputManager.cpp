#include "UserInputManager.hpp"

namespace st {
namespace {
bool isContinuation(char c) { return (uint8_t(c) & 0xC0) == 0x80; }
}  // namespace

void UserInputManager::insert(const string& text) {
  buffer.insert(cursor, text);
  cursor += text.size();
}

void UserInputManager::backspace() {
  if (cursor == 0) {
    return;
  }
  size_t start = cursor - 1;
  while (start > 0 && isContinuation(buffer[start])) {
    start--;
  }
  buffer.erase(start, cursor - start);
  cursor = start;
}

void UserInputManager::moveLeft() {
  if (cursor == 0) {
    return;
  }
  cursor--;
  while (cursor > 0 && isContinuation(buffer[cursor])) {
    cursor--;
  }
}

void UserInputManager::moveRight() {
  if (cursor >= buffer.size()) {
    return;
  }
  cursor++;
  while (cursor < buffer.size() && isContinuation(buffer[cursor])) {
    cursor++;
  }
}

void UserInputManager::historyUp() {
  if (historyIndex == 0) {
    return;
  }
  if (historyIndex == history.size()) {
    draft = buffer;
  }
  historyIndex--;
  replaceBuffer(history[historyIndex]);
}

void UserInputManager::historyDown() {
  if (historyIndex >= history.size()) {
    return;
  }
  historyIndex++;
  if (historyIndex == history.size()) {
    replaceBuffer(draft);
  } else {
    replaceBuffer(history[historyIndex]);
  }
}

vector<string> UserInputManager::complete() {
  vector<const Command*> matches;
  string completed = library->longestCommonPrefix(buffer, &matches);
  if (completed.size() > buffer.size()) {
    replaceBuffer(completed);
  }
  vector<string> candidates;
  if (matches.size() > 1) {
    for (const auto* command : matches) {
      candidates.push_back(command->name);
    }
  }
  return candidates;
}

string UserInputManager::submit() {
  string line = buffer;
  if (!line.empty() && (history.empty() || history.back() != line)) {
    history.push_back(line);
  }
  clear();
  return line;
}

void UserInputManager::clear() {
  buffer.clear();
  cursor = 0;
  draft.clear();
  historyIndex = history.size();
}

size_t UserInputManager::getCursorColumn() const {
  size_t column = 0;
  for (size_t a = 0; a < cursor; a++) {
    if (!isContinuation(buffer[a])) {
      column++;
    }
  }
  return column;
}

void UserInputManager::replaceBuffer(const string& s) {
  buffer = s;
  cursor = buffer.size();
}
}  // namespace st
