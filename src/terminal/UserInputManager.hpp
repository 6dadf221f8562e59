#ifndef __ST_USER_INPUT_MANAGER__
#define __ST_USER_INPUT_MANAGER__

#include "CommandLibrary.hpp"
#include "Headers.hpp"

namespace st {
/**
 * @brief The line the user is editing, with cursor, history and completion.
 *
 * The cursor is a byte offset that always sits on a UTF-8 character
 * boundary.
 */
class UserInputManager {
 public:
  explicit UserInputManager(const CommandLibrary* _library)
      : library(_library), cursor(0), historyIndex(0) {}

  /** @brief Inserts @p text at the cursor. */
  void insert(const string& text);
  /** @brief Deletes the character before the cursor. */
  void backspace();
  void moveLeft();
  void moveRight();
  /** @brief Replaces the line with the previous history entry. */
  void historyUp();
  /** @brief Walks back towards the line that was being edited. */
  void historyDown();

  /**
   * @brief Completes the line to the longest common command prefix.
   * @return The candidates when the completion is ambiguous.
   */
  vector<string> complete();

  /**
   * @brief Returns the finished line and starts a new one.  The line is
   * recorded in history unless it is empty or repeats the last entry.
   */
  string submit();

  void clear();

  const string& getBuffer() const { return buffer; }
  size_t getCursor() const { return cursor; }
  /** @brief Characters (not bytes) before the cursor. */
  size_t getCursorColumn() const;
  const vector<string>& getHistory() const { return history; }

 protected:
  void replaceBuffer(const string& s);

  const CommandLibrary* library;
  string buffer;
  size_t cursor;
  vector<string> history;
  // history.size() while editing a fresh line
  size_t historyIndex;
  string draft;
};
}  // namespace st

#endif  // __ST_USER_INPUT_MANAGER__
