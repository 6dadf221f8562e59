#ifndef __ST_KEY_DECODER__
#define __ST_KEY_DECODER__

#include "Headers.hpp"

namespace st {
enum class KeyType {
  CHAR,
  ENTER,
  BACKSPACE,
  TAB,
  UP,
  DOWN,
  LEFT,
  RIGHT,
  F1,
  F2,
  F3,
  CTRL_C,
  CTRL_D,
  UNKNOWN
};

/**
 * @brief One key press.  For CHAR, @c text holds the UTF-8 bytes of the
 * character.
 */
struct KeyEvent {
  KeyType type;
  string text;

  KeyEvent() : type(KeyType::UNKNOWN) {}
  explicit KeyEvent(KeyType _type, const string& _text = "")
      : type(_type), text(_text) {}

  bool operator==(const KeyEvent& other) const {
    return type == other.type && text == other.text;
  }
};

/**
 * @brief Turns raw console bytes into key events.  CSI and SS3 escape
 * sequences and multi-byte characters may be split across reads.
 */
class KeyDecoder {
 public:
  KeyDecoder() {}

  vector<KeyEvent> decode(const string& bytes);

  /** @brief Bytes held back waiting for the rest of a sequence. */
  const string& getPending() const { return pending; }

  /**
   * @brief Gives up on a held back sequence, e.g. a lone ESC key press once
   * the tick passes without more input.
   */
  vector<KeyEvent> flush();

 protected:
  /**
   * @brief Tries to decode one event at the front of @p buf.
   * @return Bytes consumed, 0 if more input is needed.
   */
  size_t decodeOne(const string& buf, KeyEvent* event);
  size_t decodeEscape(const string& buf, KeyEvent* event);

  string pending;
};
}  // namespace st

#endif  // __ST_KEY_DECODER__
