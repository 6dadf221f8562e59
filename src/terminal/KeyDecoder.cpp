#include "KeyDecoder.hpp"

namespace st {
namespace {
const char ESC = 0x1B;

size_t utf8Length(uint8_t lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}
}  // namespace

vector<KeyEvent> KeyDecoder::decode(const string& bytes) {
  pending.append(bytes);
  vector<KeyEvent> events;
  size_t offset = 0;
  while (offset < pending.size()) {
    KeyEvent event;
    size_t consumed = decodeOne(pending.substr(offset), &event);
    if (consumed == 0) {
      break;
    }
    events.push_back(event);
    offset += consumed;
  }
  pending.erase(0, offset);
  return events;
}

vector<KeyEvent> KeyDecoder::flush() {
  vector<KeyEvent> events;
  if (pending.empty()) {
    return events;
  }
  VLOG(3) << "Dropping incomplete key sequence " << toHex(pending);
  events.push_back(KeyEvent(KeyType::UNKNOWN, pending));
  pending.clear();
  return events;
}

size_t KeyDecoder::decodeOne(const string& buf, KeyEvent* event) {
  uint8_t c = uint8_t(buf[0]);
  switch (c) {
    case 0x03:
      *event = KeyEvent(KeyType::CTRL_C);
      return 1;
    case 0x04:
      *event = KeyEvent(KeyType::CTRL_D);
      return 1;
    case '\t':
      *event = KeyEvent(KeyType::TAB);
      return 1;
    case '\r':
    case '\n':
      *event = KeyEvent(KeyType::ENTER);
      return 1;
    case 0x7F:
    case 0x08:
      *event = KeyEvent(KeyType::BACKSPACE);
      return 1;
    case ESC:
      return decodeEscape(buf, event);
  }
  if (c < 0x20) {
    *event = KeyEvent(KeyType::UNKNOWN, string(1, char(c)));
    return 1;
  }
  size_t length = utf8Length(c);
  if (buf.size() < length) {
    return 0;
  }
  *event = KeyEvent(KeyType::CHAR, buf.substr(0, length));
  return length;
}

size_t KeyDecoder::decodeEscape(const string& buf, KeyEvent* event) {
  if (buf.size() < 2) {
    return 0;
  }
  char introducer = buf[1];
  if (introducer == 'O') {
    // SS3: ESC O <final>
    if (buf.size() < 3) {
      return 0;
    }
    switch (buf[2]) {
      case 'A':
        *event = KeyEvent(KeyType::UP);
        break;
      case 'B':
        *event = KeyEvent(KeyType::DOWN);
        break;
      case 'C':
        *event = KeyEvent(KeyType::RIGHT);
        break;
      case 'D':
        *event = KeyEvent(KeyType::LEFT);
        break;
      case 'P':
        *event = KeyEvent(KeyType::F1);
        break;
      case 'Q':
        *event = KeyEvent(KeyType::F2);
        break;
      case 'R':
        *event = KeyEvent(KeyType::F3);
        break;
      default:
        *event = KeyEvent(KeyType::UNKNOWN, buf.substr(0, 3));
    }
    return 3;
  }
  if (introducer != '[') {
    *event = KeyEvent(KeyType::UNKNOWN, buf.substr(0, 2));
    return 2;
  }

  // CSI: ESC [ <parameters> <final byte in 0x40-0x7E>
  size_t end = 2;
  while (end < buf.size() &&
         !(uint8_t(buf[end]) >= 0x40 && uint8_t(buf[end]) <= 0x7E)) {
    end++;
  }
  if (end == buf.size()) {
    return 0;
  }
  string parameters = buf.substr(2, end - 2);
  char finalByte = buf[end];
  size_t consumed = end + 1;
  switch (finalByte) {
    case 'A':
      *event = KeyEvent(KeyType::UP);
      return consumed;
    case 'B':
      *event = KeyEvent(KeyType::DOWN);
      return consumed;
    case 'C':
      *event = KeyEvent(KeyType::RIGHT);
      return consumed;
    case 'D':
      *event = KeyEvent(KeyType::LEFT);
      return consumed;
    case '~':
      // Linux console and rxvt send F1-F3 as ESC [ 11~ .. 13~
      if (parameters == "11") {
        *event = KeyEvent(KeyType::F1);
        return consumed;
      }
      if (parameters == "12") {
        *event = KeyEvent(KeyType::F2);
        return consumed;
      }
      if (parameters == "13") {
        *event = KeyEvent(KeyType::F3);
        return consumed;
      }
      break;
    case '[':
      // ESC [ [ A .. C on the Linux console
      if (buf.size() < consumed + 1) {
        return 0;
      }
      switch (buf[consumed]) {
        case 'A':
          *event = KeyEvent(KeyType::F1);
          return consumed + 1;
        case 'B':
          *event = KeyEvent(KeyType::F2);
          return consumed + 1;
        case 'C':
          *event = KeyEvent(KeyType::F3);
          return consumed + 1;
      }
      *event = KeyEvent(KeyType::UNKNOWN, buf.substr(0, consumed + 1));
      return consumed + 1;
  }
  *event = KeyEvent(KeyType::UNKNOWN, buf.substr(0, consumed));
  return consumed;
}
}  // namespace st
