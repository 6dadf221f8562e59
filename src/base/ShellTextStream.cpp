#include "ShellTextStream.hpp"

namespace st {
const char* ShellTextStream::REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

void ShellTextStream::append(const string& bytes) {
  for (char c : bytes) {
    appendByte(uint8_t(c));
  }
}

vector<string> ShellTextStream::takeLines() {
  vector<string> retval(lines.begin(), lines.end());
  lines.clear();
  return retval;
}

void ShellTextStream::flush() {
  if (!sequence.empty()) {
    abandonSequence();
  }
  if (!partialLine.empty()) {
    lines.push_back(partialLine);
    partialLine.clear();
  }
  column = 0;
}

void ShellTextStream::appendByte(uint8_t b) {
  if (expectedContinuation > 0) {
    if ((b & 0xC0) == 0x80) {
      sequence.push_back(char(b));
      expectedContinuation--;
      if (expectedContinuation == 0) {
        // Reject overlong forms and surrogates
        uint8_t lead = uint8_t(sequence[0]);
        uint8_t second = uint8_t(sequence[1]);
        bool valid = true;
        if (lead == 0xE0 && second < 0xA0) valid = false;
        if (lead == 0xED && second > 0x9F) valid = false;
        if (lead == 0xF0 && second < 0x90) valid = false;
        if (lead == 0xF4 && second > 0x8F) valid = false;
        if (valid) {
          appendCodepoint(sequence);
        } else {
          appendCodepoint(REPLACEMENT_CHARACTER);
        }
        sequence.clear();
      }
      return;
    }
    // Truncated sequence, the current byte starts over
    abandonSequence();
  }

  if (b < 0x80) {
    switch (b) {
      case '\r':
        return;
      case '\n':
        lines.push_back(partialLine);
        partialLine.clear();
        column = 0;
        return;
      case '\t': {
        int spaces = TAB_WIDTH - (column % TAB_WIDTH);
        partialLine.append(spaces, ' ');
        column += spaces;
        return;
      }
      default:
        appendCodepoint(string(1, char(b)));
        return;
    }
  }

  if (b >= 0xC2 && b <= 0xDF) {
    expectedContinuation = 1;
  } else if (b >= 0xE0 && b <= 0xEF) {
    expectedContinuation = 2;
  } else if (b >= 0xF0 && b <= 0xF4) {
    expectedContinuation = 3;
  } else {
    // Stray continuation byte or a lead byte that can never be valid
    appendCodepoint(REPLACEMENT_CHARACTER);
    return;
  }
  sequence = string(1, char(b));
}

void ShellTextStream::appendCodepoint(const string& utf8) {
  partialLine.append(utf8);
  column++;
}

void ShellTextStream::abandonSequence() {
  VLOG(2) << "Invalid UTF-8 sequence from device: " << toHex(sequence);
  sequence.clear();
  expectedContinuation = 0;
  appendCodepoint(REPLACEMENT_CHARACTER);
}
}  // namespace st
