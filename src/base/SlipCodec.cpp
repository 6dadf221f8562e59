#include "SlipCodec.hpp"

namespace st {
string SlipEncoder::encode(const string& frame) {
  string s;
  // Worst case every byte is escaped
  s.reserve(frame.size() * 2 + 2);
  s += char(SLIP_END);
  for (char c : frame) {
    uint8_t b = uint8_t(c);
    if (b == SLIP_END) {
      s += char(SLIP_ESC);
      s += char(SLIP_ESC_END);
    } else if (b == SLIP_ESC) {
      s += char(SLIP_ESC);
      s += char(SLIP_ESC_ESC);
    } else {
      s += c;
    }
  }
  s += char(SLIP_END);
  return s;
}

SlipDecoder::SlipDecoder(size_t _maxFrameSize)
    : maxFrameSize(_maxFrameSize),
      state(State::COLLECTING),
      corruptFrameCount(0) {}

bool SlipDecoder::decode(uint8_t b, string* frame) {
  switch (state) {
    case State::RESYNC:
      if (b == SLIP_END) {
        VLOG(2) << "SLIP decoder resynchronized";
        state = State::COLLECTING;
      }
      return false;

    case State::ESCAPED:
      if (b == SLIP_ESC_END) {
        partialFrame += char(SLIP_END);
      } else if (b == SLIP_ESC_ESC) {
        partialFrame += char(SLIP_ESC);
      } else if (b == SLIP_END) {
        // The delimiter already ends the broken frame, no resync needed
        dropFrame("END after ESC");
        state = State::COLLECTING;
        return false;
      } else {
        dropFrame("invalid escape");
        return false;
      }
      state = State::COLLECTING;
      break;

    case State::COLLECTING:
      if (b == SLIP_END) {
        if (partialFrame.empty()) {
          // Back-to-back delimiters separate frames, nothing to deliver
          return false;
        }
        frame->swap(partialFrame);
        partialFrame.clear();
        VLOG(3) << "SLIP frame complete: " << frame->size() << " bytes";
        return true;
      }
      if (b == SLIP_ESC) {
        state = State::ESCAPED;
        return false;
      }
      partialFrame += char(b);
      break;
  }

  if (partialFrame.size() > maxFrameSize) {
    dropFrame("frame exceeds maximum size");
  }
  return false;
}

vector<string> SlipDecoder::decode(const string& bytes) {
  vector<string> frames;
  string frame;
  for (char c : bytes) {
    if (decode(uint8_t(c), &frame)) {
      frames.push_back(frame);
      frame.clear();
    }
  }
  return frames;
}

void SlipDecoder::reset() {
  if (state == State::ESCAPED) {
    dropFrame("escape at end of stream");
    return;
  }
  partialFrame.clear();
  if (state != State::RESYNC) {
    state = State::COLLECTING;
  }
}

void SlipDecoder::dropFrame(const char* reason) {
  LOG(WARNING) << "Dropping corrupt SLIP frame (" << reason << ") after "
               << partialFrame.size() << " bytes";
  corruptFrameCount++;
  partialFrame.clear();
  state = State::RESYNC;
}
}  // namespace st
