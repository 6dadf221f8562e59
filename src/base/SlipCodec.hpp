#ifndef __ST_SLIP_CODEC__
#define __ST_SLIP_CODEC__

#include "Headers.hpp"

namespace st {
/** @brief SLIP frame delimiter. */
const uint8_t SLIP_END = 0xC0;
/** @brief Introduces an escaped END or ESC inside a frame. */
const uint8_t SLIP_ESC = 0xDB;
/** @brief ESC + ESC_END stands for a literal END byte. */
const uint8_t SLIP_ESC_END = 0xDC;
/** @brief ESC + ESC_ESC stands for a literal ESC byte. */
const uint8_t SLIP_ESC_ESC = 0xDD;

/**
 * @brief Serializes frames into the escaped SLIP byte stream.
 */
class SlipEncoder {
 public:
  /**
   * @brief Escapes END/ESC bytes in @p frame and wraps it in END delimiters.
   */
  static string encode(const string& frame);
};

/**
 * @brief Incremental SLIP deframer fed straight from the serial reads.
 *
 * Partial frames stay inside the decoder between calls.  A malformed escape
 * or an oversized frame drops the partial frame and puts the decoder into
 * resync, where everything up to the next END is discarded.
 */
class SlipDecoder {
 public:
  explicit SlipDecoder(size_t _maxFrameSize = DEFAULT_MAX_FRAME_SIZE);

  /**
   * @brief Consumes one byte.
   * @param frame Receives the frame when this byte completes one.
   * @return true when @p frame was filled.
   */
  bool decode(uint8_t b, string* frame);

  /**
   * @brief Consumes a chunk of bytes and returns every frame it completes, in
   * order.
   */
  vector<string> decode(const string& bytes);

  /**
   * @brief Forgets the in-progress frame, e.g. after the link went away.
   *
   * A dangling escape counts as corruption, so the decoder waits for a fresh
   * END before accepting data again.
   */
  void reset();

  /** @brief True while bytes are being discarded until the next END. */
  bool isResyncing() const { return state == State::RESYNC; }

  /** @brief Number of frames dropped because of corruption or overflow. */
  int64_t getCorruptFrameCount() const { return corruptFrameCount; }

  /** @brief Number of bytes currently buffered for an incomplete frame. */
  size_t getBufferedSize() const { return partialFrame.size(); }

 protected:
  enum class State { COLLECTING, ESCAPED, RESYNC };

  void dropFrame(const char* reason);

  size_t maxFrameSize;
  State state;
  string partialFrame;
  int64_t corruptFrameCount;
};
}  // namespace st

#endif  // __ST_SLIP_CODEC__
