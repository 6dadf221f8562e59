#ifndef __ST_WRITE_BUFFER__
#define __ST_WRITE_BUFFER__

#include "Headers.hpp"

namespace st {
/**
 * @brief Bounded queue of framed bytes waiting for the serial link.
 *
 * The serial descriptor is non-blocking, so a frame may go out in several
 * writes.  Each enqueued chunk is one SLIP frame; frames are never
 * interleaved because only the front chunk is ever written.
 */
class WriteBuffer {
 public:
  /** @brief Bytes buffered before new frames are refused. */
  static constexpr size_t MAX_BUFFER_SIZE = 64 * 1024;

  WriteBuffer() : totalBytes(0), writeOffset(0), droppedFrames(0) {}

  bool canAcceptMore() const { return totalBytes < MAX_BUFFER_SIZE; }

  bool hasPendingData() const { return !pending.empty(); }

  /** @brief Bytes still to be written. */
  size_t size() const { return totalBytes; }

  /** @brief Frames not yet completely written. */
  size_t frameCount() const { return pending.size(); }

  int64_t getDroppedFrames() const { return droppedFrames; }

  /**
   * @brief Queues one frame.
   * @return false if the buffer is full and the frame was dropped.
   */
  bool enqueue(const string &frame) {
    if (frame.empty()) return true;
    if (!canAcceptMore()) {
      droppedFrames++;
      LOG(WARNING) << "Serial link is not draining, dropping "
                   << frame.size() << " byte frame";
      return false;
    }
    pending.push_back(frame);
    totalBytes += frame.size();
    return true;
  }

  /**
   * @brief Returns a pointer to the next bytes to write and the count.
   * @return nullptr if the buffer is empty.
   */
  const char *peekData(size_t *count) const {
    if (pending.empty()) {
      *count = 0;
      return nullptr;
    }
    const string &front = pending.front();
    *count = front.size() - writeOffset;
    return front.data() + writeOffset;
  }

  /** @brief Removes @p bytesWritten from the front of the buffer. */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      size_t available = pending.front().size() - writeOffset;
      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  /** @brief Everything still queued, concatenated; the buffer is emptied. */
  string drain() {
    string retval;
    retval.reserve(totalBytes);
    size_t count;
    const char *data;
    while ((data = peekData(&count)) != nullptr) {
      retval.append(data, count);
      consume(count);
    }
    return retval;
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  std::deque<string> pending;
  size_t totalBytes;
  // Offset into the front frame after a partial write
  size_t writeOffset;
  int64_t droppedFrames;
};
}  // namespace st

#endif  // __ST_WRITE_BUFFER__
