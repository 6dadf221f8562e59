#ifndef __ST_SERIAL_HANDLER__
#define __ST_SERIAL_HANDLER__

#include "Headers.hpp"
#include "WriteBuffer.hpp"

namespace st {
/**
 * @brief Abstract duplex byte channel to the device.
 */
class SerialHandler {
 public:
  virtual ~SerialHandler() {}

  /** @brief Descriptor to wait on for incoming bytes, -1 once closed. */
  virtual int getFd() = 0;
  /** @brief Reads up to count bytes, same contract as ::read. */
  virtual ssize_t read(void* buf, size_t count) = 0;
  /** @brief Writes up to count bytes, same contract as ::write. */
  virtual ssize_t write(const void* buf, size_t count) = 0;
  virtual void close() = 0;
  /** @brief Human readable name of the link, e.g. the device path. */
  virtual string getName() = 0;

  /**
   * @brief Reads the bytes that are ready without blocking.
   * @throws std::runtime_error on EOF or a read error.
   */
  string readAvailable();

  /**
   * @brief Writes as much of @p buffer as the link accepts right now.
   * @return Bytes written.
   * @throws std::runtime_error on a write error.
   */
  size_t flush(WriteBuffer* buffer);

  /**
   * @brief Writes all of @p data, retrying until the link takes it.
   * @throws std::runtime_error on a write error.
   */
  void writeAllOrThrow(const string& data);
};
}  // namespace st

#endif  // __ST_SERIAL_HANDLER__
