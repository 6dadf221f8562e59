#ifndef __ST_RAW_SOCKET_UTILS__
#define __ST_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace st {
/**
 * @brief Thin wrappers around POSIX read/write loops on raw descriptors.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   * @throws std::runtime_error if the descriptor fails or closes.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads whatever the descriptor has ready, up to @p maxCount bytes.
   * @return false on EOF.  An empty @p out with a true return means the read
   * would have blocked.
   * @throws std::runtime_error on a read error.
   */
  static bool readAvailable(int fd, string* out, size_t maxCount = 4096);
};
}  // namespace st
#endif  // __ST_RAW_SOCKET_UTILS__
