#include "RawSocketUtils.hpp"

namespace st {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // The console drains quickly, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      STERROR << "Cannot write to descriptor " << fd << ": "
              << strerror(localErrno);
      throw std::runtime_error("Cannot write to descriptor");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to descriptor: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawSocketUtils::readAvailable(int fd, string* out, size_t maxCount) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAvailable");
  }
  out->clear();
  string buf(maxCount, '\0');
  ssize_t rc = ::read(fd, &buf[0], maxCount);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return true;
    }
    throw std::runtime_error(string("Read failed: ") + strerror(localErrno));
  }
  if (rc == 0) {
    return false;
  }
  out->assign(buf.data(), rc);
  return true;
}
}  // namespace st
