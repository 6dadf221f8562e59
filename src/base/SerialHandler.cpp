#include "SerialHandler.hpp"

namespace st {
string SerialHandler::readAvailable() {
  string buf(4096, '\0');
  ssize_t rc = read(&buf[0], buf.size());
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return "";
    }
    throw std::runtime_error("Error reading from " + getName() + ": " +
                             strerror(localErrno));
  }
  if (rc == 0) {
    throw std::runtime_error("Serial link " + getName() + " closed");
  }
  buf.resize(rc);
  VLOG(4) << "Read " << rc << " bytes from " << getName() << ": "
          << toHex(buf);
  return buf;
}

size_t SerialHandler::flush(WriteBuffer* buffer) {
  size_t total = 0;
  while (buffer->hasPendingData()) {
    size_t count;
    const char* data = buffer->peekData(&count);
    ssize_t rc = write(data, count);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        break;
      }
      throw std::runtime_error("Error writing to " + getName() + ": " +
                               strerror(localErrno));
    }
    if (rc == 0) {
      break;
    }
    VLOG(4) << "Wrote " << rc << " bytes to " << getName();
    buffer->consume(rc);
    total += rc;
  }
  return total;
}

void SerialHandler::writeAllOrThrow(const string& data) {
  size_t bytesWritten = 0;
  while (bytesWritten < data.size()) {
    ssize_t rc = write(data.data() + bytesWritten, data.size() - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      throw std::runtime_error("Error writing to " + getName() + ": " +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Serial link " + getName() + " closed");
    }
    bytesWritten += rc;
  }
}
}  // namespace st
