#ifndef __ST_TTY_SERIAL_HANDLER__
#define __ST_TTY_SERIAL_HANDLER__

#include "SerialHandler.hpp"

namespace st {
/**
 * @brief Serial link over a character device in raw 8N1 mode, or over a
 * UNIX domain socket when the path names one (e.g. a native RIOT instance
 * behind socat).
 */
class TtySerialHandler : public SerialHandler {
 public:
  /** @throws std::runtime_error if the path cannot be opened. */
  TtySerialHandler(const string& _path, int baudRate);
  virtual ~TtySerialHandler();

  virtual int getFd() { return fd; }
  virtual ssize_t read(void* buf, size_t count);
  virtual ssize_t write(const void* buf, size_t count);
  virtual void close();
  virtual string getName() { return path; }

  bool isSocket() const { return socket; }

  /**
   * @brief Maps a numeric baud rate to its termios constant.
   * @throws std::runtime_error for rates termios does not support.
   */
  static speed_t speedForBaud(int baudRate);

 protected:
  void openTty(int baudRate);
  void connectSocket();

  string path;
  int fd;
  bool socket;
  bool restoreTermios;
  termios termiosBackup;
};
}  // namespace st

#endif  // __ST_TTY_SERIAL_HANDLER__
