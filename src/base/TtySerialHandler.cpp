#include "TtySerialHandler.hpp"

namespace st {
TtySerialHandler::TtySerialHandler(const string& _path, int baudRate)
    : path(_path), fd(-1), socket(false), restoreTermios(false) {
  struct stat fileInfo;
  if (::stat(path.c_str(), &fileInfo) == -1) {
    throw std::runtime_error("Cannot open " + path + ": " +
                             strerror(GetErrno()));
  }
  if (S_ISSOCK(fileInfo.st_mode)) {
    connectSocket();
  } else {
    openTty(baudRate);
  }
  LOG(INFO) << "Opened serial link " << path << " (fd " << fd << ")";
}

TtySerialHandler::~TtySerialHandler() { close(); }

ssize_t TtySerialHandler::read(void* buf, size_t count) {
  return ::read(fd, buf, count);
}

ssize_t TtySerialHandler::write(const void* buf, size_t count) {
  return ::write(fd, buf, count);
}

void TtySerialHandler::close() {
  if (fd == -1) {
    return;
  }
  if (restoreTermios) {
    tcsetattr(fd, TCSANOW, &termiosBackup);
    restoreTermios = false;
  }
  FATAL_FAIL(::close(fd));
  LOG(INFO) << "Closed serial link " << path;
  fd = -1;
}

speed_t TtySerialHandler::speedForBaud(int baudRate) {
  switch (baudRate) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
#ifdef B460800
    case 460800:
      return B460800;
#endif
#ifdef B921600
    case 921600:
      return B921600;
#endif
  }
  throw std::runtime_error("Unsupported baud rate: " + to_string(baudRate));
}

void TtySerialHandler::openTty(int baudRate) {
  speed_t speed = speedForBaud(baudRate);
  fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd == -1) {
    throw std::runtime_error("Cannot open " + path + ": " +
                             strerror(GetErrno()));
  }
  if (!isatty(fd)) {
    // A fifo or regular file is fine, there is just nothing to configure
    LOG(WARNING) << path << " is not a terminal, skipping line setup";
    return;
  }

  termios tio;
  if (tcgetattr(fd, &tio) == -1) {
    auto localErrno = GetErrno();
    ::close(fd);
    fd = -1;
    throw std::runtime_error("Cannot read line settings of " + path + ": " +
                             strerror(localErrno));
  }
  memcpy(&termiosBackup, &tio, sizeof(termios));

  // 8N1, no flow control
  cfmakeraw(&tio);
  tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
  tio.c_cflag |= CS8 | CLOCAL | CREAD;
#ifdef CRTSCTS
  tio.c_cflag &= ~CRTSCTS;
#endif
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);
  if (tcsetattr(fd, TCSANOW, &tio) == -1) {
    auto localErrno = GetErrno();
    ::close(fd);
    fd = -1;
    throw std::runtime_error("Cannot configure " + path + ": " +
                             strerror(localErrno));
  }
  restoreTermios = true;
  tcflush(fd, TCIOFLUSH);
  VLOG(1) << "Configured " << path << " for " << baudRate << " baud 8N1";
}

void TtySerialHandler::connectSocket() {
  sockaddr_un remote;
  if (path.size() >= sizeof(remote.sun_path)) {
    throw std::runtime_error("Socket path too long: " + path);
  }
  fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  memset(&remote, 0, sizeof(remote));
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, path.c_str(), sizeof(remote.sun_path) - 1);
  if (::connect(fd, (struct sockaddr*)&remote, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    ::close(fd);
    fd = -1;
    throw std::runtime_error("Cannot connect to " + path + ": " +
                             strerror(localErrno));
  }
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
  socket = true;
}
}  // namespace st
