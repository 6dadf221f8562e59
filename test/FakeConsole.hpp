#ifndef __ST_FAKE_CONSOLE_HPP__
#define __ST_FAKE_CONSOLE_HPP__

#include "Console.hpp"

namespace st {
/**
 * @brief Console backed by a socketpair.  The test side simulates
 * keystrokes and reads what the client drew.
 */
class FakeConsole : public Console {
 public:
  FakeConsole() : setupCount(0), teardownCount(0) {
    int fds[2];
    FATAL_FAIL(socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    clientFd = fds[0];
    testFd = fds[1];
    for (int fd : fds) {
      int opts = fcntl(fd, F_GETFL);
      FATAL_FAIL(opts);
      FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
    }
    fakeTerminalInfo.set_row(24);
    fakeTerminalInfo.set_column(80);
  }

  virtual ~FakeConsole() {
    ::close(clientFd);
    ::close(testFd);
  }

  virtual void setup() { setupCount++; }

  virtual void teardown() { teardownCount++; }

  virtual TerminalInfo getTerminalInfo() { return fakeTerminalInfo; }

  virtual int getFd() { return clientFd; }

  void resize(int rows, int columns) {
    fakeTerminalInfo.set_row(rows);
    fakeTerminalInfo.set_column(columns);
  }

  void simulateKeystrokes(const string& s) {
    RawSocketUtils::writeAll(testFd, s.c_str(), s.length());
  }

  /** @brief Everything drawn since the last call. */
  string getTerminalData() {
    string all;
    string chunk;
    while (RawSocketUtils::readAvailable(testFd, &chunk) && !chunk.empty()) {
      all += chunk;
    }
    return all;
  }

  int setupCount;
  int teardownCount;

 protected:
  TerminalInfo fakeTerminalInfo;
  int clientFd;
  int testFd;
};
}  // namespace st

#endif  // __ST_FAKE_CONSOLE_HPP__
