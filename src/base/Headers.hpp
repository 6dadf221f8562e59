#ifndef __ST_HEADERS__
#define __ST_HEADERS__


#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <paths.h>
#include <signal.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "SlipTerm.pb.h"
#include "easylogging++.h"

#include "ust.hpp"

using namespace std;

// Monotonic clock used for exchange deadlines and loop ticks
typedef std::chrono::steady_clock SteadyClock;

// Default time a structured request may stay unanswered
const int DEFAULT_EXCHANGE_TIMEOUT_MS = 5000;

// Default period of the interactive loop tick
const int DEFAULT_TICK_MS = 100;

// Default serial line speed used by RIOT stdio_uart
const int DEFAULT_BAUD_RATE = 115200;

// Largest frame the decoder buffers before declaring it corrupt
const size_t DEFAULT_MAX_FRAME_SIZE = 10240;

// Lines of output kept for scrolling back
const size_t DEFAULT_SCROLLBACK = 5000;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef ST_VERSION
#define ST_VERSION "unknown"
#endif

namespace st {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // In case 'to' contains 'from', like replacing
                               // 'x' with 'yx'
  }
  return retval;
}

inline string toHex(const string &bytes) {
  static const char digits[] = "0123456789abcdef";
  string s;
  s.reserve(bytes.size() * 3);
  for (size_t a = 0; a < bytes.size(); a++) {
    if (a) {
      s += ' ';
    }
    uint8_t b = uint8_t(bytes[a]);
    s += digits[b >> 4];
    s += digits[b & 0x0f];
  }
  return s;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  LOG(WARNING) << "Interrupted by signal " << signum;
  CLOG(INFO, "stdout") << endl << "Interrupted, leaving slipterm." << endl;
  ::exit(signum);
}
}  // namespace st

// Compares generated messages by content, e.g. two TerminalInfo snapshots
inline bool operator!=(const google::protobuf::MessageLite &msg_a,
                       const google::protobuf::MessageLite &msg_b) {
  return (msg_a.GetTypeName() != msg_b.GetTypeName()) ||
         (msg_a.SerializeAsString() != msg_b.SerializeAsString());
}

#endif
