#ifndef __ST_SLIPTERM_CLIENT__
#define __ST_SLIPTERM_CLIENT__

#include "Console.hpp"
#include "Headers.hpp"
#include "SerialHandler.hpp"
#include "SlipTermSession.hpp"
#include "WriteBuffer.hpp"

namespace st {
/**
 * @brief The event loop: waits on the serial link, the console and the tick
 * and hands exactly one ready event per iteration to the session.
 */
class SlipTermClient {
 public:
  /**
   * @param _console nullptr for headless mode, where lines are read from
   * @p _inputFd and the log is printed to stdout.
   */
  SlipTermClient(shared_ptr<SerialHandler> _serialHandler,
                 shared_ptr<Console> _console,
                 shared_ptr<SlipTermSession> _session,
                 const SlipTermConfig& config, int _inputFd = STDIN_FILENO);
  virtual ~SlipTermClient() {}

  /** @brief Runs until the user quits or the link fails. */
  void run();

  /**
   * @brief Waits at most @p maxWait and processes one event.
   * @return false once the session is over.
   */
  bool runOnce(std::chrono::milliseconds maxWait);

  /** @brief Ends run() at the next iteration. */
  void shutdown() { shuttingDown = true; }

  const WriteBuffer& getWriteBuffer() const { return writeBuffer; }

 protected:
  void start();
  void finish();
  void flushOutgoing();
  void render(bool force);
  void printNewLines();

  shared_ptr<SerialHandler> serialHandler;
  shared_ptr<Console> console;
  shared_ptr<SlipTermSession> session;
  int inputFd;
  std::chrono::milliseconds tickInterval;
  ColorTheme theme;
  WriteBuffer writeBuffer;
  SteadyClock::time_point nextTick;
  TerminalInfo lastTerminalInfo;
  int64_t printedLines;
  bool started;
  bool shuttingDown;
};
}  // namespace st

#endif  // __ST_SLIPTERM_CLIENT__
