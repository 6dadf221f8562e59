#ifndef __ST_SLIPTERM_SESSION__
#define __ST_SLIPTERM_SESSION__

#include "ChannelDemultiplexer.hpp"
#include "CommandJob.hpp"
#include "CommandLibrary.hpp"
#include "Headers.hpp"
#include "KeyDecoder.hpp"
#include "PacketHandler.hpp"
#include "ScreenRenderer.hpp"
#include "SessionTracker.hpp"
#include "ShellTextStream.hpp"
#include "SlipCodec.hpp"
#include "SlipTermConfig.hpp"
#include "TerminalLog.hpp"
#include "UserInputManager.hpp"

namespace st {
/**
 * @brief All state of one slipterm session.
 *
 * SlipTermClient feeds it one event at a time (serial bytes, keystrokes,
 * timer ticks) and collects the framed bytes to send with takeOutgoing().
 * Nothing in here performs I/O, so every behaviour is testable without a
 * device.
 */
class SlipTermSession : public FrameConsumer {
 public:
  /** @brief Block size requested for user initiated GETs (512 bytes). */
  static constexpr uint8_t DEFAULT_BLOCK_SZX = 5;
  /** @brief Blockwise transfers larger than this are abandoned. */
  static constexpr size_t MAX_BLOCKWISE_SIZE = 1024 * 1024;

  SlipTermSession(const SlipTermConfig& config,
                  shared_ptr<PacketHandler> _packetHandler,
                  uint16_t initialMessageId);

  /** @brief Records the device and asks it for board, version and resources. */
  void onConnect(const string& deviceName, SteadyClock::time_point now);
  void onSerialData(const string& bytes, SteadyClock::time_point now);
  void onKeystrokes(const string& bytes, SteadyClock::time_point now);
  /** @brief Headless input: complete lines are submitted like Enter. */
  void onInputLines(const string& bytes, SteadyClock::time_point now);
  /** @brief Headless input ended, an unterminated last line is submitted. */
  void onInputEnd(SteadyClock::time_point now);
  /**
   * @brief True once headless input has ended and no exchange or job is
   * still waiting for the device.
   */
  bool isDrained() const {
    return inputEnded && tracker.outstandingCount() == 0 && jobs.empty();
  }
  void onTick(SteadyClock::time_point now);
  /** @brief The link is gone, @p reason is shown to the user. */
  void onDisconnect(const string& reason);

  /**
   * @brief Runs a finished input line: help, a "/path" GET, a known command
   * or shell text.
   */
  void submitLine(const string& line, SteadyClock::time_point now);

  /**
   * @brief Sends a GET for @p path (with an optional "?query").
   * @param quiet Leave the request and its response out of the log.
   */
  ExchangeId sendGet(const string& path, SteadyClock::time_point now,
                     bool quiet = false);

  /** @brief Framed bytes for the serial link, one string per frame. */
  vector<string> takeOutgoing();

  bool isDirty() const { return dirty; }
  void wash() { dirty = false; }
  bool wantsExit() const { return exitRequested; }
  const string& getExitReason() const { return exitReason; }

  ScreenModel getScreenModel() const;

  // FrameConsumer
  virtual void onDiagnostic(const string& payload);
  virtual void onStructured(const string& payload);
  virtual void onConfiguration(const string& datagram);
  virtual void onUnknown(const string& frame);

  const TerminalLog& getLog() const { return log; }
  const SessionTracker& getTracker() const { return tracker; }
  const CommandLibrary& getCommands() const { return commands; }
  const UserInputManager& getInput() const { return input; }
  const ShellTextStream& getShellText() const { return shellText; }
  const SlipDecoder& getDecoder() const { return decoder; }
  const string& getDevice() const { return device; }
  const string& getBoard() const { return board; }
  const string& getVersion() const { return version; }
  SessionView getView() const { return view; }

 protected:
  /**
   * @brief What a locally started exchange is for, kept until it finishes.
   */
  struct RequestContext {
    string path;
    bool quiet;
    /** @brief Payload of the blocks received so far. */
    string accumulated;
  };

  void handleKey(const KeyEvent& key, SteadyClock::time_point now);
  void sendDiagnostic(const string& text);
  ExchangeId startRequest(CoapMessage request, const RequestContext& context,
                          SteadyClock::time_point now);
  void collectShellLines();
  void collectTracker();
  void handleEvent(const ExchangeEvent& event, RequestContext context);
  void startJob(const Command& command, const vector<string>& args,
                SteadyClock::time_point now);
  void sendJobRequest(shared_ptr<CommandJob> job, CoapMessage request,
                      SteadyClock::time_point now);
  void handleJobEvent(const ExchangeEvent& event, shared_ptr<CommandJob> job);
  void handleResponse(const ExchangeEvent& event, RequestContext* context);
  void onWellKnownCore(const string& payload);
  void appendPayload(const CoapMessage& response, const string& payload);
  void noteDesync(const string& what);

  CommandLibrary commands;
  UserInputManager input;
  KeyDecoder keyDecoder;
  SlipDecoder decoder;
  ChannelDemultiplexer demultiplexer;
  SessionTracker tracker;
  ShellTextStream shellText;
  TerminalLog log;
  shared_ptr<PacketHandler> packetHandler;

  map<ExchangeId, RequestContext> requests;
  /** @brief Running built-in jobs by the exchange they wait for. */
  map<ExchangeId, shared_ptr<CommandJob>> jobs;
  deque<string> outgoing;
  SteadyClock::time_point currentTime;
  int64_t corruptFramesSeen;
  string inputLineBuffer;
  bool inputEnded;
  string heldKeys;

  string device;
  bool connected;
  string board;
  string version;
  SessionView view;
  bool dirty;
  bool exitRequested;
  string exitReason;
};
}  // namespace st

#endif  // __ST_SLIPTERM_SESSION__
