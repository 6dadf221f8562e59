#include <cxxopts.hpp>

#include "Headers.hpp"
#include "LogHandler.hpp"
#include "PacketHandler.hpp"
#include "PseudoTerminalConsole.hpp"
#include "SlipTermClient.hpp"
#include "SlipTermConfig.hpp"
#include "TtySerialHandler.hpp"

using namespace st;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  st::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, st::InterruptSignalHandler);
  // A socket device that goes away shows up as EPIPE instead
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("slipterm",
                           "Shell and CoAP front-end for RIOT nodes on a "
                           "Slipmux serial line");
  SlipTermConfig config;
  try {
    SlipTermConfig::addOptions(&options);
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "slipterm version " << ST_VERSION << endl;
      exit(0);
    }

    if (result.count("cfgfile")) {
      config.loadFile(result["cfgfile"].as<string>());
    }
    // Command line beats the config file
    config.applyCommandLine(result);
    config.validate();
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (std::runtime_error& re) {
    handleParseException(re, options);
  }

  GOOGLE_PROTOBUF_VERIFY_VERSION;
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  LogSettings logSettings;
  logSettings.directory = config.logDirectory;
  logSettings.verbose = config.verbose;
  logSettings.mirrorToStdout = config.logToStdout && config.headless;
  logSettings.silent = config.silent;
  logSettings.maxLogSize = config.maxLogSize;
  string logFile = LogHandler::startLogging(&defaultConf, logSettings);
  el::Helpers::setThreadName("slipterm-main");
  LOG(INFO) << "slipterm " << ST_VERSION << " starting on " << config.device;

  int exitCode = 0;
  try {
    shared_ptr<SerialHandler> serialHandler(
        new TtySerialHandler(config.device, config.baudRate));
    shared_ptr<Console> console;
    if (!config.headless) {
      console.reset(new PseudoTerminalConsole());
    }
    shared_ptr<PacketHandler> packetHandler(
        new LoggingPacketHandler(config.address));
    // Message ids start at a random point so a restarted session does not
    // collide with exchanges the device still remembers
    uint16_t initialMessageId = uint16_t(randombytes_uniform(0x10000));
    shared_ptr<SlipTermSession> session(
        new SlipTermSession(config, packetHandler, initialMessageId));

    SlipTermClient client(serialHandler, console, session, config);
    client.run();
  } catch (const runtime_error& re) {
    STERROR << "Error: " << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }
  CLOG(INFO, "stdout") << "Log written to " << logFile << endl;

  LogHandler::stopLogging();
  return exitCode;
}
