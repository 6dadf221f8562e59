#include "SlipTermConfig.hpp"

#include "ScreenRenderer.hpp"
#include "SimpleIni.h"

namespace st {
namespace {
int64_t parseInteger(const string& name, const string& value) {
  try {
    size_t used = 0;
    long long parsed = stoll(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid value for " + name + ": " + value);
  }
}

int64_t positive(const string& name, int64_t value) {
  if (value <= 0) {
    throw std::runtime_error(name + " must be positive, got " +
                             to_string(value));
  }
  return value;
}
}  // namespace

SlipTermConfig::SlipTermConfig()
    : baudRate(DEFAULT_BAUD_RATE),
      exchangeTimeout(DEFAULT_EXCHANGE_TIMEOUT_MS),
      tickInterval(DEFAULT_TICK_MS),
      theme(THEME_RIOT),
      headless(false),
      scrollback(DEFAULT_SCROLLBACK),
      maxFrameSize(DEFAULT_MAX_FRAME_SIZE),
      verbose(0),
      logToStdout(false),
      logDirectory(GetTempDirectory()),
      maxLogSize("20971520"),
      silent(false) {}

void SlipTermConfig::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  const char* value = ini.GetValue("Serial", "device", NULL);
  if (value) {
    device = string(value);
  }
  value = ini.GetValue("Serial", "baud", NULL);
  if (value) {
    baudRate = int(positive("baud", parseInteger("baud", value)));
  }

  value = ini.GetValue("Session", "timeout_ms", NULL);
  if (value) {
    exchangeTimeout = std::chrono::milliseconds(
        positive("timeout_ms", parseInteger("timeout_ms", value)));
  }
  value = ini.GetValue("Session", "tick_ms", NULL);
  if (value) {
    tickInterval = std::chrono::milliseconds(
        positive("tick_ms", parseInteger("tick_ms", value)));
  }
  value = ini.GetValue("Session", "max_frame", NULL);
  if (value) {
    maxFrameSize =
        size_t(positive("max_frame", parseInteger("max_frame", value)));
  }

  value = ini.GetValue("Display", "theme", NULL);
  if (value) {
    theme = ScreenRenderer::parseTheme(value);
  }
  value = ini.GetValue("Display", "scrollback", NULL);
  if (value) {
    scrollback =
        size_t(positive("scrollback", parseInteger("scrollback", value)));
  }

  value = ini.GetValue("Network", "address", NULL);
  if (value) {
    address = string(value);
  }

  value = ini.GetValue("Debug", "verbose", NULL);
  if (value) {
    verbose = int(parseInteger("verbose", value));
  }
  // read log file size limit
  value = ini.GetValue("Debug", "logsize", NULL);
  if (value && atoi(value) != 0) {
    maxLogSize = string(value);
  }
  value = ini.GetValue("Debug", "silent", NULL);
  if (value && atoi(value) != 0) {
    silent = true;
  }
  value = ini.GetValue("Debug", "logdir", NULL);
  if (value) {
    logDirectory = string(value);
  }
  LOG(INFO) << "Loaded config file " << path;
}

void SlipTermConfig::addOptions(cxxopts::Options* options) {
  options->add_options()            //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("device", "Serial device or UNIX socket of the node",
       cxxopts::value<std::string>())  //
      ("c,cfgfile", "Location of the config file",
       cxxopts::value<std::string>())  //
      ("b,baud", "Baud rate of the serial line",
       cxxopts::value<int>())  //
      ("t,timeout", "Milliseconds to wait for a CoAP response",
       cxxopts::value<int>())  //
      ("tick", "Milliseconds between timer ticks",
       cxxopts::value<int>())  //
      ("theme", "Color theme (none, dark, light, riot)",
       cxxopts::value<std::string>())  //
      ("headless", "No full-screen UI, shell lines on stdin and stdout")  //
      ("scrollback", "Lines of output kept",
       cxxopts::value<int>())  //
      ("max-frame", "Largest SLIP frame accepted, in bytes",
       cxxopts::value<int>())  //
      ("address", "Address of the auxiliary network path to display",
       cxxopts::value<std::string>())  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>(), "LEVEL")  //
      ("logtostdout", "Write log to stdout")  //
      ("logdir", "Base directory for log files",
       cxxopts::value<std::string>())  //
      ;
  options->parse_positional({"device"});
  options->positional_help("device");
}

void SlipTermConfig::applyCommandLine(const cxxopts::ParseResult& result) {
  if (result.count("device")) {
    device = result["device"].as<string>();
  }
  if (result.count("baud")) {
    baudRate = int(positive("baud", result["baud"].as<int>()));
  }
  if (result.count("timeout")) {
    exchangeTimeout = std::chrono::milliseconds(
        positive("timeout", result["timeout"].as<int>()));
  }
  if (result.count("tick")) {
    tickInterval =
        std::chrono::milliseconds(positive("tick", result["tick"].as<int>()));
  }
  if (result.count("theme")) {
    theme = ScreenRenderer::parseTheme(result["theme"].as<string>());
  }
  if (result.count("headless")) {
    headless = true;
  }
  if (result.count("scrollback")) {
    scrollback =
        size_t(positive("scrollback", result["scrollback"].as<int>()));
  }
  if (result.count("max-frame")) {
    maxFrameSize =
        size_t(positive("max-frame", result["max-frame"].as<int>()));
  }
  if (result.count("address")) {
    address = result["address"].as<string>();
  }
  if (result.count("verbose")) {
    verbose = result["verbose"].as<int>();
  }
  if (result.count("logtostdout")) {
    logToStdout = true;
  }
  if (result.count("logdir")) {
    logDirectory = result["logdir"].as<string>();
  }
}

void SlipTermConfig::validate() const {
  if (device.empty()) {
    throw std::runtime_error("No device given");
  }
  if (maxFrameSize < 4) {
    throw std::runtime_error("max-frame is too small for a CoAP header");
  }
}
}  // namespace st
