#ifndef __ST_SLIPTERM_CONFIG__
#define __ST_SLIPTERM_CONFIG__

#include <cxxopts.hpp>

#include "Headers.hpp"

namespace st {
/**
 * @brief Settings of one slipterm run.  Defaults, then the config file, then
 * the command line.
 */
struct SlipTermConfig {
  string device;
  int baudRate;
  std::chrono::milliseconds exchangeTimeout;
  std::chrono::milliseconds tickInterval;
  ColorTheme theme;
  bool headless;
  size_t scrollback;
  size_t maxFrameSize;
  /** @brief Shown in the status line when the packet channel has one. */
  string address;

  int verbose;
  bool logToStdout;
  string logDirectory;
  string maxLogSize;
  bool silent;

  SlipTermConfig();

  /**
   * @brief Reads the [Serial], [Session], [Display], [Network] and [Debug]
   * sections of an INI file.
   * @throws std::runtime_error if the file cannot be loaded or holds an
   * invalid value.
   */
  void loadFile(const string& path);

  /** @brief Registers every option applyCommandLine() understands. */
  static void addOptions(cxxopts::Options* options);

  /**
   * @brief Overrides the settings given on the command line.
   * @throws std::runtime_error for an invalid value.
   */
  void applyCommandLine(const cxxopts::ParseResult& result);

  /** @throws std::runtime_error if the combination cannot run. */
  void validate() const;
};
}  // namespace st

#endif  // __ST_SLIPTERM_CONFIG__
