#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace st {
namespace {
string logTimestamp() {
  time_t rawtime = time(NULL);
  struct tm timeinfo;
  localtime_r(&rawtime, &timeinfo);
  char buffer[80];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  return string(buffer);
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // easylogging parses its own verbose arguments; slipterm sets the level
  // explicitly from cxxopts or the config file instead.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // Nothing may reach the terminal until a file is configured
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  return defaultConf;
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::startLogging(el::Configurations *defaultConf,
                                const LogSettings &settings) {
  string stem = settings.prefix + "-" + logTimestamp() + "_" +
                std::to_string(getpid());
  string fullFname = createLogFile(settings.directory, stem + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Enabled,
                           settings.silent ? "false" : "true");
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           settings.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           settings.mirrorToStdout ? "true" : "false");
  el::Loggers::setVerboseLevel(settings.verbose);

  if (settings.redirectStderr) {
    stderrToFile(createLogFile(settings.directory, stem + ".stderr.log"));
  }

  el::Loggers::reconfigureLogger("default", *defaultConf);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  return fullFname;
}

void LogHandler::stopLogging() {
  el::Helpers::uninstallPreRollOutCallback();
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
  string previous = string(filename) + ".1";
  remove(previous.c_str());
  if (rename(filename, previous.c_str()) != 0) {
    remove(filename);
  }
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  string fullFname = directory + "/" + filename;
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << fse.what() << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

void LogHandler::stderrToFile(const string &path) {
  FILE *stderr_stream = freopen(path.c_str(), "w", stderr);
  if (!stderr_stream) {
    STFATAL << "Cannot redirect stderr to " << path;
  }
  setvbuf(stderr_stream, NULL, _IOLBF, BUFSIZ);
}

}  // namespace st
