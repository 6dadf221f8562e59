#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace st;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      st::LogHandler::setupLogHandler(&argc, &argv);
  st::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  st::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  string logDirectoryPattern =
      GetTempDirectory() + string("slipterm_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  LogSettings logSettings;
  logSettings.directory = logDirectory;
  logSettings.prefix = "log";
  st::LogHandler::startLogging(&defaultConf, logSettings);

  int result = Catch::Session().run(argc, argv);

  st::LogHandler::stopLogging();
  FATAL_FAIL(fs::remove_all(logDirectory.c_str()));
  return result;
}
