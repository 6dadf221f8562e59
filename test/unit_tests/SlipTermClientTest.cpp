#include "FakeConsole.hpp"
#include "FakeDevice.hpp"
#include "FakeSerialHandler.hpp"
#include "SlipTermClient.hpp"
#include "TestHeaders.hpp"

using namespace st;

namespace {
bool logContains(const SlipTermSession& session, LineKind kind,
                 const string& text) {
  for (const auto& line : session.getLog().getLines()) {
    if (line.kind == kind && line.text == text) {
      return true;
    }
  }
  return false;
}

class ClientFixture {
 public:
  ClientFixture()
      : serial(new FakeSerialHandler()), console(new FakeConsole()) {
    config.device = "fake-serial";
    config.theme = THEME_NONE;
    config.tickInterval = std::chrono::milliseconds(10);
    session.reset(new SlipTermSession(
        config, shared_ptr<PacketHandler>(new LoggingPacketHandler()), 1));
  }

  /**
   * @brief Runs the loop until @p done holds, collecting what was drawn and
   * what the device received.
   */
  bool pump(SlipTermClient* client, std::function<bool()> done) {
    for (int a = 0; a < 200; a++) {
      bool running = client->runOnce(std::chrono::milliseconds(10));
      screen += console->getTerminalData();
      device.feed(serial->deviceRead());
      shellInput += device.takeShellInput();
      for (const auto& message : device.takeMessages()) {
        messages.push_back(message);
      }
      if (done()) {
        return true;
      }
      if (!running) {
        return false;
      }
    }
    return false;
  }

  SlipTermConfig config;
  shared_ptr<FakeSerialHandler> serial;
  shared_ptr<FakeConsole> console;
  shared_ptr<SlipTermSession> session;
  FakeDevice device;
  string screen;
  string shellInput;
  vector<CoapMessage> messages;
};
}  // namespace

TEST_CASE_METHOD(ClientFixture, "Interactive session", "[SlipTermClient]") {
  SlipTermClient client(serial, console, session, config);
  REQUIRE(pump(&client, [this]() { return messages.size() == 3; }));
  REQUIRE(console->setupCount == 1);
  REQUIRE_THAT(screen, ContainsSubstring("\x1b[?1049h"));
  REQUIRE_THAT(screen, ContainsSubstring(" slipterm | fake-serial "));
  REQUIRE(messages[0].getPath() == "/riot/board");

  SECTION("Device output is drawn") {
    serial->deviceWrite(FakeDevice::diagnostic("boot ok\n") +
                        FakeDevice::piggyback(messages[0], CoapCode::CONTENT,
                                              "native"));
    REQUIRE(pump(&client, [this]() { return !session->getBoard().empty(); }));
    REQUIRE(pump(&client, [this]() {
      return screen.find("boot ok") != string::npos;
    }));
    REQUIRE(session->getBoard() == "native");
    REQUIRE(pump(&client, [this]() {
      return screen.find("fake-serial | native") != string::npos;
    }));
  }

  SECTION("Keystrokes reach the device") {
    console->simulateKeystrokes("ps\r");
    REQUIRE(pump(&client, [this]() { return shellInput == "ps\n"; }));

    console->simulateKeystrokes("/riot/ver\r");
    REQUIRE(pump(&client, [this]() { return messages.size() == 4; }));
    REQUIRE(messages[3].getPath() == "/riot/ver");
  }

  SECTION("Resizing redraws") {
    screen.clear();
    console->resize(30, 100);
    REQUIRE(pump(&client, [this]() {
      return screen.find("\x1b[30;1H") != string::npos;
    }));
  }

  SECTION("Hang up ends the session") {
    serial->hangUp();
    REQUIRE(!pump(&client, []() { return false; }));
    REQUIRE(session->wantsExit());
    REQUIRE_THAT(session->getExitReason(), ContainsSubstring("closed"));

    client.run();
    REQUIRE(console->teardownCount == 1);
    REQUIRE(serial->closeCount == 1);
    REQUIRE_THAT(console->getTerminalData(),
                 ContainsSubstring("\x1b[?1049l"));
  }

  SECTION("Ctrl-C quits") {
    console->simulateKeystrokes("\x03");
    client.run();
    REQUIRE(session->getExitReason() == "user quit");
    REQUIRE(console->teardownCount == 1);
  }
}

TEST_CASE_METHOD(ClientFixture, "Headless session", "[SlipTermClient]") {
  // Nobody answers, so the connect queries have to expire first
  config.exchangeTimeout = std::chrono::milliseconds(100);
  session.reset(new SlipTermSession(
      config, shared_ptr<PacketHandler>(new LoggingPacketHandler()), 1));
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  SlipTermClient client(serial, shared_ptr<Console>(), session, config,
                        fds[0]);

  const string lines = "help\nps\nreboot";
  RawSocketUtils::writeAll(fds[1], lines.data(), lines.size());
  ::close(fds[1]);

  client.run();
  REQUIRE(session->getExitReason() == "end of input");
  REQUIRE(console->setupCount == 0);

  device.feed(serial->deviceRead());
  REQUIRE(device.takeShellInput() == "ps\nreboot\n");
  REQUIRE(device.takeMessages().size() == 3);
  REQUIRE(serial->closeCount == 1);
  ::close(fds[0]);
}

TEST_CASE_METHOD(ClientFixture, "Headless session waits for replies",
                 "[SlipTermClient]") {
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  SlipTermClient client(serial, shared_ptr<Console>(), session, config,
                        fds[0]);

  const string lines = "ps\n/riot/ver";
  RawSocketUtils::writeAll(fds[1], lines.data(), lines.size());
  ::close(fds[1]);

  // The last line is sent once the input has ended
  REQUIRE(pump(&client, [this]() { return messages.size() == 4; }));
  REQUIRE(messages[3].getPath() == "/riot/ver");
  REQUIRE(shellInput == "ps\n");
  REQUIRE(!session->wantsExit());
  REQUIRE(session->getTracker().outstandingCount() == 4);

  string replies = FakeDevice::diagnostic("ps output\n");
  for (const auto& message : messages) {
    replies += FakeDevice::piggyback(
        message, CoapCode::CONTENT,
        message.getPath() == "/riot/ver" ? "2024.01" : "");
  }
  serial->deviceWrite(replies);
  REQUIRE(!pump(&client, []() { return false; }));
  REQUIRE(session->getExitReason() == "end of input");
  REQUIRE(logContains(*session, LineKind::DIAGNOSTIC, "ps output"));
  REQUIRE(logContains(*session, LineKind::RESPONSE, "  2024.01"));
  REQUIRE(session->getVersion() == "2024.01");
  REQUIRE(session->getTracker().outstandingCount() == 0);
  ::close(fds[0]);
}
