#include "CommandLibrary.hpp"
#include "UserInputManager.hpp"

#include "TestHeaders.hpp"

using namespace st;

TEST_CASE("Command library", "[CommandLibrary]") {
  CommandLibrary library;
  REQUIRE(library.list().size() == 3);
  REQUIRE(library.find("help") != nullptr);
  REQUIRE(library.find("help  ")->kind == CommandKind::LOCAL);
  REQUIRE(library.find("/.well-known/core")->endpoint == "/.well-known/core");

  REQUIRE(library.add(Command("ps", "Prints information about running threads",
                              CommandKind::SHELL)));
  REQUIRE(!library.add(Command("ps", "again", CommandKind::SHELL)));
  REQUIRE(library.add(
      Command("/riot/board", "", CommandKind::COAP_RESOURCE, "/riot/board")));

  SECTION("Kept sorted by name") {
    vector<string> names;
    for (const auto& command : library.list()) {
      names.push_back(command.name);
    }
    REQUIRE(names == vector<string>({"/.well-known/core", "/riot/board",
                                     "ForceCmdsAvailable", "help", "ps"}));
  }

  SECTION("Descriptions can be learned later") {
    REQUIRE(library.updateDescription("/riot/board", "Board name\n"));
    REQUIRE(library.find("/riot/board")->description == "Board name");
    REQUIRE(!library.updateDescription("reboot", "nope"));
  }

  SECTION("Prefix matching") {
    vector<const Command*> matches;
    REQUIRE(library.longestCommonPrefix("/", &matches) == "/");
    REQUIRE(matches.size() == 2);
    REQUIRE(library.longestCommonPrefix("/r", &matches) == "/riot/board");
    REQUIRE(matches.size() == 1);
    REQUIRE(library.longestCommonPrefix("x", &matches) == "x");
    REQUIRE(matches.empty());
  }

  SECTION("Help text aligns descriptions") {
    vector<string> lines = library.helpText();
    REQUIRE(lines.size() == 5);
    REQUIRE(lines[4] ==
            "ps" + string(string("ForceCmdsAvailable").size(), ' ') +
                "Prints information about running threads");
  }
}

TEST_CASE("Stored commands wait for their endpoints", "[CommandLibrary]") {
  CommandLibrary library;
  auto factory = [](const vector<string>& args) -> shared_ptr<CommandJob> {
    return shared_ptr<CommandJob>();
  };
  library.store(Command("Saul", "Sensors", {"/jelly/saul"}, factory));
  library.store(
      Command("Both", "Two endpoints", {"/jelly/Ps", "/Memory"}, factory));
  REQUIRE(library.getStored().size() == 2);
  REQUIRE(library.find("Saul") == nullptr);

  SECTION("Only fully listed endpoints unlock a command") {
    REQUIRE(library.updateAvailable({"/jelly/saul", "/jelly/Ps"}) == 1);
    REQUIRE(library.find("Saul")->kind == CommandKind::JOB);
    REQUIRE(library.find("Both") == nullptr);
    REQUIRE(library.getStored().size() == 1);

    REQUIRE(library.updateAvailable({"/Memory", "/jelly/Ps"}) == 1);
    REQUIRE(library.find("Both") != nullptr);
    REQUIRE(library.updateAvailable({"/Memory", "/jelly/Ps"}) == 0);
  }

  SECTION("Forcing offers everything") {
    REQUIRE(library.forceAllAvailable() == 2);
    REQUIRE(library.find("Saul") != nullptr);
    REQUIRE(library.find("Both")->requiredEndpoints.size() == 2);
    REQUIRE(library.getStored().empty());
    REQUIRE(library.forceAllAvailable() == 0);
  }
}

TEST_CASE("Line editing", "[UserInputManager]") {
  CommandLibrary library;
  UserInputManager input(&library);

  input.insert("pong");
  input.moveLeft();
  input.moveLeft();
  input.moveLeft();
  input.backspace();
  REQUIRE(input.getBuffer() == "ong");
  REQUIRE(input.getCursor() == 0);
  input.backspace();
  REQUIRE(input.getBuffer() == "ong");
  input.insert("pi");
  REQUIRE(input.getBuffer() == "piong");
  input.moveRight();
  input.backspace();
  REQUIRE(input.getBuffer() == "ping");

  SECTION("Cursor stays on character boundaries") {
    input.clear();
    input.insert("a\xc3\xbc\xe2\x82\xac");
    REQUIRE(input.getCursorColumn() == 3);
    input.moveLeft();
    REQUIRE(input.getCursor() == 3);
    input.moveLeft();
    REQUIRE(input.getCursor() == 1);
    REQUIRE(input.getCursorColumn() == 1);
    input.moveRight();
    input.backspace();
    REQUIRE(input.getBuffer() == "a\xe2\x82\xac");
    input.moveRight();
    input.moveRight();
    REQUIRE(input.getCursor() == 4);
    input.backspace();
    REQUIRE(input.getBuffer() == "a");
  }
}

TEST_CASE("History", "[UserInputManager]") {
  CommandLibrary library;
  UserInputManager input(&library);

  input.insert("ps");
  REQUIRE(input.submit() == "ps");
  input.insert("ps");
  input.submit();
  REQUIRE(input.submit() == "");
  input.insert("help");
  input.submit();
  REQUIRE(input.getHistory() == vector<string>({"ps", "help"}));

  input.insert("dra");
  input.historyUp();
  REQUIRE(input.getBuffer() == "help");
  REQUIRE(input.getCursor() == 4);
  input.historyUp();
  REQUIRE(input.getBuffer() == "ps");
  input.historyUp();
  REQUIRE(input.getBuffer() == "ps");
  input.historyDown();
  REQUIRE(input.getBuffer() == "help");
  input.historyDown();
  REQUIRE(input.getBuffer() == "dra");
  input.historyDown();
  REQUIRE(input.getBuffer() == "dra");
}

TEST_CASE("Completion", "[UserInputManager]") {
  CommandLibrary library;
  library.add(Command("reboot", "", CommandKind::SHELL));
  library.add(Command("/riot/board", "", CommandKind::COAP_RESOURCE,
                      "/riot/board"));
  library.add(Command("/riot/ver", "", CommandKind::COAP_RESOURCE,
                      "/riot/ver"));
  UserInputManager input(&library);

  input.insert("re");
  REQUIRE(input.complete().empty());
  REQUIRE(input.getBuffer() == "reboot");

  input.clear();
  input.insert("/r");
  vector<string> candidates = input.complete();
  REQUIRE(input.getBuffer() == "/riot/");
  REQUIRE(candidates == vector<string>({"/riot/board", "/riot/ver"}));

  input.clear();
  input.insert("zz");
  REQUIRE(input.complete().empty());
  REQUIRE(input.getBuffer() == "zz");
}
