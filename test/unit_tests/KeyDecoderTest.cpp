#include "KeyDecoder.hpp"

#include "TestHeaders.hpp"

using namespace st;

namespace {
vector<KeyType> types(const vector<KeyEvent>& events) {
  vector<KeyType> retval;
  for (const auto& event : events) {
    retval.push_back(event.type);
  }
  return retval;
}
}  // namespace

TEST_CASE("Plain keys", "[KeyDecoder]") {
  KeyDecoder decoder;
  vector<KeyEvent> events = decoder.decode("a\r\t\x7f\x03\x04");
  REQUIRE(types(events) ==
          vector<KeyType>({KeyType::CHAR, KeyType::ENTER, KeyType::TAB,
                           KeyType::BACKSPACE, KeyType::CTRL_C,
                           KeyType::CTRL_D}));
  REQUIRE(events[0].text == "a");

  SECTION("Multi-byte characters are one key") {
    events = decoder.decode("\xc3\xbc");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0] == KeyEvent(KeyType::CHAR, "\xc3\xbc"));
  }
}

TEST_CASE("Escape sequences", "[KeyDecoder]") {
  KeyDecoder decoder;

  SECTION("CSI arrows") {
    REQUIRE(types(decoder.decode("\x1b[A\x1b[B\x1b[C\x1b[D")) ==
            vector<KeyType>({KeyType::UP, KeyType::DOWN, KeyType::RIGHT,
                             KeyType::LEFT}));
  }

  SECTION("SS3 arrows and function keys") {
    REQUIRE(types(decoder.decode("\x1bOA\x1bOP\x1bOQ\x1bOR")) ==
            vector<KeyType>(
                {KeyType::UP, KeyType::F1, KeyType::F2, KeyType::F3}));
  }

  SECTION("Function keys as CSI tilde sequences") {
    REQUIRE(types(decoder.decode("\x1b[11~\x1b[12~\x1b[13~")) ==
            vector<KeyType>({KeyType::F1, KeyType::F2, KeyType::F3}));
    REQUIRE(types(decoder.decode("\x1b[[A")) ==
            vector<KeyType>({KeyType::F1}));
  }

  SECTION("Sequence split across reads") {
    REQUIRE(decoder.decode("\x1b").empty());
    REQUIRE(decoder.decode("[").empty());
    REQUIRE(decoder.getPending() == "\x1b[");
    REQUIRE(types(decoder.decode("Dx")) ==
            vector<KeyType>({KeyType::LEFT, KeyType::CHAR}));
    REQUIRE(decoder.getPending().empty());
  }

  SECTION("Modified arrows and unknown sequences") {
    REQUIRE(types(decoder.decode("\x1b[1;5C")) ==
            vector<KeyType>({KeyType::RIGHT}));
    REQUIRE(types(decoder.decode("\x1b[5~")) ==
            vector<KeyType>({KeyType::UNKNOWN}));
  }

  SECTION("Lone escape is released by flush") {
    REQUIRE(decoder.decode("\x1b").empty());
    vector<KeyEvent> events = decoder.flush();
    REQUIRE(types(events) == vector<KeyType>({KeyType::UNKNOWN}));
    REQUIRE(decoder.getPending().empty());
  }
}
