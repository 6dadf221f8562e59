#include "ChannelDemultiplexer.hpp"
#include "SlipCodec.hpp"
#include "TestHeaders.hpp"

using namespace st;

namespace {
class RecordingConsumer : public FrameConsumer {
 public:
  virtual void onDiagnostic(const string& payload) {
    events.push_back("diagnostic:" + payload);
  }
  virtual void onStructured(const string& payload) {
    events.push_back("structured:" + payload);
  }
  virtual void onConfiguration(const string& datagram) {
    events.push_back("configuration:" + datagram);
  }
  virtual void onUnknown(const string& frame) {
    events.push_back("unknown:" + frame);
  }

  vector<string> events;
};
}  // namespace

TEST_CASE("Frames are classified by their marker", "[ChannelDemultiplexer]") {
  REQUIRE(ChannelDemultiplexer::classify("\x0a"
                                         "hi") == ChannelKind::DIAGNOSTIC_TEXT);
  REQUIRE(ChannelDemultiplexer::classify("\xa9\x40") ==
          ChannelKind::STRUCTURED_MESSAGE);
  REQUIRE(ChannelDemultiplexer::classify("\x45\x00") ==
          ChannelKind::CONFIGURATION);
  REQUIRE(ChannelDemultiplexer::classify("\x60\x00") ==
          ChannelKind::CONFIGURATION);
  REQUIRE(ChannelDemultiplexer::classify("\x44\x00") == ChannelKind::UNKNOWN);
  REQUIRE(ChannelDemultiplexer::classify("\xff") == ChannelKind::UNKNOWN);
  REQUIRE(ChannelDemultiplexer::classify("") == ChannelKind::UNKNOWN);
}

TEST_CASE("Routing reaches the right consumer in order",
          "[ChannelDemultiplexer]") {
  RecordingConsumer consumer;
  ChannelDemultiplexer demultiplexer(&consumer);
  SlipDecoder decoder;

  string wire =
      ChannelDemultiplexer::frameOutgoing(ChannelKind::DIAGNOSTIC_TEXT, "a") +
      ChannelDemultiplexer::frameOutgoing(ChannelKind::STRUCTURED_MESSAGE,
                                          "b") +
      ChannelDemultiplexer::frameOutgoing(ChannelKind::DIAGNOSTIC_TEXT, "c") +
      SlipEncoder::encode("\x01zz");
  for (const auto& frame : decoder.decode(wire)) {
    demultiplexer.route(frame);
  }

  REQUIRE(consumer.events ==
          vector<string>({"diagnostic:a", "structured:b", "diagnostic:c",
                          "unknown:\x01zz"}));
  REQUIRE(demultiplexer.getUnknownFrameCount() == 1);
}

TEST_CASE("IP datagrams keep their first byte", "[ChannelDemultiplexer]") {
  RecordingConsumer consumer;
  ChannelDemultiplexer demultiplexer(&consumer);
  string datagram("\x60\x00\x00\x00", 4);
  REQUIRE(demultiplexer.route(datagram) == ChannelKind::CONFIGURATION);
  REQUIRE(consumer.events.size() == 1);
  REQUIRE(consumer.events[0] == "configuration:" + datagram);
}

TEST_CASE("Wrapping outgoing payloads", "[ChannelDemultiplexer]") {
  REQUIRE(ChannelDemultiplexer::wrap(ChannelKind::DIAGNOSTIC_TEXT, "ps\n") ==
          "\x0aps\n");
  REQUIRE(ChannelDemultiplexer::wrap(ChannelKind::STRUCTURED_MESSAGE, "x") ==
          "\xa9x");
  REQUIRE(ChannelDemultiplexer::wrap(ChannelKind::CONFIGURATION, "\x45y") ==
          "\x45y");
  REQUIRE_THROWS_AS(ChannelDemultiplexer::wrap(ChannelKind::UNKNOWN, "x"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(
      ChannelDemultiplexer::wrap(ChannelKind::CONFIGURATION, "not ip"),
      std::runtime_error);
}
