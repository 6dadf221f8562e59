#ifndef __ST_FAKE_DEVICE_HPP__
#define __ST_FAKE_DEVICE_HPP__

#include "ChannelDemultiplexer.hpp"
#include "CoapMessage.hpp"
#include "SlipCodec.hpp"
#include "TestHeaders.hpp"

namespace st {
/**
 * @brief Plays the node: decodes what the host sends and builds the frames
 * a RIOT device would answer with.
 */
class FakeDevice {
 public:
  void feed(const string& bytes) {
    for (const auto& frame : decoder.decode(bytes)) {
      switch (ChannelDemultiplexer::classify(frame)) {
        case ChannelKind::DIAGNOSTIC_TEXT:
          shellInput += frame.substr(1);
          break;
        case ChannelKind::STRUCTURED_MESSAGE:
          messages.push_back(CoapMessage::parse(frame.substr(1)));
          break;
        case ChannelKind::CONFIGURATION:
          datagrams.push_back(frame);
          break;
        case ChannelKind::UNKNOWN:
          FAIL("Host sent a frame with an unknown marker");
      }
    }
  }

  void feed(const vector<string>& frames) {
    for (const auto& frame : frames) {
      feed(frame);
    }
  }

  vector<CoapMessage> takeMessages() {
    vector<CoapMessage> retval;
    retval.swap(messages);
    return retval;
  }

  string takeShellInput() {
    string retval;
    retval.swap(shellInput);
    return retval;
  }

  static string diagnostic(const string& text) {
    return ChannelDemultiplexer::frameOutgoing(ChannelKind::DIAGNOSTIC_TEXT,
                                               text);
  }

  static string structured(const CoapMessage& message) {
    return ChannelDemultiplexer::frameOutgoing(
        ChannelKind::STRUCTURED_MESSAGE, message.serialize());
  }

  /** @brief A piggybacked response to @p request. */
  static CoapMessage makeAck(const CoapMessage& request, uint8_t code,
                             const string& payload) {
    CoapMessage response(CoapType::ACKNOWLEDGEMENT, code);
    response.setMessageId(request.getMessageId());
    response.setToken(request.getToken());
    response.setPayload(payload);
    return response;
  }

  static string piggyback(const CoapMessage& request, uint8_t code,
                          const string& payload) {
    return structured(makeAck(request, code, payload));
  }

  static string piggyback(const CoapMessage& request, uint8_t code,
                          const string& payload, uint32_t contentFormat) {
    CoapMessage response = makeAck(request, code, payload);
    response.setContentFormat(contentFormat);
    return structured(response);
  }

  static string reset(const CoapMessage& request) {
    CoapMessage rst(CoapType::RESET, CoapCode::EMPTY);
    rst.setMessageId(request.getMessageId());
    return structured(rst);
  }

  vector<string> datagrams;

 protected:
  SlipDecoder decoder;
  vector<CoapMessage> messages;
  string shellInput;
};
}  // namespace st

#endif  // __ST_FAKE_DEVICE_HPP__
