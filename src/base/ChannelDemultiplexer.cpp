#include "ChannelDemultiplexer.hpp"

#include "SlipCodec.hpp"

namespace st {
namespace {
bool isIpMarker(uint8_t marker) {
  // IPv4 with a valid IHL, or any IPv6 header
  return (marker >= 0x45 && marker <= 0x4F) ||
         (marker >= 0x60 && marker <= 0x6F);
}
}  // namespace

const char* channelKindName(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::DIAGNOSTIC_TEXT:
      return "diagnostic";
    case ChannelKind::CONFIGURATION:
      return "configuration";
    case ChannelKind::STRUCTURED_MESSAGE:
      return "structured";
    case ChannelKind::UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

ChannelKind ChannelDemultiplexer::classify(const string& frame) {
  if (frame.empty()) {
    return ChannelKind::UNKNOWN;
  }
  uint8_t marker = uint8_t(frame[0]);
  if (marker == SLIPMUX_DIAGNOSTIC) {
    return ChannelKind::DIAGNOSTIC_TEXT;
  }
  if (marker == SLIPMUX_COAP) {
    return ChannelKind::STRUCTURED_MESSAGE;
  }
  if (isIpMarker(marker)) {
    return ChannelKind::CONFIGURATION;
  }
  return ChannelKind::UNKNOWN;
}

ChannelKind ChannelDemultiplexer::route(const string& frame) {
  ChannelKind kind = classify(frame);
  VLOG(3) << "Routing " << frame.size() << " byte frame to "
          << channelKindName(kind);
  switch (kind) {
    case ChannelKind::DIAGNOSTIC_TEXT:
      consumer->onDiagnostic(frame.substr(1));
      break;
    case ChannelKind::STRUCTURED_MESSAGE:
      consumer->onStructured(frame.substr(1));
      break;
    case ChannelKind::CONFIGURATION:
      consumer->onConfiguration(frame);
      break;
    case ChannelKind::UNKNOWN:
      unknownFrameCount++;
      LOG(WARNING) << "Frame with unknown marker "
                   << (frame.empty() ? string("<empty>")
                                     : toHex(frame.substr(0, 1)))
                   << " (" << frame.size() << " bytes)";
      consumer->onUnknown(frame);
      break;
  }
  return kind;
}

string ChannelDemultiplexer::wrap(ChannelKind kind, const string& payload) {
  switch (kind) {
    case ChannelKind::DIAGNOSTIC_TEXT:
      return string(1, char(SLIPMUX_DIAGNOSTIC)) + payload;
    case ChannelKind::STRUCTURED_MESSAGE:
      return string(1, char(SLIPMUX_COAP)) + payload;
    case ChannelKind::CONFIGURATION:
      if (payload.empty() || !isIpMarker(uint8_t(payload[0]))) {
        throw std::runtime_error("Configuration payload is not an IP datagram");
      }
      return payload;
    case ChannelKind::UNKNOWN:
      break;
  }
  throw std::runtime_error("Cannot wrap a frame for an unknown channel");
}

string ChannelDemultiplexer::frameOutgoing(ChannelKind kind,
                                           const string& payload) {
  return SlipEncoder::encode(wrap(kind, payload));
}
}  // namespace st
