#ifndef __ST_CHANNEL_DEMULTIPLEXER__
#define __ST_CHANNEL_DEMULTIPLEXER__

#include "Headers.hpp"

namespace st {
/**
 * @brief Logical channel a Slipmux frame belongs to.
 */
enum class ChannelKind {
  /** @brief Shell text (marker 0x0A). */
  DIAGNOSTIC_TEXT,
  /** @brief IP datagram for the auxiliary network path (0x45-0x4F,
     0x60-0x6F). */
  CONFIGURATION,
  /** @brief CoAP message (marker 0xA9). */
  STRUCTURED_MESSAGE,
  /** @brief Anything else, including empty frames. */
  UNKNOWN
};

const char* channelKindName(ChannelKind kind);

/**
 * @brief Receives demultiplexed frame payloads.
 */
class FrameConsumer {
 public:
  virtual ~FrameConsumer() {}

  /** @brief Shell text with the marker stripped. */
  virtual void onDiagnostic(const string& payload) = 0;
  /** @brief Serialized CoAP message with the marker stripped. */
  virtual void onStructured(const string& payload) = 0;
  /** @brief A whole IP datagram; its version nibble doubles as the marker. */
  virtual void onConfiguration(const string& datagram) = 0;
  /**
   * @brief A frame with an unrecognized marker.  The payload is discarded
   * after this call.
   */
  virtual void onUnknown(const string& frame) = 0;
};

/**
 * @brief Classifies completed frames by their leading marker and hands them
 * to a FrameConsumer; builds outgoing frames for each channel.
 */
class ChannelDemultiplexer {
 public:
  explicit ChannelDemultiplexer(FrameConsumer* _consumer)
      : consumer(_consumer), unknownFrameCount(0) {}

  /** @brief Reads the fixed-position marker of @p frame. */
  static ChannelKind classify(const string& frame);

  /**
   * @brief Dispatches @p frame to the consumer callback matching its kind.
   * @return The kind the frame was routed as.
   */
  ChannelKind route(const string& frame);

  /**
   * @brief Prepends the channel marker to an outgoing payload.
   * @throws std::runtime_error for ChannelKind::UNKNOWN or a configuration
   * payload that is not an IP datagram.
   */
  static string wrap(ChannelKind kind, const string& payload);

  /** @brief wrap() followed by SLIP encoding, ready for the serial link. */
  static string frameOutgoing(ChannelKind kind, const string& payload);

  int64_t getUnknownFrameCount() const { return unknownFrameCount; }

 protected:
  FrameConsumer* consumer;
  int64_t unknownFrameCount;
};
}  // namespace st

#endif  // __ST_CHANNEL_DEMULTIPLEXER__
