#ifndef __ST_PACKET_HANDLER__
#define __ST_PACKET_HANDLER__

#include "Headers.hpp"

namespace st {
/**
 * @brief Receiver for the IP datagrams the device sends on the Slipmux
 * packet channel.  Attaching a network interface is up to the implementation.
 */
class PacketHandler {
 public:
  virtual ~PacketHandler() {}

  virtual void onDatagram(const string& datagram) = 0;

  /** @brief Address of the auxiliary path, empty when there is none. */
  virtual string getAddress() const = 0;
};

/**
 * @brief Default PacketHandler: no interface is attached, datagrams are
 * counted and traced.
 */
class LoggingPacketHandler : public PacketHandler {
 public:
  explicit LoggingPacketHandler(const string& _address = "")
      : address(_address), datagramCount(0), byteCount(0) {}

  virtual void onDatagram(const string& datagram) {
    datagramCount++;
    byteCount += datagram.size();
    int version = datagram.empty() ? 0 : (uint8_t(datagram[0]) >> 4);
    VLOG(1) << "IPv" << version << " datagram from device, "
            << datagram.size() << " bytes (no interface attached)";
  }

  virtual string getAddress() const { return address; }

  int64_t getDatagramCount() const { return datagramCount; }
  int64_t getByteCount() const { return byteCount; }

 protected:
  string address;
  int64_t datagramCount;
  int64_t byteCount;
};
}  // namespace st

#endif  // __ST_PACKET_HANDLER__
