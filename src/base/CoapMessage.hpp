#ifndef __ST_COAP_MESSAGE__
#define __ST_COAP_MESSAGE__

#include "Headers.hpp"

namespace st {
/**
 * @brief CoAP message types (RFC 7252 section 3).
 */
enum class CoapType : uint8_t {
  CONFIRMABLE = 0,
  NON_CONFIRMABLE = 1,
  ACKNOWLEDGEMENT = 2,
  RESET = 3
};

const char* coapTypeName(CoapType type);

/** @brief Builds a code byte from its class and detail digits. */
constexpr uint8_t makeCoapCode(uint8_t codeClass, uint8_t detail) {
  return uint8_t((codeClass << 5) | detail);
}

namespace CoapCode {
const uint8_t EMPTY = makeCoapCode(0, 0);
const uint8_t GET = makeCoapCode(0, 1);
const uint8_t POST = makeCoapCode(0, 2);
const uint8_t PUT = makeCoapCode(0, 3);
const uint8_t DELETE = makeCoapCode(0, 4);
const uint8_t CREATED = makeCoapCode(2, 1);
const uint8_t DELETED = makeCoapCode(2, 2);
const uint8_t VALID = makeCoapCode(2, 3);
const uint8_t CHANGED = makeCoapCode(2, 4);
const uint8_t CONTENT = makeCoapCode(2, 5);
const uint8_t BAD_REQUEST = makeCoapCode(4, 0);
const uint8_t NOT_FOUND = makeCoapCode(4, 4);
const uint8_t METHOD_NOT_ALLOWED = makeCoapCode(4, 5);
const uint8_t INTERNAL_SERVER_ERROR = makeCoapCode(5, 0);
const uint8_t NOT_IMPLEMENTED = makeCoapCode(5, 1);
}  // namespace CoapCode

namespace CoapOption {
const uint16_t URI_PATH = 11;
const uint16_t CONTENT_FORMAT = 12;
const uint16_t URI_QUERY = 15;
const uint16_t BLOCK2 = 23;
}  // namespace CoapOption

namespace CoapContentFormat {
const uint32_t TEXT_PLAIN = 0;
const uint32_t LINK_FORMAT = 40;
const uint32_t OCTET_STREAM = 42;
const uint32_t JSON = 50;
const uint32_t CBOR = 60;
}  // namespace CoapContentFormat

/** @brief "2.05 Content" style rendering of a code byte. */
string coapCodeToString(uint8_t code);

/** @brief Media type name of a Content-Format value, or its number. */
string contentFormatName(uint32_t contentFormat);

/** @brief Minimal big-endian encoding used by uint options. */
string encodeCoapUint(uint32_t value);
uint32_t decodeCoapUint(const string& value);

/**
 * @brief Value of a Block1/Block2 option (RFC 7959).
 */
struct BlockOption {
  uint32_t num = 0;
  bool more = false;
  // Block size is 2^(szx + 4) bytes
  uint8_t szx = 6;

  size_t blockSize() const { return size_t(1) << (szx + 4); }
  string encode() const;
  static BlockOption decode(const string& value);
};

/**
 * @brief Thrown when bytes cannot be parsed as a CoAP message.
 */
class CoapParseException : public std::exception {
 public:
  explicit CoapParseException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

/**
 * @brief A structured message exchanged on the Slipmux CoAP channel.
 *
 * Options are kept in insertion order and sorted by number only when
 * serialized, so repeated options (Uri-Path segments) keep their relative
 * order.
 */
class CoapMessage {
 public:
  CoapMessage()
      : type(CoapType::CONFIRMABLE), code(CoapCode::EMPTY), messageId(0) {}
  CoapMessage(CoapType _type, uint8_t _code)
      : type(_type), code(_code), messageId(0) {}

  /**
   * @brief Decodes the RFC 7252 wire format.
   * @throws CoapParseException on any format error.
   */
  static CoapMessage parse(const string& bytes);

  /**
   * @brief Recovers type and message id from the fixed header of a message
   * that may otherwise be malformed.
   * @return false when fewer than 4 bytes are available.
   */
  static bool peekHeader(const string& bytes, CoapType* type,
                         uint16_t* messageId);

  string serialize() const;

  CoapType getType() const { return type; }
  void setType(CoapType _type) { type = _type; }
  uint8_t getCode() const { return code; }
  void setCode(uint8_t _code) { code = _code; }
  uint16_t getMessageId() const { return messageId; }
  void setMessageId(uint16_t id) { messageId = id; }
  const string& getToken() const { return token; }
  /** @throws std::runtime_error if the token is longer than 8 bytes. */
  void setToken(const string& _token);
  const string& getPayload() const { return payload; }
  void setPayload(const string& _payload) { payload = _payload; }

  bool isEmpty() const { return code == CoapCode::EMPTY; }
  bool isRequest() const { return (code >> 5) == 0 && code != 0; }
  bool isResponse() const { return (code >> 5) >= 2; }
  bool isError() const { return (code >> 5) >= 4; }

  void addOption(uint16_t number, const string& value);
  void removeOption(uint16_t number);
  /** @brief All values of option @p number in order. */
  vector<string> getOptions(uint16_t number) const;
  bool hasOption(uint16_t number) const;
  const vector<pair<uint16_t, string>>& getAllOptions() const {
    return options;
  }

  /**
   * @brief Replaces the Uri-Path options with the segments of @p path.  A
   * "?a=1&b" suffix becomes Uri-Query options.
   */
  void setPath(const string& path);
  /** @brief The Uri-Path as "/a/b", "/" when there are no segments. */
  string getPath() const;

  bool getContentFormat(uint32_t* contentFormat) const;
  void setContentFormat(uint32_t contentFormat);

  bool getBlock2(BlockOption* block) const;
  void setBlock2(const BlockOption& block);

  /** @brief Token as "0x..." hex for display. */
  string getTokenString() const;

  /** @brief One-line summary used in logs. */
  string summary() const;

 protected:
  CoapType type;
  uint8_t code;
  uint16_t messageId;
  string token;
  vector<pair<uint16_t, string>> options;
  string payload;
};
}  // namespace st

#endif  // __ST_COAP_MESSAGE__
