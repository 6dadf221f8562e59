#include "CoapMessage.hpp"

namespace st {
namespace {
const uint8_t COAP_VERSION = 1;
const uint8_t PAYLOAD_MARKER = 0xFF;
const size_t MAX_TOKEN_LENGTH = 8;

// Reads the extended delta/length that follows an option header nibble
uint32_t readOptionNibble(uint8_t nibble, const string& bytes, size_t* pos) {
  if (nibble < 13) {
    return nibble;
  }
  if (nibble == 13) {
    if (*pos + 1 > bytes.size()) {
      throw CoapParseException("Truncated option extension");
    }
    uint32_t value = uint8_t(bytes[*pos]) + 13;
    *pos += 1;
    return value;
  }
  if (nibble == 14) {
    if (*pos + 2 > bytes.size()) {
      throw CoapParseException("Truncated option extension");
    }
    uint32_t value =
        ((uint32_t(uint8_t(bytes[*pos])) << 8) | uint8_t(bytes[*pos + 1])) +
        269;
    *pos += 2;
    return value;
  }
  throw CoapParseException("Reserved option nibble 15");
}

void writeOptionNibble(uint32_t value, uint8_t* nibble, string* extension) {
  if (value < 13) {
    *nibble = uint8_t(value);
  } else if (value < 269) {
    *nibble = 13;
    *extension += char(value - 13);
  } else {
    *nibble = 14;
    uint32_t extended = value - 269;
    *extension += char((extended >> 8) & 0xFF);
    *extension += char(extended & 0xFF);
  }
}
}  // namespace

const char* coapTypeName(CoapType type) {
  switch (type) {
    case CoapType::CONFIRMABLE:
      return "CON";
    case CoapType::NON_CONFIRMABLE:
      return "NON";
    case CoapType::ACKNOWLEDGEMENT:
      return "ACK";
    case CoapType::RESET:
      return "RST";
  }
  return "???";
}

string coapCodeToString(uint8_t code) {
  static const map<uint8_t, string> names = {
      {CoapCode::EMPTY, "Empty"},
      {CoapCode::GET, "GET"},
      {CoapCode::POST, "POST"},
      {CoapCode::PUT, "PUT"},
      {CoapCode::DELETE, "DELETE"},
      {CoapCode::CREATED, "Created"},
      {CoapCode::DELETED, "Deleted"},
      {CoapCode::VALID, "Valid"},
      {CoapCode::CHANGED, "Changed"},
      {CoapCode::CONTENT, "Content"},
      {makeCoapCode(2, 31), "Continue"},
      {CoapCode::BAD_REQUEST, "Bad Request"},
      {makeCoapCode(4, 1), "Unauthorized"},
      {makeCoapCode(4, 2), "Bad Option"},
      {makeCoapCode(4, 3), "Forbidden"},
      {CoapCode::NOT_FOUND, "Not Found"},
      {CoapCode::METHOD_NOT_ALLOWED, "Method Not Allowed"},
      {makeCoapCode(4, 6), "Not Acceptable"},
      {makeCoapCode(4, 8), "Request Entity Incomplete"},
      {makeCoapCode(4, 12), "Precondition Failed"},
      {makeCoapCode(4, 13), "Request Entity Too Large"},
      {makeCoapCode(4, 15), "Unsupported Content-Format"},
      {CoapCode::INTERNAL_SERVER_ERROR, "Internal Server Error"},
      {CoapCode::NOT_IMPLEMENTED, "Not Implemented"},
      {makeCoapCode(5, 2), "Bad Gateway"},
      {makeCoapCode(5, 3), "Service Unavailable"},
      {makeCoapCode(5, 4), "Gateway Timeout"},
      {makeCoapCode(5, 5), "Proxying Not Supported"},
  };
  std::ostringstream ss;
  ss << int(code >> 5) << "." << std::setw(2) << std::setfill('0')
     << int(code & 0x1F);
  auto it = names.find(code);
  if (it != names.end()) {
    ss << " " << it->second;
  }
  return ss.str();
}

string contentFormatName(uint32_t contentFormat) {
  switch (contentFormat) {
    case CoapContentFormat::TEXT_PLAIN:
      return "text/plain";
    case CoapContentFormat::LINK_FORMAT:
      return "application/link-format";
    case CoapContentFormat::OCTET_STREAM:
      return "application/octet-stream";
    case CoapContentFormat::JSON:
      return "application/json";
    case CoapContentFormat::CBOR:
      return "application/cbor";
    default:
      return to_string(contentFormat);
  }
}

string encodeCoapUint(uint32_t value) {
  string s;
  while (value) {
    s.insert(s.begin(), char(value & 0xFF));
    value >>= 8;
  }
  return s;
}

uint32_t decodeCoapUint(const string& value) {
  if (value.size() > 4) {
    throw CoapParseException("uint option longer than 4 bytes");
  }
  uint32_t result = 0;
  for (char c : value) {
    result = (result << 8) | uint8_t(c);
  }
  return result;
}

string BlockOption::encode() const {
  if (szx > 6) {
    throw std::runtime_error("Block size exponent out of range");
  }
  return encodeCoapUint((num << 4) | (more ? 0x08 : 0x00) | szx);
}

BlockOption BlockOption::decode(const string& value) {
  if (value.size() > 3) {
    throw CoapParseException("Block option longer than 3 bytes");
  }
  uint32_t raw = decodeCoapUint(value);
  BlockOption block;
  block.num = raw >> 4;
  block.more = (raw & 0x08) != 0;
  block.szx = uint8_t(raw & 0x07);
  if (block.szx == 7) {
    throw CoapParseException("Reserved block size exponent");
  }
  return block;
}

CoapMessage CoapMessage::parse(const string& bytes) {
  if (bytes.size() < 4) {
    throw CoapParseException("Message shorter than the 4 byte header");
  }
  uint8_t first = uint8_t(bytes[0]);
  if ((first >> 6) != COAP_VERSION) {
    throw CoapParseException("Unsupported CoAP version " +
                             to_string(first >> 6));
  }
  CoapMessage msg;
  msg.type = CoapType((first >> 4) & 0x03);
  size_t tokenLength = first & 0x0F;
  if (tokenLength > MAX_TOKEN_LENGTH) {
    throw CoapParseException("Token length " + to_string(tokenLength) +
                             " is reserved");
  }
  msg.code = uint8_t(bytes[1]);
  msg.messageId = uint16_t((uint8_t(bytes[2]) << 8) | uint8_t(bytes[3]));
  if (msg.code == CoapCode::EMPTY && bytes.size() != 4) {
    throw CoapParseException("Empty message with trailing bytes");
  }
  if (bytes.size() < 4 + tokenLength) {
    throw CoapParseException("Truncated token");
  }
  msg.token = bytes.substr(4, tokenLength);

  size_t pos = 4 + tokenLength;
  uint32_t lastNumber = 0;
  while (pos < bytes.size()) {
    uint8_t header = uint8_t(bytes[pos]);
    pos++;
    if (header == PAYLOAD_MARKER) {
      if (pos == bytes.size()) {
        throw CoapParseException("Payload marker without payload");
      }
      msg.payload = bytes.substr(pos);
      break;
    }
    uint32_t delta = readOptionNibble(header >> 4, bytes, &pos);
    uint32_t length = readOptionNibble(header & 0x0F, bytes, &pos);
    if (pos + length > bytes.size()) {
      throw CoapParseException("Truncated option value");
    }
    uint32_t number = lastNumber + delta;
    if (number > 0xFFFF) {
      throw CoapParseException("Option number out of range");
    }
    msg.options.push_back(
        make_pair(uint16_t(number), bytes.substr(pos, length)));
    pos += length;
    lastNumber = number;
  }
  return msg;
}

bool CoapMessage::peekHeader(const string& bytes, CoapType* type,
                             uint16_t* messageId) {
  if (bytes.size() < 4) {
    return false;
  }
  *type = CoapType((uint8_t(bytes[0]) >> 4) & 0x03);
  *messageId = uint16_t((uint8_t(bytes[2]) << 8) | uint8_t(bytes[3]));
  return true;
}

string CoapMessage::serialize() const {
  string s;
  s += char((COAP_VERSION << 6) | (uint8_t(type) << 4) | token.size());
  s += char(code);
  s += char(messageId >> 8);
  s += char(messageId & 0xFF);
  s += token;

  vector<pair<uint16_t, string>> sorted = options;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const pair<uint16_t, string>& a,
                      const pair<uint16_t, string>& b) {
                     return a.first < b.first;
                   });
  uint16_t lastNumber = 0;
  for (const auto& option : sorted) {
    uint8_t deltaNibble, lengthNibble;
    string deltaExtension, lengthExtension;
    writeOptionNibble(option.first - lastNumber, &deltaNibble,
                      &deltaExtension);
    writeOptionNibble(option.second.size(), &lengthNibble, &lengthExtension);
    s += char((deltaNibble << 4) | lengthNibble);
    s += deltaExtension;
    s += lengthExtension;
    s += option.second;
    lastNumber = option.first;
  }

  if (!payload.empty()) {
    s += char(PAYLOAD_MARKER);
    s += payload;
  }
  return s;
}

void CoapMessage::setToken(const string& _token) {
  if (_token.size() > MAX_TOKEN_LENGTH) {
    throw std::runtime_error("CoAP tokens are at most 8 bytes");
  }
  token = _token;
}

void CoapMessage::addOption(uint16_t number, const string& value) {
  options.push_back(make_pair(number, value));
}

void CoapMessage::removeOption(uint16_t number) {
  options.erase(std::remove_if(options.begin(), options.end(),
                               [number](const pair<uint16_t, string>& o) {
                                 return o.first == number;
                               }),
                options.end());
}

vector<string> CoapMessage::getOptions(uint16_t number) const {
  vector<string> values;
  for (const auto& option : options) {
    if (option.first == number) {
      values.push_back(option.second);
    }
  }
  return values;
}

bool CoapMessage::hasOption(uint16_t number) const {
  for (const auto& option : options) {
    if (option.first == number) {
      return true;
    }
  }
  return false;
}

void CoapMessage::setPath(const string& path) {
  removeOption(CoapOption::URI_PATH);
  removeOption(CoapOption::URI_QUERY);
  size_t queryStart = path.find('?');
  for (const auto& segment : split(path.substr(0, queryStart), '/')) {
    if (!segment.empty()) {
      addOption(CoapOption::URI_PATH, segment);
    }
  }
  if (queryStart != string::npos) {
    for (const auto& argument : split(path.substr(queryStart + 1), '&')) {
      if (!argument.empty()) {
        addOption(CoapOption::URI_QUERY, argument);
      }
    }
  }
}

string CoapMessage::getPath() const {
  string path;
  for (const auto& segment : getOptions(CoapOption::URI_PATH)) {
    path += "/" + segment;
  }
  if (path.empty()) {
    path = "/";
  }
  return path;
}

bool CoapMessage::getContentFormat(uint32_t* contentFormat) const {
  vector<string> values = getOptions(CoapOption::CONTENT_FORMAT);
  if (values.empty()) {
    return false;
  }
  *contentFormat = decodeCoapUint(values[0]);
  return true;
}

void CoapMessage::setContentFormat(uint32_t contentFormat) {
  removeOption(CoapOption::CONTENT_FORMAT);
  addOption(CoapOption::CONTENT_FORMAT, encodeCoapUint(contentFormat));
}

bool CoapMessage::getBlock2(BlockOption* block) const {
  vector<string> values = getOptions(CoapOption::BLOCK2);
  if (values.empty()) {
    return false;
  }
  *block = BlockOption::decode(values[0]);
  return true;
}

void CoapMessage::setBlock2(const BlockOption& block) {
  removeOption(CoapOption::BLOCK2);
  addOption(CoapOption::BLOCK2, block.encode());
}

string CoapMessage::getTokenString() const {
  static const char digits[] = "0123456789abcdef";
  string s = "0x";
  for (char c : token) {
    s += digits[uint8_t(c) >> 4];
    s += digits[uint8_t(c) & 0x0f];
  }
  return s;
}

string CoapMessage::summary() const {
  std::ostringstream ss;
  ss << coapTypeName(type) << " " << coapCodeToString(code) << " mid="
     << messageId << " token=" << getTokenString();
  if (isRequest()) {
    ss << " " << getPath();
  }
  if (!payload.empty()) {
    ss << " (" << payload.size() << " bytes)";
  }
  return ss.str();
}
}  // namespace st
