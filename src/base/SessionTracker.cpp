#include "SessionTracker.hpp"

namespace st {
const char* exchangeOutcomeName(ExchangeOutcome outcome) {
  switch (outcome) {
    case ExchangeOutcome::MATCHED:
      return "matched";
    case ExchangeOutcome::EXPIRED:
      return "expired";
    case ExchangeOutcome::REJECTED:
      return "rejected";
  }
  return "unknown";
}

SessionTracker::SessionTracker(std::chrono::milliseconds _timeout,
                               uint16_t initialMessageId,
                               uint16_t initialToken)
    : timeout(_timeout),
      messageIdCounter(initialMessageId),
      tokenCounter(initialToken),
      nextExchangeId(1),
      resetsSent(0),
      notFoundSent(0) {}

ExchangeId SessionTracker::sendRequest(CoapMessage request,
                                       SteadyClock::time_point now) {
  if (!request.isRequest()) {
    throw std::runtime_error("Only requests start an exchange, got " +
                             coapCodeToString(request.getCode()));
  }
  if (request.getType() != CoapType::CONFIRMABLE &&
      request.getType() != CoapType::NON_CONFIRMABLE) {
    throw std::runtime_error("Requests must be CON or NON");
  }
  if (request.getToken().empty()) {
    request.setToken(nextToken());
  } else if (tokenInUse(request.getToken())) {
    throw std::runtime_error("Token " + request.getTokenString() +
                             " belongs to an outstanding exchange");
  }
  request.setMessageId(nextMessageId());

  Exchange exchange;
  exchange.id = nextExchangeId++;
  exchange.request = request;
  exchange.created = now;
  exchange.state = ExchangeState::AWAITING_RESPONSE;
  exchange.acknowledged = false;
  exchanges.insert(make_pair(exchange.id, exchange));

  VLOG(1) << "Exchange " << exchange.id << " started: " << request.summary();
  queue(request);
  return exchange.id;
}

void SessionTracker::handleIncoming(const string& bytes,
                                    SteadyClock::time_point now) {
  CoapMessage msg;
  try {
    msg = CoapMessage::parse(bytes);
  } catch (const CoapParseException& cpe) {
    CoapType type;
    uint16_t messageId;
    if (CoapMessage::peekHeader(bytes, &type, &messageId) &&
        (type == CoapType::CONFIRMABLE ||
         type == CoapType::NON_CONFIRMABLE)) {
      queueReset(messageId, string("malformed message: ") + cpe.what());
    } else {
      LOG(WARNING) << "Dropping malformed CoAP message (" << bytes.size()
                   << " bytes): " << cpe.what();
    }
    return;
  }
  VLOG(2) << "Incoming " << msg.summary();

  switch (msg.getType()) {
    case CoapType::ACKNOWLEDGEMENT:
      handleAcknowledgement(msg);
      break;
    case CoapType::RESET:
      handleReset(msg);
      break;
    case CoapType::CONFIRMABLE:
    case CoapType::NON_CONFIRMABLE:
      if (msg.isEmpty()) {
        // CoAP ping, answered with a Reset
        queueReset(msg.getMessageId(), "empty message");
      } else if (msg.isRequest()) {
        handleRequest(msg);
      } else if (msg.isResponse()) {
        handleSeparateResponse(msg);
      } else {
        queueReset(msg.getMessageId(),
                   "reserved code " + coapCodeToString(msg.getCode()));
      }
      break;
  }
}

void SessionTracker::tick(SteadyClock::time_point now) {
  auto it = exchanges.begin();
  while (it != exchanges.end()) {
    auto current = it++;
    Exchange& exchange = current->second;
    if (exchange.state == ExchangeState::AWAITING_RESPONSE &&
        now - exchange.created >= timeout) {
      LOG(INFO) << "Exchange " << exchange.id << " expired: "
                << exchange.request.summary();
      exchange.state = ExchangeState::EXPIRED;
      complete(current, ExchangeOutcome::EXPIRED, CoapMessage());
    }
  }
}

bool SessionTracker::cancel(ExchangeId id) {
  auto it = exchanges.find(id);
  if (it == exchanges.end()) {
    return false;
  }
  VLOG(1) << "Exchange " << id << " cancelled";
  exchanges.erase(it);
  return true;
}

vector<string> SessionTracker::takeOutgoing() {
  vector<string> retval(outgoing.begin(), outgoing.end());
  outgoing.clear();
  return retval;
}

vector<ExchangeEvent> SessionTracker::takeEvents() {
  vector<ExchangeEvent> retval;
  retval.swap(events);
  return retval;
}

void SessionTracker::registerResource(const string& path,
                                      ResourceHandler handler) {
  CoapMessage normalized;
  normalized.setPath(path);
  resources[normalized.getPath()] = handler;
}

const Exchange* SessionTracker::getExchange(ExchangeId id) const {
  auto it = exchanges.find(id);
  if (it == exchanges.end()) {
    return nullptr;
  }
  return &(it->second);
}

uint16_t SessionTracker::nextMessageId() { return messageIdCounter++; }

string SessionTracker::nextToken() {
  // Two byte little endian counter, skipping tokens still in flight
  string token;
  do {
    tokenCounter++;
    token = string(2, '\0');
    token[0] = char(tokenCounter & 0xFF);
    token[1] = char(tokenCounter >> 8);
  } while (tokenInUse(token));
  return token;
}

bool SessionTracker::tokenInUse(const string& token) const {
  for (const auto& it : exchanges) {
    if (it.second.request.getToken() == token) {
      return true;
    }
  }
  return false;
}

map<ExchangeId, Exchange>::iterator SessionTracker::findByMessageId(
    uint16_t messageId) {
  for (auto it = exchanges.begin(); it != exchanges.end(); ++it) {
    if (it->second.request.getMessageId() == messageId) {
      return it;
    }
  }
  return exchanges.end();
}

map<ExchangeId, Exchange>::iterator SessionTracker::findByToken(
    const string& token) {
  for (auto it = exchanges.begin(); it != exchanges.end(); ++it) {
    if (it->second.request.getToken() == token) {
      return it;
    }
  }
  return exchanges.end();
}

void SessionTracker::handleAcknowledgement(const CoapMessage& msg) {
  auto it = findByMessageId(msg.getMessageId());
  if (it == exchanges.end()) {
    // A Reset cannot answer an ACK
    LOG(INFO) << "Ignoring unmatched acknowledgement: " << msg.summary();
    return;
  }
  Exchange& exchange = it->second;
  if (msg.isEmpty()) {
    VLOG(1) << "Exchange " << exchange.id
            << " acknowledged, waiting for separate response";
    exchange.acknowledged = true;
    return;
  }
  if (!msg.isResponse()) {
    LOG(WARNING) << "Acknowledgement carries a non-response code: "
                 << msg.summary();
    return;
  }
  if (msg.getToken() != exchange.request.getToken()) {
    LOG(WARNING) << "Piggybacked response token " << msg.getTokenString()
                 << " does not match request token "
                 << exchange.request.getTokenString();
    return;
  }
  complete(it, ExchangeOutcome::MATCHED, msg);
}

void SessionTracker::handleReset(const CoapMessage& msg) {
  auto it = findByMessageId(msg.getMessageId());
  if (it == exchanges.end()) {
    LOG(INFO) << "Ignoring unmatched reset: " << msg.summary();
    return;
  }
  LOG(WARNING) << "Peer reset exchange " << it->second.id << ": "
               << it->second.request.summary();
  complete(it, ExchangeOutcome::REJECTED, msg);
}

void SessionTracker::handleSeparateResponse(const CoapMessage& msg) {
  auto it = findByToken(msg.getToken());
  if (it == exchanges.end()) {
    queueReset(msg.getMessageId(),
               "unmatched response token " + msg.getTokenString());
    return;
  }
  if (msg.getType() == CoapType::CONFIRMABLE) {
    CoapMessage ack(CoapType::ACKNOWLEDGEMENT, CoapCode::EMPTY);
    ack.setMessageId(msg.getMessageId());
    queue(ack);
  }
  complete(it, ExchangeOutcome::MATCHED, msg);
}

void SessionTracker::handleRequest(const CoapMessage& msg) {
  CoapMessage response(CoapType::ACKNOWLEDGEMENT, CoapCode::NOT_FOUND);
  auto it = resources.find(msg.getPath());
  bool handled = false;
  if (it != resources.end()) {
    handled = it->second(msg, &response);
  }
  if (!handled) {
    LOG(INFO) << "No local resource for " << msg.summary()
              << ", answering 4.04";
    response = CoapMessage(CoapType::ACKNOWLEDGEMENT, CoapCode::NOT_FOUND);
    notFoundSent++;
  }
  if (msg.getType() == CoapType::CONFIRMABLE) {
    response.setType(CoapType::ACKNOWLEDGEMENT);
    response.setMessageId(msg.getMessageId());
  } else {
    response.setType(CoapType::NON_CONFIRMABLE);
    response.setMessageId(nextMessageId());
  }
  response.setToken(msg.getToken());
  queue(response);
}

void SessionTracker::complete(map<ExchangeId, Exchange>::iterator it,
                              ExchangeOutcome outcome,
                              const CoapMessage& response) {
  Exchange& exchange = it->second;
  if (outcome == ExchangeOutcome::MATCHED) {
    exchange.state = ExchangeState::MATCHED;
    VLOG(1) << "Exchange " << exchange.id << " matched by "
            << response.summary();
  }
  ExchangeEvent event;
  event.id = exchange.id;
  event.outcome = outcome;
  event.request = exchange.request;
  event.response = response;
  events.push_back(event);
  exchanges.erase(it);
}

void SessionTracker::queueReset(uint16_t messageId, const string& reason) {
  LOG(WARNING) << "Sending reset for message id " << messageId << ": "
               << reason;
  CoapMessage reset(CoapType::RESET, CoapCode::EMPTY);
  reset.setMessageId(messageId);
  queue(reset);
  resetsSent++;
}

void SessionTracker::queue(const CoapMessage& msg) {
  VLOG(2) << "Outgoing " << msg.summary();
  outgoing.push_back(msg.serialize());
}
}  // namespace st
