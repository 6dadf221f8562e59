#ifndef __ST_SESSION_TRACKER__
#define __ST_SESSION_TRACKER__

#include "CoapMessage.hpp"
#include "Headers.hpp"

namespace st {
typedef uint64_t ExchangeId;

enum class ExchangeState { AWAITING_RESPONSE, MATCHED, EXPIRED };

/**
 * @brief How an exchange left the outstanding set.
 */
enum class ExchangeOutcome {
  /** @brief A piggybacked or separate response arrived. */
  MATCHED,
  /** @brief No response before the deadline. */
  EXPIRED,
  /** @brief The peer answered the request with a Reset. */
  REJECTED
};

const char* exchangeOutcomeName(ExchangeOutcome outcome);

/**
 * @brief One locally initiated request that is still waiting for an answer.
 */
struct Exchange {
  ExchangeId id;
  CoapMessage request;
  SteadyClock::time_point created;
  ExchangeState state;
  /** @brief An empty ACK arrived, a separate response is pending. */
  bool acknowledged;
};

/**
 * @brief Notification that an exchange finished, delivered exactly once.
 */
struct ExchangeEvent {
  ExchangeId id;
  ExchangeOutcome outcome;
  CoapMessage request;
  /** @brief The response (or the Reset) for MATCHED and REJECTED. */
  CoapMessage response;
};

/**
 * @brief Answers a request from the peer for a locally served path.
 * @return false to fall back to 4.04 Not Found.
 */
typedef std::function<bool(const CoapMessage& request, CoapMessage* response)>
    ResourceHandler;

/**
 * @brief Tracks CoAP exchanges on the serial session and polices the peer.
 *
 * Every message the tracker wants on the wire (requests, Resets, Not Found
 * replies, ACKs for separate responses) is queued as serialized CoAP and
 * collected with takeOutgoing().  The tracker never throws on peer input.
 */
class SessionTracker {
 public:
  SessionTracker(std::chrono::milliseconds _timeout, uint16_t initialMessageId,
                 uint16_t initialToken = 0);

  /**
   * @brief Starts an exchange for @p request and queues it for sending.
   *
   * The message id is always assigned here, replacing whatever the caller
   * set.  A token is assigned unless the request already carries one; a
   * caller supplied token must not collide with an outstanding exchange.
   * @throws std::runtime_error if @p request is not a CON or NON request.
   */
  ExchangeId sendRequest(CoapMessage request, SteadyClock::time_point now);

  /** @brief Processes one Structured-Message payload from the peer. */
  void handleIncoming(const string& bytes, SteadyClock::time_point now);

  /** @brief Expires every exchange whose deadline passed. */
  void tick(SteadyClock::time_point now);

  /**
   * @brief Drops an outstanding exchange without notifying anybody.
   * @return false if @p id is not outstanding.
   */
  bool cancel(ExchangeId id);

  /** @brief Serialized CoAP messages to send, in order. */
  vector<string> takeOutgoing();

  /** @brief Finished exchanges since the last call, in order. */
  vector<ExchangeEvent> takeEvents();

  void registerResource(const string& path, ResourceHandler handler);

  size_t outstandingCount() const { return exchanges.size(); }
  bool isOutstanding(ExchangeId id) const {
    return exchanges.find(id) != exchanges.end();
  }
  /** @return nullptr when @p id is not outstanding. */
  const Exchange* getExchange(ExchangeId id) const;

  std::chrono::milliseconds getTimeout() const { return timeout; }
  int64_t getResetsSent() const { return resetsSent; }
  int64_t getNotFoundSent() const { return notFoundSent; }

 protected:
  uint16_t nextMessageId();
  string nextToken();
  bool tokenInUse(const string& token) const;

  map<ExchangeId, Exchange>::iterator findByMessageId(uint16_t messageId);
  map<ExchangeId, Exchange>::iterator findByToken(const string& token);

  void handleAcknowledgement(const CoapMessage& msg);
  void handleReset(const CoapMessage& msg);
  void handleSeparateResponse(const CoapMessage& msg);
  void handleRequest(const CoapMessage& msg);

  void complete(map<ExchangeId, Exchange>::iterator it,
                ExchangeOutcome outcome, const CoapMessage& response);
  void queueReset(uint16_t messageId, const string& reason);
  void queue(const CoapMessage& msg);

  std::chrono::milliseconds timeout;
  uint16_t messageIdCounter;
  uint16_t tokenCounter;
  ExchangeId nextExchangeId;
  map<ExchangeId, Exchange> exchanges;
  map<string, ResourceHandler> resources;
  deque<string> outgoing;
  vector<ExchangeEvent> events;
  int64_t resetsSent;
  int64_t notFoundSent;
};
}  // namespace st

#endif  // __ST_SESSION_TRACKER__
