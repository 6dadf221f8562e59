#ifndef __ST_COMMAND_JOB__
#define __ST_COMMAND_JOB__

#include "CoapMessage.hpp"
#include "Headers.hpp"

namespace st {
/**
 * @brief A built-in command that talks to the device through one or more
 * request/response exchanges.
 *
 * The session sends start(), then feeds every matched response to handle()
 * until it stops asking for another request, and finally shows display().
 */
class CommandJob {
 public:
  explicit CommandJob(const string& _name) : name(_name) {}
  virtual ~CommandJob() {}

  /** @brief The first request.  Called exactly once. */
  virtual CoapMessage start() = 0;

  /**
   * @brief Consumes the response to the last request.
   * @return true if @p next was filled with another request to send.
   * @throws CoapParseException or nlohmann::json::exception when the payload
   * cannot be decoded.
   */
  virtual bool handle(const CoapMessage& response, CoapMessage* next) = 0;

  /** @brief The result, one Terminal Line each. */
  virtual vector<string> display() const = 0;

  const string& getName() const { return name; }

 protected:
  string name;
};
}  // namespace st

#endif  // __ST_COMMAND_JOB__
