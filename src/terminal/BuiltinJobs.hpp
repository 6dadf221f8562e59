#ifndef __ST_BUILTIN_JOBS__
#define __ST_BUILTIN_JOBS__

#include "CommandJob.hpp"
#include "CommandLibrary.hpp"
#include "Headers.hpp"

namespace st {
/**
 * @brief Lists the resources of the device, one link per line.
 */
class WkcJob : public CommandJob {
 public:
  WkcJob() : CommandJob("Wkc") {}
  virtual CoapMessage start();
  virtual bool handle(const CoapMessage& response, CoapMessage* next);
  virtual vector<string> display() const { return links; }

 protected:
  vector<string> links;
};

/**
 * @brief Thread table of the device, read as CBOR from /jelly/Ps.
 *
 * The payload is [isr, threads] where isr is [stack size, used, free, base,
 * sp] and every thread is [pid, name, state, active, priority, stack size,
 * used, free, base, sp].
 */
class PsJob : public CommandJob {
 public:
  static const char* ENDPOINT;

  PsJob() : CommandJob("Ps") {}
  virtual CoapMessage start();
  virtual bool handle(const CoapMessage& response, CoapMessage* next);
  virtual vector<string> display() const { return table; }

  /** @brief RIOT thread_status_t as shown by the shell's ps. */
  static string threadStateName(uint32_t state);

 protected:
  vector<string> table;
};

/**
 * @brief Reads device memory through POST /Memory in chunks of at most 255
 * bytes.  Every request carries the CBOR array [address, length], every
 * response a CBOR byte string.
 */
class MemReadJob : public CommandJob {
 public:
  static const char* ENDPOINT;
  static constexpr uint32_t MAX_CHUNK = 255;

  MemReadJob(uint32_t _address, uint32_t _size);
  virtual CoapMessage start();
  virtual bool handle(const CoapMessage& response, CoapMessage* next);
  virtual vector<string> display() const;

  const string& getData() const { return data; }

  /**
   * @brief Parses "<address> <size>", address in decimal or 0x hex.
   * @throws std::runtime_error with the usage on bad arguments.
   */
  static shared_ptr<CommandJob> create(const vector<string>& args);

 protected:
  CoapMessage nextRequest();

  uint32_t address;
  uint32_t remaining;
  string data;
};

/** @brief Stores Wkc, Ps and MemRead in @p commands. */
void registerBuiltinJobs(CommandLibrary* commands);
}  // namespace st

#endif  // __ST_BUILTIN_JOBS__
