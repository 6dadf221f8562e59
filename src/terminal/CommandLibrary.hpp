#ifndef __ST_COMMAND_LIBRARY__
#define __ST_COMMAND_LIBRARY__

#include "CommandJob.hpp"
#include "Headers.hpp"

namespace st {
enum class CommandKind {
  /** @brief Handled by slipterm itself, e.g. help. */
  LOCAL,
  /** @brief A RIOT shell command, sent as diagnostic text. */
  SHELL,
  /** @brief A CoAP resource, fetched with GET. */
  COAP_RESOURCE,
  /** @brief A built-in job that runs one or more exchanges. */
  JOB
};

/**
 * @brief Builds the job for one invocation.
 * @param args The words typed after the command name.
 * @throws std::runtime_error with a usage message on bad arguments.
 */
typedef std::function<shared_ptr<CommandJob>(const vector<string>& args)>
    JobFactory;

struct Command {
  string name;
  string description;
  CommandKind kind;
  /** @brief Uri-Path of the resource for COAP_RESOURCE, else empty. */
  string endpoint;
  /** @brief Resources the device must list before a JOB is offered. */
  vector<string> requiredEndpoints;
  JobFactory factory;

  Command() : kind(CommandKind::LOCAL) {}
  Command(const string& _name, const string& _description, CommandKind _kind,
          const string& _endpoint = "")
      : name(_name),
        description(_description),
        kind(_kind),
        endpoint(_endpoint) {}
  Command(const string& _name, const string& _description,
          const vector<string>& _requiredEndpoints, JobFactory _factory)
      : name(_name),
        description(_description),
        kind(CommandKind::JOB),
        requiredEndpoints(_requiredEndpoints),
        factory(_factory) {}
};

/**
 * @brief The commands the user can type, kept sorted by name.  Starts with
 * help, ForceCmdsAvailable and /.well-known/core; the rest is learned from
 * the device.
 *
 * Built-in jobs are stored aside until the device lists every endpoint they
 * need (or the user forces them in).
 */
class CommandLibrary {
 public:
  CommandLibrary();

  /** @return false if a command with the same name exists. */
  bool add(const Command& command);

  /** @brief Keeps a JOB back until its endpoints are known. */
  void store(const Command& command);

  /**
   * @brief Makes every stored command whose required endpoints are all in
   * @p endpoints available.
   * @return Number of commands that became available.
   */
  int updateAvailable(const vector<string>& endpoints);

  /** @brief Makes all stored commands available regardless of endpoints. */
  int forceAllAvailable();

  const vector<Command>& getStored() const { return stored; }

  /** @brief Exact lookup, ignoring trailing whitespace in @p name. */
  const Command* find(const string& name) const;

  bool updateDescription(const string& name, const string& description);

  vector<const Command*> matchingPrefix(const string& prefix) const;

  /**
   * @brief Extends @p prefix as far as all matching commands agree.
   *
   * With a single match the result is the full command name, with no match
   * it is @p prefix unchanged.
   */
  string longestCommonPrefix(const string& prefix,
                             vector<const Command*>* matches) const;

  const vector<Command>& list() const { return commands; }

  /** @brief One line per command, name padded to a column. */
  vector<string> helpText() const;

 protected:
  Command* findMutable(const string& name);

  vector<Command> commands;
  vector<Command> stored;
};
}  // namespace st

#endif  // __ST_COMMAND_LIBRARY__
