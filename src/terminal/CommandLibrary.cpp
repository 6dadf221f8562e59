#include "CommandLibrary.hpp"

namespace st {
namespace {
string trimTrailing(const string& s) {
  size_t end = s.find_last_not_of(" \t\r\n");
  if (end == string::npos) {
    return "";
  }
  return s.substr(0, end + 1);
}
}  // namespace

CommandLibrary::CommandLibrary() {
  add(Command("help", "List the available commands", CommandKind::LOCAL));
  add(Command("ForceCmdsAvailable",
              "Offer every built-in command, whatever the device lists",
              CommandKind::LOCAL));
  add(Command("/.well-known/core", "Query the resources of the device",
              CommandKind::COAP_RESOURCE, "/.well-known/core"));
}

bool CommandLibrary::add(const Command& command) {
  if (find(command.name)) {
    return false;
  }
  auto it = std::lower_bound(
      commands.begin(), commands.end(), command,
      [](const Command& a, const Command& b) { return a.name < b.name; });
  commands.insert(it, command);
  VLOG(1) << "Learned command " << command.name;
  return true;
}

void CommandLibrary::store(const Command& command) {
  stored.push_back(command);
}

int CommandLibrary::updateAvailable(const vector<string>& endpoints) {
  int moved = 0;
  for (auto it = stored.begin(); it != stored.end();) {
    bool satisfied = true;
    for (const auto& required : it->requiredEndpoints) {
      if (std::find(endpoints.begin(), endpoints.end(), required) ==
          endpoints.end()) {
        satisfied = false;
        break;
      }
    }
    if (satisfied) {
      add(*it);
      moved++;
      it = stored.erase(it);
    } else {
      ++it;
    }
  }
  return moved;
}

int CommandLibrary::forceAllAvailable() {
  int moved = 0;
  for (const auto& command : stored) {
    if (add(command)) {
      moved++;
    }
  }
  stored.clear();
  return moved;
}

const Command* CommandLibrary::find(const string& name) const {
  string cleaned = trimTrailing(name);
  for (const auto& command : commands) {
    if (command.name == cleaned) {
      return &command;
    }
  }
  return nullptr;
}

Command* CommandLibrary::findMutable(const string& name) {
  for (auto& command : commands) {
    if (command.name == name) {
      return &command;
    }
  }
  return nullptr;
}

bool CommandLibrary::updateDescription(const string& name,
                                       const string& description) {
  Command* command = findMutable(name);
  if (!command) {
    return false;
  }
  command->description = trimTrailing(description);
  return true;
}

vector<const Command*> CommandLibrary::matchingPrefix(
    const string& prefix) const {
  vector<const Command*> retval;
  for (const auto& command : commands) {
    if (command.name.compare(0, prefix.size(), prefix) == 0) {
      retval.push_back(&command);
    }
  }
  return retval;
}

string CommandLibrary::longestCommonPrefix(
    const string& prefix, vector<const Command*>* matches) const {
  *matches = matchingPrefix(prefix);
  if (matches->empty()) {
    return prefix;
  }
  string common = (*matches)[0]->name;
  for (const auto* command : *matches) {
    size_t length = 0;
    while (length < common.size() && length < command->name.size() &&
           common[length] == command->name[length]) {
      length++;
    }
    common.resize(length);
  }
  return common;
}

vector<string> CommandLibrary::helpText() const {
  size_t width = 0;
  for (const auto& command : commands) {
    width = max(width, command.name.size());
  }
  vector<string> lines;
  for (const auto& command : commands) {
    string line = command.name;
    line.append(width + 2 - command.name.size(), ' ');
    line += command.description;
    lines.push_back(line);
  }
  return lines;
}
}  // namespace st
