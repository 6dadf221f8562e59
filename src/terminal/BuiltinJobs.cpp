#include "BuiltinJobs.hpp"

#include "JsonLib.hpp"

namespace st {
namespace {
string hex32(uint32_t value) {
  char buffer[16];
  snprintf(buffer, sizeof(buffer), "0x%08x", value);
  return string(buffer);
}

string payloadText(const CoapMessage& response) {
  if (response.isError()) {
    throw std::runtime_error("device answered " +
                             coapCodeToString(response.getCode()));
  }
  return response.getPayload();
}

const char* THREAD_STATES[] = {
    "stopped",  "zombie",   "sleeping", "bl mutex", "bl rx",
    "bl send",  "bl reply", "bl anyfl", "bl allfl", "bl mbox",
    "bl cond",  "running",  "pending",
};
}  // namespace

CoapMessage WkcJob::start() {
  CoapMessage request(CoapType::CONFIRMABLE, CoapCode::GET);
  request.setPath("/.well-known/core");
  return request;
}

bool WkcJob::handle(const CoapMessage& response, CoapMessage* next) {
  for (const auto& link : split(payloadText(response), ',')) {
    links.push_back(link);
  }
  return false;
}

const char* PsJob::ENDPOINT = "/jelly/Ps";

string PsJob::threadStateName(uint32_t state) {
  if (state < sizeof(THREAD_STATES) / sizeof(THREAD_STATES[0])) {
    return THREAD_STATES[state];
  }
  return "numof";
}

CoapMessage PsJob::start() {
  CoapMessage request(CoapType::CONFIRMABLE, CoapCode::GET);
  request.setPath(ENDPOINT);
  return request;
}

bool PsJob::handle(const CoapMessage& response, CoapMessage* next) {
  string payload = payloadText(response);
  json root = json::from_cbor(payload.begin(), payload.end());
  const json& isr = root.at(0);
  const json& threads = root.at(1);

  std::ostringstream ss;
  ss << std::setw(3) << "pid" << " | " << std::left << std::setw(20) << "name"
     << " | " << std::setw(8) << "state" << " Q | pri | " << std::right
     << std::setw(6) << "stack" << " " << std::setw(6) << "(used)" << " "
     << std::setw(6) << "(free)" << " | base addr  | sp";
  table.push_back(ss.str());

  uint32_t sumSize = 0;
  uint32_t sumUsed = 0;
  uint32_t sumFree = 0;
  auto addRow = [&](const string& pid, const string& threadName,
                    const string& state, const string& active,
                    const string& priority, const json& stack) {
    uint32_t size = stack.at(0).get<uint32_t>();
    uint32_t used = stack.at(1).get<uint32_t>();
    uint32_t freeBytes = stack.at(2).get<uint32_t>();
    std::ostringstream row;
    row << std::setw(3) << pid << " | " << std::left << std::setw(20)
        << threadName << " | " << std::setw(8) << state << " " << active
        << " | " << std::right << std::setw(3) << priority << " | "
        << std::setw(6) << size << " " << std::setw(6) << used << " "
        << std::setw(6) << freeBytes << " | " << hex32(stack.at(3).get<uint32_t>())
        << " | " << hex32(stack.at(4).get<uint32_t>());
    table.push_back(row.str());
    sumSize += size;
    sumUsed += used;
    sumFree += freeBytes;
  };

  addRow("-", "isr_stack", "-", "-", "-", isr);
  for (const auto& thread : threads) {
    json stack = json::array();
    for (size_t a = 5; a < 10; a++) {
      stack.push_back(thread.at(a));
    }
    addRow(to_string(thread.at(0).get<uint32_t>()),
           thread.at(1).get<string>(),
           threadStateName(thread.at(2).get<uint32_t>()),
           thread.at(3).get<bool>() ? "\xE2\x9C\x94" : "\xE2\x9C\x95",
           to_string(thread.at(4).get<uint32_t>()), stack);
  }

  std::ostringstream sum;
  sum << std::setw(3) << " " << " | " << std::left << std::setw(20) << "SUM"
      << " | " << std::setw(8) << " " << "   | " << std::right << std::setw(3)
      << " " << " | " << std::setw(6) << sumSize << " " << std::setw(6)
      << sumUsed << " " << std::setw(6) << sumFree;
  table.push_back(sum.str());
  return false;
}

const char* MemReadJob::ENDPOINT = "/Memory";

MemReadJob::MemReadJob(uint32_t _address, uint32_t _size)
    : CommandJob("MemRead"), address(_address), remaining(_size) {}

shared_ptr<CommandJob> MemReadJob::create(const vector<string>& args) {
  static const string usage = "usage: MemRead <address> <size>";
  if (args.size() != 2) {
    throw std::runtime_error(usage);
  }
  unsigned long parsed[2];
  for (int a = 0; a < 2; a++) {
    try {
      size_t used = 0;
      parsed[a] = std::stoul(args[a], &used, 0);
      if (used != args[a].size() || parsed[a] > 0xFFFFFFFFul) {
        throw std::runtime_error(usage);
      }
    } catch (const std::logic_error&) {
      throw std::runtime_error(usage);
    }
  }
  if (parsed[1] == 0) {
    throw std::runtime_error(usage + " (size must be positive)");
  }
  return shared_ptr<CommandJob>(
      new MemReadJob(uint32_t(parsed[0]), uint32_t(parsed[1])));
}

CoapMessage MemReadJob::nextRequest() {
  uint32_t chunk = min(remaining, MAX_CHUNK);
  CoapMessage request(CoapType::CONFIRMABLE, CoapCode::POST);
  request.setPath(ENDPOINT);
  request.setContentFormat(CoapContentFormat::CBOR);
  vector<uint8_t> body = json::to_cbor(json::array({address, chunk}));
  request.setPayload(string(body.begin(), body.end()));
  address += chunk;
  remaining -= chunk;
  return request;
}

CoapMessage MemReadJob::start() { return nextRequest(); }

bool MemReadJob::handle(const CoapMessage& response, CoapMessage* next) {
  string payload = payloadText(response);
  json chunk = json::from_cbor(payload.begin(), payload.end());
  if (!chunk.is_binary()) {
    throw std::runtime_error("expected a CBOR byte string");
  }
  const auto& bytes = chunk.get_binary();
  data.append(bytes.begin(), bytes.end());
  if (remaining > 0) {
    *next = nextRequest();
    return true;
  }
  return false;
}

vector<string> MemReadJob::display() const {
  vector<string> lines;
  lines.push_back("Read " + to_string(data.size()) + " byte(s).");
  for (size_t offset = 0; offset < data.size(); offset += 16) {
    lines.push_back(toHex(data.substr(offset, 16)));
  }
  return lines;
}

void registerBuiltinJobs(CommandLibrary* commands) {
  commands->store(Command(
      "Wkc", "List the resources of the device", {"/.well-known/core"},
      [](const vector<string>& args) -> shared_ptr<CommandJob> {
        return shared_ptr<CommandJob>(new WkcJob());
      }));
  commands->store(Command(
      "Ps", "Print the thread table over CoAP", {PsJob::ENDPOINT},
      [](const vector<string>& args) -> shared_ptr<CommandJob> {
        return shared_ptr<CommandJob>(new PsJob());
      }));
  commands->store(Command("MemRead", "Read device memory: MemRead <address> "
                                     "<size>",
                          {MemReadJob::ENDPOINT}, MemReadJob::create));
}
}  // namespace st
