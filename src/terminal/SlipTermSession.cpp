#include "SlipTermSession.hpp"

#include "BuiltinJobs.hpp"
#include "JsonLib.hpp"

namespace st {
namespace {
const char* REQUEST_ARROW = "\xE2\x86\x90 ";   // ←
const char* RESPONSE_ARROW = "\xE2\x86\x92 ";  // →
const char* FAILURE_MARK = "\xE2\x9C\x97 ";    // ✗

string methodName(uint8_t code) {
  switch (code) {
    case CoapCode::GET:
      return "GET";
    case CoapCode::POST:
      return "POST";
    case CoapCode::PUT:
      return "PUT";
    case CoapCode::DELETE:
      return "DELETE";
  }
  return coapCodeToString(code);
}

string trim(const string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

string exchangeLabel(const ExchangeEvent& event, const string& path) {
  return methodName(event.request.getCode()) + " " + path + " [" +
         event.request.getTokenString() + "]";
}

vector<string> words(const string& line) {
  vector<string> retval;
  for (const auto& word : split(line, ' ')) {
    if (!word.empty()) {
      retval.push_back(word);
    }
  }
  return retval;
}

bool isPrintableText(const string& s) {
  for (char c : s) {
    uint8_t b = uint8_t(c);
    if (b < 0x20 && c != '\n' && c != '\r' && c != '\t') {
      return false;
    }
  }
  return true;
}
}  // namespace

SlipTermSession::SlipTermSession(const SlipTermConfig& config,
                                 shared_ptr<PacketHandler> _packetHandler,
                                 uint16_t initialMessageId)
    : input(&commands),
      decoder(config.maxFrameSize),
      demultiplexer(this),
      tracker(config.exchangeTimeout, initialMessageId),
      log(config.scrollback),
      packetHandler(_packetHandler),
      corruptFramesSeen(0),
      inputEnded(false),
      connected(false),
      view(VIEW_COMBINED),
      dirty(true),
      exitRequested(false) {
  registerBuiltinJobs(&commands);
}

void SlipTermSession::onConnect(const string& deviceName,
                                SteadyClock::time_point now) {
  currentTime = now;
  device = deviceName;
  connected = true;
  LOG(INFO) << "Connected to " << device;
  log.append(LineKind::NOTICE, "Connected to " + device);
  sendGet("/riot/board", now);
  sendGet("/riot/ver", now);
  sendGet("/.well-known/core", now);
  dirty = true;
}

void SlipTermSession::onSerialData(const string& bytes,
                                   SteadyClock::time_point now) {
  currentTime = now;
  string frame;
  for (char c : bytes) {
    if (decoder.decode(uint8_t(c), &frame)) {
      demultiplexer.route(frame);
      // Terminal Lines keep the arrival order of the frames
      collectShellLines();
      collectTracker();
    }
    if (decoder.getCorruptFrameCount() != corruptFramesSeen) {
      corruptFramesSeen = decoder.getCorruptFrameCount();
      noteDesync("corrupt frame dropped");
    }
  }
  if (!bytes.empty()) {
    dirty = true;
  }
}

void SlipTermSession::onKeystrokes(const string& bytes,
                                   SteadyClock::time_point now) {
  currentTime = now;
  for (const auto& key : keyDecoder.decode(bytes)) {
    handleKey(key, now);
  }
  heldKeys.clear();
  collectTracker();
}

void SlipTermSession::onInputLines(const string& bytes,
                                   SteadyClock::time_point now) {
  currentTime = now;
  inputLineBuffer.append(bytes);
  size_t newline;
  while ((newline = inputLineBuffer.find('\n')) != string::npos) {
    string line = inputLineBuffer.substr(0, newline);
    inputLineBuffer.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    submitLine(line, now);
  }
  collectTracker();
}

void SlipTermSession::onInputEnd(SteadyClock::time_point now) {
  currentTime = now;
  inputEnded = true;
  if (!inputLineBuffer.empty()) {
    string line;
    line.swap(inputLineBuffer);
    submitLine(line, now);
  }
  collectTracker();
}

void SlipTermSession::onTick(SteadyClock::time_point now) {
  currentTime = now;
  int64_t linesBefore = log.getTotalCount();
  tracker.tick(now);
  collectTracker();

  // An escape sequence that is still incomplete a whole tick later was a
  // lone key press
  if (!heldKeys.empty() && heldKeys == keyDecoder.getPending()) {
    for (const auto& key : keyDecoder.flush()) {
      handleKey(key, now);
    }
    heldKeys.clear();
  } else {
    heldKeys = keyDecoder.getPending();
  }

  if (log.getTotalCount() != linesBefore) {
    dirty = true;
  }
}

void SlipTermSession::onDisconnect(const string& reason) {
  shellText.flush();
  collectShellLines();
  connected = false;
  exitRequested = true;
  exitReason = reason;
  LOG(WARNING) << "Disconnected from " << device << ": " << reason;
  log.append(LineKind::ERROR, "Disconnected: " + reason);
  dirty = true;
}

void SlipTermSession::submitLine(const string& line,
                                 SteadyClock::time_point now) {
  string trimmed = trim(line);
  if (trimmed == "help") {
    log.append(LineKind::NOTICE, "Available commands:");
    for (const auto& text : commands.helpText()) {
      log.append(LineKind::NOTICE, "  " + text);
    }
  } else if (!trimmed.empty() && trimmed[0] == '/') {
    sendGet(trimmed, now);
  } else if (trimmed == "ForceCmdsAvailable") {
    int offered = commands.forceAllAvailable();
    log.append(LineKind::NOTICE,
               to_string(offered) + " built-in command(s) made available");
  } else {
    vector<string> args = words(trimmed);
    const Command* command = commands.find(trimmed);
    if (!command && !args.empty()) {
      command = commands.find(args[0]);
      if (command && command->kind != CommandKind::JOB) {
        command = nullptr;
      }
    }
    if (command && command->kind == CommandKind::COAP_RESOURCE) {
      sendGet(command->endpoint, now);
    } else if (command && command->kind == CommandKind::JOB) {
      args.erase(args.begin());
      startJob(*command, args, now);
    } else {
      sendDiagnostic(line + "\n");
    }
  }
  dirty = true;
}

void SlipTermSession::startJob(const Command& command,
                               const vector<string>& args,
                               SteadyClock::time_point now) {
  shared_ptr<CommandJob> job;
  try {
    job = command.factory(args);
  } catch (const runtime_error& re) {
    log.append(LineKind::ERROR, FAILURE_MARK + command.name + ": " + re.what());
    return;
  }
  string invocation = command.name;
  for (const auto& arg : args) {
    invocation += " " + arg;
  }
  LOG(INFO) << "Starting " << invocation;
  log.append(LineKind::REQUEST, REQUEST_ARROW + invocation);
  sendJobRequest(job, job->start(), now);
}

void SlipTermSession::sendJobRequest(shared_ptr<CommandJob> job,
                                     CoapMessage request,
                                     SteadyClock::time_point now) {
  ExchangeId id = tracker.sendRequest(request, now);
  jobs[id] = job;
  VLOG(1) << job->getName() << " waits for exchange " << id;
  collectTracker();
  dirty = true;
}

ExchangeId SlipTermSession::sendGet(const string& path,
                                    SteadyClock::time_point now, bool quiet) {
  CoapMessage request(CoapType::CONFIRMABLE, CoapCode::GET);
  request.setPath(path);
  if (!quiet) {
    BlockOption block;
    block.szx = DEFAULT_BLOCK_SZX;
    request.setBlock2(block);
  }
  RequestContext context;
  context.path = path;
  context.quiet = quiet;
  return startRequest(request, context, now);
}

ExchangeId SlipTermSession::startRequest(CoapMessage request,
                                         const RequestContext& context,
                                         SteadyClock::time_point now) {
  ExchangeId id = tracker.sendRequest(request, now);
  requests[id] = context;
  const Exchange* exchange = tracker.getExchange(id);
  if (!context.quiet && context.accumulated.empty()) {
    log.append(LineKind::REQUEST, REQUEST_ARROW +
                                      methodName(request.getCode()) + " " +
                                      context.path + " [" +
                                      exchange->request.getTokenString() +
                                      "]");
  }
  collectTracker();
  dirty = true;
  return id;
}

vector<string> SlipTermSession::takeOutgoing() {
  vector<string> retval(outgoing.begin(), outgoing.end());
  outgoing.clear();
  return retval;
}

ScreenModel SlipTermSession::getScreenModel() const {
  ScreenModel model;
  model.device = device;
  model.connected = connected;
  model.board = board;
  model.version = version;
  model.address = packetHandler ? packetHandler->getAddress() : "";
  model.outstanding = tracker.outstandingCount();
  model.view = view;
  model.log = &log;
  model.pendingShellLine = shellText.pending();
  model.input = input.getBuffer();
  model.cursorColumn = input.getCursorColumn();
  return model;
}

void SlipTermSession::onDiagnostic(const string& payload) {
  shellText.append(payload);
}

void SlipTermSession::onStructured(const string& payload) {
  tracker.handleIncoming(payload, currentTime);
}

void SlipTermSession::onConfiguration(const string& datagram) {
  if (packetHandler) {
    packetHandler->onDatagram(datagram);
  } else {
    VLOG(1) << "Dropping " << datagram.size()
            << " byte datagram, no packet handler";
  }
}

void SlipTermSession::onUnknown(const string& frame) {
  noteDesync("unknown marker " + (frame.empty() ? string("<empty frame>")
                                                 : toHex(frame.substr(0, 1))));
}

void SlipTermSession::handleKey(const KeyEvent& key,
                                SteadyClock::time_point now) {
  switch (key.type) {
    case KeyType::CHAR:
      input.insert(key.text);
      break;
    case KeyType::ENTER:
      submitLine(input.submit(), now);
      break;
    case KeyType::BACKSPACE:
      input.backspace();
      break;
    case KeyType::TAB: {
      vector<string> candidates = input.complete();
      if (!candidates.empty()) {
        string joined;
        for (const auto& candidate : candidates) {
          joined += "  " + candidate;
        }
        log.append(LineKind::NOTICE, joined);
      }
      break;
    }
    case KeyType::UP:
      input.historyUp();
      break;
    case KeyType::DOWN:
      input.historyDown();
      break;
    case KeyType::LEFT:
      input.moveLeft();
      break;
    case KeyType::RIGHT:
      input.moveRight();
      break;
    case KeyType::F1:
      view = VIEW_COMBINED;
      break;
    case KeyType::F2:
      view = VIEW_DIAGNOSTIC;
      break;
    case KeyType::F3:
      view = VIEW_STRUCTURED;
      break;
    case KeyType::CTRL_C:
    case KeyType::CTRL_D:
      LOG(INFO) << "User requested exit";
      exitRequested = true;
      exitReason = "user quit";
      break;
    case KeyType::UNKNOWN:
      VLOG(2) << "Ignoring unknown key " << toHex(key.text);
      return;
  }
  dirty = true;
}

void SlipTermSession::sendDiagnostic(const string& text) {
  VLOG(1) << "Sending " << text.size() << " bytes of shell text";
  outgoing.push_back(
      ChannelDemultiplexer::frameOutgoing(ChannelKind::DIAGNOSTIC_TEXT, text));
}

void SlipTermSession::collectShellLines() {
  for (const auto& line : shellText.takeLines()) {
    log.append(LineKind::DIAGNOSTIC, line);
  }
}

void SlipTermSession::collectTracker() {
  vector<ExchangeEvent> events = tracker.takeEvents();
  for (const auto& event : events) {
    auto jobIt = jobs.find(event.id);
    if (jobIt != jobs.end()) {
      shared_ptr<CommandJob> job = jobIt->second;
      jobs.erase(jobIt);
      handleJobEvent(event, job);
      continue;
    }
    RequestContext context;
    auto it = requests.find(event.id);
    if (it != requests.end()) {
      context = it->second;
      requests.erase(it);
    } else {
      context.path = event.request.getPath();
      context.quiet = false;
    }
    try {
      handleEvent(event, context);
    } catch (const CoapParseException& cpe) {
      LOG(WARNING) << "Malformed response to " << event.request.summary()
                   << ": " << cpe.what();
      log.append(LineKind::ERROR, FAILURE_MARK +
                                      exchangeLabel(event, context.path) +
                                      ": malformed response: " + cpe.what());
    }
  }
  for (const auto& message : tracker.takeOutgoing()) {
    outgoing.push_back(ChannelDemultiplexer::frameOutgoing(
        ChannelKind::STRUCTURED_MESSAGE, message));
  }
  if (!events.empty()) {
    dirty = true;
  }
}

void SlipTermSession::handleEvent(const ExchangeEvent& event,
                                  RequestContext context) {
  string label = exchangeLabel(event, context.path);
  switch (event.outcome) {
    case ExchangeOutcome::MATCHED:
      handleResponse(event, &context);
      break;
    case ExchangeOutcome::EXPIRED:
      LOG(WARNING) << label << " timed out";
      log.append(LineKind::ERROR,
                 FAILURE_MARK + label + " timed out after " +
                     to_string(tracker.getTimeout().count()) + " ms");
      break;
    case ExchangeOutcome::REJECTED:
      log.append(LineKind::ERROR,
                 FAILURE_MARK + label + " rejected by the device");
      break;
  }
}

void SlipTermSession::handleJobEvent(const ExchangeEvent& event,
                                    shared_ptr<CommandJob> job) {
  string label = job->getName() + " [" + event.request.getTokenString() + "]";
  string failure;
  switch (event.outcome) {
    case ExchangeOutcome::MATCHED: {
      CoapMessage next;
      bool more = false;
      try {
        more = job->handle(event.response, &next);
      } catch (const CoapParseException& cpe) {
        failure = cpe.what();
      } catch (const json::exception& je) {
        failure = je.what();
      } catch (const runtime_error& re) {
        failure = re.what();
      }
      if (!failure.empty()) {
        LOG(WARNING) << label << " failed: " << failure;
        log.append(LineKind::ERROR, FAILURE_MARK + label + ": " + failure);
        break;
      }
      if (more) {
        sendJobRequest(job, next, currentTime);
        break;
      }
      log.append(LineKind::RESPONSE,
                 RESPONSE_ARROW + job->getName() + " [" +
                     event.response.getTokenString() + "]: done");
      for (const auto& line : job->display()) {
        log.append(LineKind::RESPONSE, "  " + line);
      }
      break;
    }
    case ExchangeOutcome::EXPIRED:
      LOG(WARNING) << label << " timed out";
      log.append(LineKind::ERROR,
                 FAILURE_MARK + label + " timed out after " +
                     to_string(tracker.getTimeout().count()) + " ms");
      break;
    case ExchangeOutcome::REJECTED:
      log.append(LineKind::ERROR,
                 FAILURE_MARK + label + " rejected by the device");
      break;
  }
  dirty = true;
}

void SlipTermSession::handleResponse(const ExchangeEvent& event,
                                     RequestContext* context) {
  const CoapMessage& response = event.response;
  string payload = response.getPayload();

  BlockOption block;
  if (response.getCode() == CoapCode::CONTENT && response.getBlock2(&block)) {
    size_t offset = size_t(block.num) * block.blockSize();
    if (offset != context->accumulated.size()) {
      log.append(LineKind::ERROR,
                 FAILURE_MARK + context->path + ": unexpected block " +
                     to_string(block.num) + " at offset " +
                     to_string(context->accumulated.size()));
      return;
    }
    context->accumulated += payload;
    if (block.more) {
      if (context->accumulated.size() > MAX_BLOCKWISE_SIZE) {
        log.append(LineKind::ERROR, FAILURE_MARK + context->path +
                                        ": response too large, giving up");
        return;
      }
      CoapMessage next(CoapType::CONFIRMABLE, CoapCode::GET);
      next.setPath(context->path);
      BlockOption nextBlock;
      nextBlock.num = block.num + 1;
      nextBlock.szx = block.szx;
      next.setBlock2(nextBlock);
      VLOG(1) << "Fetching block " << nextBlock.num << " of "
              << context->path;
      startRequest(next, *context, currentTime);
      return;
    }
    payload = context->accumulated;
  }

  if (!context->quiet) {
    std::ostringstream ss;
    ss << RESPONSE_ARROW << coapCodeToString(response.getCode());
    uint32_t contentFormat;
    if (response.getContentFormat(&contentFormat)) {
      ss << " (" << contentFormatName(contentFormat) << ")";
    }
    ss << " [" << response.getTokenString() << "]: " << payload.size()
       << " bytes";
    log.append(response.isError() ? LineKind::ERROR : LineKind::RESPONSE,
               ss.str());
    appendPayload(response, payload);
  }

  if ((response.getCode() >> 5) != 2) {
    return;
  }
  const string& path = context->path;
  if (path == "/riot/board") {
    board = trim(payload);
  } else if (path == "/riot/ver") {
    version = trim(payload);
  } else if (path == "/.well-known/core") {
    onWellKnownCore(payload);
  } else if (path.compare(0, 7, "/shell/") == 0) {
    string description = trim(payload);
    commands.updateDescription(path.substr(7), description);
    commands.updateDescription(path, description);
  }
}

void SlipTermSession::onWellKnownCore(const string& payload) {
  int learned = 0;
  vector<string> endpoints;
  for (const auto& entry : split(payload, ',')) {
    string link = trim(entry);
    if (link.empty() || link[0] != '<') {
      continue;
    }
    size_t close = link.find('>');
    if (close == string::npos) {
      continue;
    }
    string path = link.substr(1, close - 1);
    if (path.empty() || path[0] != '/') {
      continue;
    }
    endpoints.push_back(path);
    if (path.compare(0, 7, "/shell/") == 0 && path.size() > 7) {
      bool added =
          commands.add(Command(path.substr(7), "A RIOT shell command",
                               CommandKind::SHELL));
      added |= commands.add(Command(
          path, "A CoAP resource describing a RIOT shell command",
          CommandKind::COAP_RESOURCE, path));
      if (added) {
        learned++;
        // The resource answers with the help text of the command
        sendGet(path, currentTime, true);
      }
    } else if (commands.add(Command(path, "A CoAP resource",
                                    CommandKind::COAP_RESOURCE, path))) {
      learned++;
    }
  }
  LOG(INFO) << "Learned " << learned << " commands from /.well-known/core";
  int offered = commands.updateAvailable(endpoints);
  if (offered > 0) {
    log.append(LineKind::NOTICE,
               to_string(offered) + " built-in command(s) available");
  }
}

void SlipTermSession::appendPayload(const CoapMessage& response,
                                    const string& payload) {
  if (payload.empty()) {
    return;
  }
  uint32_t contentFormat = CoapContentFormat::TEXT_PLAIN;
  bool hasFormat = response.getContentFormat(&contentFormat);
  if (contentFormat == CoapContentFormat::LINK_FORMAT) {
    string rest = payload;
    replaceAll(rest, ",<", "\n<");
    for (const auto& link : split(rest, '\n')) {
      log.append(LineKind::RESPONSE, "  " + link);
    }
    return;
  }
  if ((contentFormat == CoapContentFormat::TEXT_PLAIN ||
       contentFormat == CoapContentFormat::JSON) &&
      (hasFormat || isPrintableText(payload))) {
    ShellTextStream text;
    text.append(payload);
    text.flush();
    for (const auto& line : text.takeLines()) {
      log.append(LineKind::RESPONSE, "  " + line);
    }
    return;
  }
  for (size_t offset = 0; offset < payload.size(); offset += 16) {
    log.append(LineKind::RESPONSE, "  " + toHex(payload.substr(offset, 16)));
  }
}

void SlipTermSession::noteDesync(const string& what) {
  log.append(LineKind::NOTICE, "protocol desync: " + what);
  dirty = true;
}
}  // namespace st
