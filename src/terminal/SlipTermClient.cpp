#include "SlipTermClient.hpp"

#include "RawSocketUtils.hpp"
#include "ScreenRenderer.hpp"

namespace st {
SlipTermClient::SlipTermClient(shared_ptr<SerialHandler> _serialHandler,
                               shared_ptr<Console> _console,
                               shared_ptr<SlipTermSession> _session,
                               const SlipTermConfig& config, int _inputFd)
    : serialHandler(_serialHandler),
      console(_console),
      session(_session),
      inputFd(_console ? _console->getInputFd() : _inputFd),
      tickInterval(config.tickInterval),
      theme(config.theme),
      printedLines(0),
      started(false),
      shuttingDown(false) {}

void SlipTermClient::run() {
  start();
  while (runOnce(tickInterval)) {
  }
  finish();
}

void SlipTermClient::start() {
  if (started) {
    return;
  }
  started = true;
  if (console) {
    console->setup();
    console->write(ScreenRenderer::enterScreen());
  } else {
    CLOG(INFO, "stdout") << "slipterm running headless on "
                         << serialHandler->getName() << endl;
  }
  SteadyClock::time_point now = SteadyClock::now();
  nextTick = now + tickInterval;
  session->onConnect(serialHandler->getName(), now);
  try {
    flushOutgoing();
  } catch (const runtime_error& re) {
    STERROR << "Error: " << re.what();
    session->onDisconnect(re.what());
  }
  render(true);
}

bool SlipTermClient::runOnce(std::chrono::milliseconds maxWait) {
  start();
  if (shuttingDown || session->wantsExit()) {
    return false;
  }

  fd_set rfd;
  fd_set wfd;
  timeval tv;
  FD_ZERO(&rfd);
  FD_ZERO(&wfd);
  int maxfd = -1;
  int serialFd = serialHandler->getFd();
  if (serialFd >= 0) {
    FD_SET(serialFd, &rfd);
    maxfd = serialFd;
    if (writeBuffer.hasPendingData()) {
      FD_SET(serialFd, &wfd);
    }
  }
  if (inputFd >= 0) {
    FD_SET(inputFd, &rfd);
    maxfd = max(maxfd, inputFd);
  }

  SteadyClock::time_point now = SteadyClock::now();
  auto wait = std::chrono::duration_cast<std::chrono::microseconds>(
      min<SteadyClock::duration>(maxWait, max<SteadyClock::duration>(
                                              nextTick - now,
                                              SteadyClock::duration(0))));
  tv.tv_sec = wait.count() / 1000000;
  tv.tv_usec = wait.count() % 1000000;
  int rc = select(maxfd + 1, &rfd, &wfd, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return true;
    }
    FATAL_FAIL(rc);
  }

  now = SteadyClock::now();
  try {
    // One event per iteration: a due tick, then the device, then the user
    if (now >= nextTick) {
      VLOG(4) << "Tick";
      session->onTick(now);
      nextTick = now + tickInterval;
    } else if (serialFd >= 0 && FD_ISSET(serialFd, &rfd)) {
      string data = serialHandler->readAvailable();
      if (!data.empty()) {
        session->onSerialData(data, now);
      }
    } else if (inputFd >= 0 && FD_ISSET(inputFd, &rfd)) {
      string data;
      if (!RawSocketUtils::readAvailable(inputFd, &data)) {
        if (console) {
          throw std::runtime_error("Console closed");
        }
        LOG(INFO) << "End of input, waiting for "
                  << session->getTracker().outstandingCount()
                  << " outstanding exchange(s)";
        session->onInputEnd(now);
        inputFd = -1;
      } else if (!data.empty()) {
        VLOG(4) << "Got " << data.size() << " bytes of input";
        if (console) {
          session->onKeystrokes(data, now);
        } else {
          session->onInputLines(data, now);
        }
      }
    }

    flushOutgoing();
    // Headless input is over: stay until the device has answered (or the
    // exchanges expired) so the replies still get printed
    if (session->isDrained() && !writeBuffer.hasPendingData() &&
        !session->wantsExit()) {
      session->onDisconnect("end of input");
    }
  } catch (const runtime_error& re) {
    STERROR << "Error: " << re.what();
    session->onDisconnect(re.what());
  }

  render(false);
  return !(shuttingDown || session->wantsExit());
}

void SlipTermClient::finish() {
  if (!started) {
    return;
  }
  started = false;
  render(true);
  if (console) {
    console->write(ScreenRenderer::leaveScreen());
    console->teardown();
  }
  if (writeBuffer.hasPendingData() && serialHandler->getFd() >= 0) {
    try {
      serialHandler->writeAllOrThrow(writeBuffer.drain());
    } catch (const runtime_error& re) {
      LOG(WARNING) << "Unsent frames dropped: " << re.what();
    }
  }
  if (!session->getExitReason().empty()) {
    CLOG(INFO, "stdout") << "Session terminated: " << session->getExitReason()
                         << endl;
  } else {
    CLOG(INFO, "stdout") << "Session terminated" << endl;
  }
  serialHandler->close();
}

void SlipTermClient::flushOutgoing() {
  for (const auto& frame : session->takeOutgoing()) {
    writeBuffer.enqueue(frame);
  }
  if (writeBuffer.hasPendingData() && serialHandler->getFd() >= 0) {
    serialHandler->flush(&writeBuffer);
  }
}

void SlipTermClient::render(bool force) {
  if (!console) {
    printNewLines();
    session->wash();
    return;
  }
  TerminalInfo ti = console->getTerminalInfo();
  bool resized = false;
  if (ti != lastTerminalInfo) {
    LOG(INFO) << "Window size changed: row: " << ti.row()
              << " column: " << ti.column();
    lastTerminalInfo = ti;
    resized = true;
  }
  if (!force && !resized && !session->isDirty()) {
    return;
  }
  console->write(ScreenRenderer::render(session->getScreenModel(), ti, theme));
  session->wash();
}

void SlipTermClient::printNewLines() {
  for (const auto& line : session->getLog().since(&printedLines)) {
    if (line.kind == LineKind::DIAGNOSTIC) {
      CLOG(INFO, "stdout") << line.text;
    } else {
      CLOG(INFO, "stdout") << "[" << lineKindName(line.kind) << "] "
                           << line.text;
    }
  }
}
}  // namespace st
