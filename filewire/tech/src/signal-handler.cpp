#include "filewire/signal-handler.hpp"

#include <csignal>

#include "filewire/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void FilewireSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace filewire {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::FilewireSignalHandler);
  std::signal(SIGTERM, ::FilewireSignalHandler);
  std::signal(SIGPIPE, SIG_IGN);
  log::debug("Signal handlers installed for SIGINT and SIGTERM");
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  std::signal(SIGPIPE, SIG_DFL);
}

bool SignalHandler::IsStopRequested() noexcept { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() noexcept { g_signalStatus = 0; }

}  // namespace filewire
