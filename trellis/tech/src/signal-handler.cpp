#include "trellis/signal-handler.hpp"

#include <csignal>

#include "trellis/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void TrellisSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace trellis {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::TrellisSignalHandler);
  std::signal(SIGTERM, ::TrellisSignalHandler);
  log::debug("SIGINT and SIGTERM handlers installed");
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace trellis
