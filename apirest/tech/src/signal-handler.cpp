#include "apirest/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void ApiRestSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace apirest {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::ApiRestSignalHandler);
  std::signal(SIGTERM, ::ApiRestSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

}  // namespace apirest
