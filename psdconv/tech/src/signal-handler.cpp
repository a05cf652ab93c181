#include "psdconv/signal-handler.hpp"

#include <cerrno>
#include <csignal>
#include <string>
#include <system_error>

#include "psdconv/log.hpp"

namespace {

volatile std::sig_atomic_t g_stopSignal{};

extern "C" void PsdconvOnStopSignal(int sigNum) { g_stopSignal = sigNum; }

constexpr int kStopSignals[] = {SIGINT, SIGTERM};

void InstallHandler(void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: epoll_wait returns with EINTR on a stop signal.
  action.sa_flags = 0;
  for (int sigNum : kStopSignals) {
    if (::sigaction(sigNum, &action, nullptr) != 0) {
      throw std::system_error(errno, std::generic_category(), "sigaction failed for signal " + std::to_string(sigNum));
    }
  }
}

}  // namespace

namespace psdconv {

void SignalHandler::Enable() {
  InstallHandler(PsdconvOnStopSignal);
  log::debug("SIGINT and SIGTERM request a graceful stop");
}

void SignalHandler::Disable() { InstallHandler(SIG_DFL); }

bool SignalHandler::IsStopRequested() { return g_stopSignal != 0; }

int SignalHandler::StopSignal() { return g_stopSignal; }

void SignalHandler::ResetStopRequest() { g_stopSignal = 0; }

}  // namespace psdconv
