/**
 * @file Interrupt.cpp
 * @brief Signal-to-flag bridge.
 */

#include "src/reset/inc/Interrupt.hpp"

#include <csignal> // std::sig_atomic_t
#include <cstddef> // std::size_t

namespace rebind {

namespace reset {

namespace {

volatile std::sig_atomic_t g_signal = 0;

void onSignal(int signo) {
  if (g_signal == 0) {
    g_signal = signo;
  }
}

} // namespace

InterruptScope::InterruptScope() noexcept {
  struct sigaction action{};
  action.sa_handler = onSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  for (std::size_t i = 0; i < SIGNALS.size(); ++i) {
    installed_[i] = ::sigaction(SIGNALS[i], &action, &previous_[i]) == 0;
  }
}

InterruptScope::~InterruptScope() {
  for (std::size_t i = 0; i < SIGNALS.size(); ++i) {
    if (installed_[i]) {
      ::sigaction(SIGNALS[i], &previous_[i], nullptr);
    }
  }
}

bool InterruptScope::interrupted() noexcept { return g_signal != 0; }

int InterruptScope::signalNumber() noexcept { return static_cast<int>(g_signal); }

void InterruptScope::reset() noexcept { g_signal = 0; }

void InterruptScope::raiseFlag(int signo) noexcept {
  if (g_signal == 0) {
    g_signal = signo;
  }
}

} // namespace reset

} // namespace rebind
