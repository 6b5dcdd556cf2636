#include "termination.h"

#include <unistd.h>

#include <atomic>
#include <csignal>

namespace {

std::atomic<int> s_stop_signal{ 0 };
std::atomic<int> s_interrupts{ 0 };

static_assert(std::atomic<int>::is_always_lock_free);

void stop_handler(int sig) {
  int expected{ 0 };
  if (!s_stop_signal.compare_exchange_strong(expected, sig)) { _exit(128 + sig); }
}

void interrupt_handler(int) { s_interrupts.fetch_add(1); }

}  // namespace

namespace uvk {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = stop_handler;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGTERM, &sa, nullptr);
  sigaction(SIGHUP, &sa, nullptr);

  struct sigaction si{};
  si.sa_handler = interrupt_handler;
  sigemptyset(&si.sa_mask);
  sigaction(SIGINT, &si, nullptr);
}

int termination_requested() { return s_stop_signal.load(); }

int termination_take_interrupts() { return s_interrupts.exchange(0); }

void termination_reset() {
  s_stop_signal.store(0);
  s_interrupts.store(0);
}

}  // namespace uvk
