#include "termination.h"

#include <unistd.h>

#include <csignal>

namespace {

std::atomic_bool s_requested{ false };

static_assert(std::atomic_bool::is_always_lock_free);

void signal_handler(int sig) {
  if (s_requested.exchange(true)) { _exit(128 + sig); }
}

}  // namespace

namespace mise {

std::atomic_bool &termination_requested() { return s_requested; }

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace mise
