#pragma once

#include <atomic>

namespace mise {

// Set by the first SIGINT/SIGTERM; scheduling stops at its next stage transition.
std::atomic_bool &termination_requested();

// Installs SIGINT/SIGTERM handlers. The first signal requests cancellation, a second
// one exits immediately with 128 + signal.
void termination_handler_install();

}  // namespace mise
