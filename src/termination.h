#pragma once

#include <atomic>

namespace quarry {

// SIGINT/SIGTERM handler. The first signal only raises termination_flag() so running
// work can cancel and clean up; a second one calls _exit(128 + sig).
void termination_handler_install();

std::atomic_bool const &termination_flag();

}  // namespace quarry
