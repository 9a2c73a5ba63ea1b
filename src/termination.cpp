#include "termination.h"

#include <unistd.h>

#include <csignal>
#include <tuple>

namespace quarry {

namespace {

std::atomic_bool g_requested{ false };

void signal_handler(int sig) {
  if (g_requested.exchange(true)) { _exit(128 + sig); }
  static constexpr char kMessage[]{ "\ninterrupted, cancelling (again to force)\n" };
  std::ignore = write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
}

}  // namespace

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

std::atomic_bool const &termination_flag() { return g_requested; }

}  // namespace quarry
