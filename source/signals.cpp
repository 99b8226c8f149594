#include <devloop/signals.hpp>

#include <csignal>

namespace devloop {
namespace signals {

static std::atomic_bool g_stop{false};

static void on_signal(int sig) {
  if (sig == SIGINT || sig == SIGTERM)
    g_stop.store(true);
}

std::atomic_bool &shutdown_flag() { return g_stop; }

void install_shutdown_handlers() {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
}

} // namespace signals
} // namespace devloop
