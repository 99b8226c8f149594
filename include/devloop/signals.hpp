#pragma once
#include <atomic>

namespace devloop {
namespace signals {
  // Process-wide shutdown flag set by SIGINT/SIGTERM.
  std::atomic_bool& shutdown_flag();

  void install_shutdown_handlers();
}
} // namespace devloop
