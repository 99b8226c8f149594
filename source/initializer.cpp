#include <devloop/clock.hpp>
#include <devloop/committer.hpp>
#include <devloop/initializer.hpp>
#include <devloop/log.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace devloop {

bool RepoInitializer::ensure_initialized() {
  if (repo_.is_initialized()) {
    spdlog::info("[init] git repository exists, skipping initialization");
    return false;
  }

  spdlog::info("[init] no git repository found, initializing");
  if (!repo_.init())
    throw std::runtime_error("git init failed");
  if (!repo_.stage_all())
    throw std::runtime_error("git add failed during initialization");

  // Empty allowed: the repository must end up with at least one commit.
  auto msg = commit_message(timestamp_now(), true);
  if (!repo_.commit(msg, true))
    throw std::runtime_error("initial commit failed");

  log::success("git repository initialized with first commit ✓");
  return true;
}

} // namespace devloop
