#include <devloop/clock.hpp>
#include <devloop/committer.hpp>
#include <devloop/log.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace devloop {

std::string_view to_string(CommitResult r) {
  switch (r) {
  case CommitResult::NoChanges:
    return "no-changes";
  case CommitResult::Committed:
    return "committed";
  case CommitResult::Failed:
    return "failed";
  }
  return "failed";
}

std::string commit_message(std::string_view timestamp, bool initial) {
  if (initial)
    return fmt::format("Auto-commit: {} [Initial]", timestamp);
  return fmt::format("Auto-commit: {}", timestamp);
}

CommitResult CycleCommitter::commit_if_changed() {
  auto dirty = repo_.has_uncommitted_changes();
  if (!dirty) {
    spdlog::error("[commit] cannot inspect working tree, commit skipped");
    return CommitResult::Failed;
  }
  if (!*dirty) {
    spdlog::info("[commit] no file changes, skipping commit");
    return CommitResult::NoChanges;
  }

  if (!repo_.stage_all()) {
    spdlog::error("[commit] staging failed; changes stay for the next cycle");
    return CommitResult::Failed;
  }
  auto msg = commit_message(timestamp_now(), false);
  if (!repo_.commit(msg, false)) {
    spdlog::error("[commit] commit failed; changes stay for the next cycle");
    return CommitResult::Failed;
  }
  log::success("auto-commit done: {}", msg);
  return CommitResult::Committed;
}

} // namespace devloop
