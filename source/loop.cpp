#include <devloop/log.hpp>
#include <devloop/loop.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace devloop {

std::string_view to_string(LoopState s) {
  switch (s) {
  case LoopState::Idle:
    return "idle";
  case LoopState::Initializing:
    return "initializing";
  case LoopState::Running:
    return "running";
  case LoopState::Committing:
    return "committing";
  case LoopState::Delaying:
    return "delaying";
  case LoopState::Interrupted:
    return "interrupted";
  case LoopState::Completed:
    return "completed";
  }
  return "idle";
}

LoopController::LoopController(const Config &cfg, Repository &repo,
                               Agent &agent, StatisticsReporter &reporter,
                               const std::atomic_bool &stop)
    : cfg_(cfg), reporter_(reporter), stop_(stop), initializer_(repo),
      runner_(cfg, agent, stop), committer_(repo) {}

void LoopController::enter(LoopState s) {
  spdlog::debug("[loop] {} -> {}", to_string(state_), to_string(s));
  state_ = s;
}

bool LoopController::wait_delay(int seconds) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  while (std::chrono::steady_clock::now() < deadline) {
    if (stop_.load())
      return false;
    std::this_thread::sleep_for(100ms);
  }
  return !stop_.load();
}

int LoopController::finalize(bool interrupted) {
  if (finalized_)
    return 0;
  finalized_ = true;

  if (interrupted) {
    enter(LoopState::Interrupted);
    summary_.interrupted = true;
    spdlog::warn("shutdown signal received, cleaning up...");
  }
  enter(LoopState::Completed);
  (void)reporter_.report();
  if (interrupted)
    spdlog::info("development loop stopped");
  return 0;
}

int LoopController::run() {
  spdlog::info("starting automated development loop...");
  spdlog::info("configuration: max cycles={}, delay={}s", cfg_.max_loops,
               cfg_.loop_delay_sec);
  spdlog::info("log file: {}", cfg_.log_file.string());

  enter(LoopState::Initializing);
  try {
    (void)initializer_.ensure_initialized();
  } catch (const std::exception &e) {
    if (stop_.load()) {
      spdlog::warn("[init] {} during shutdown", e.what());
      return finalize(true);
    }
    spdlog::error("[init] {}; no cycles will run", e.what());
    return 1;
  }

  for (int i = 1; i <= cfg_.max_loops; ++i) {
    if (stop_.load())
      return finalize(true);

    spdlog::info("==========================================");
    spdlog::info("starting cycle {}/{}", i, cfg_.max_loops);

    enter(LoopState::Running);
    ++summary_.cycles_started;
    auto outcome = runner_.run_cycle(i);
    spdlog::debug("[loop] cycle {} {}", i, to_string(outcome.status));
    if (outcome.status == CycleStatus::Interrupted)
      return finalize(true);
    if (outcome.status == CycleStatus::Succeeded)
      ++summary_.succeeded;
    else
      ++summary_.failed;
    if (stop_.load())
      return finalize(true);

    enter(LoopState::Committing);
    if (committer_.commit_if_changed() == CommitResult::Committed)
      ++summary_.commits;
    if (stop_.load())
      return finalize(true);

    if (i < cfg_.max_loops) {
      enter(LoopState::Delaying);
      spdlog::info("waiting {}s before the next cycle...", cfg_.loop_delay_sec);
      if (!wait_delay(cfg_.loop_delay_sec))
        return finalize(true);
    }
  }

  spdlog::info("==========================================");
  log::success("all {} development cycles completed!", cfg_.max_loops);
  return finalize(false);
}

} // namespace devloop
