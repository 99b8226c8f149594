#pragma once
#include "agent.hpp"
#include "committer.hpp"
#include "config.hpp"
#include "git.hpp"
#include "initializer.hpp"
#include "runner.hpp"
#include "stats.hpp"

#include <atomic>
#include <string_view>

namespace devloop {

enum class LoopState {
  Idle,
  Initializing,
  Running,
  Committing,
  Delaying,
  Interrupted,
  Completed
};

std::string_view to_string(LoopState s);

struct LoopSummary {
  int cycles_started{0};
  int succeeded{0};
  int failed{0};
  int commits{0};
  bool interrupted{false};
};

class LoopController {
public:
  LoopController(const Config& cfg, Repository& repo, Agent& agent,
                 StatisticsReporter& reporter, const std::atomic_bool& stop);

  // Initialize, run up to max_loops cycles, finalize. Returns the exit code.
  int run();

  LoopState state() const { return state_; }
  const LoopSummary& summary() const { return summary_; }

private:
  void enter(LoopState s);
  bool wait_delay(int seconds);
  int finalize(bool interrupted);

  const Config& cfg_;
  StatisticsReporter& reporter_;
  const std::atomic_bool& stop_;

  RepoInitializer initializer_;
  CycleRunner runner_;
  CycleCommitter committer_;

  LoopState state_ = LoopState::Idle;
  LoopSummary summary_{};
  bool finalized_ = false;
};

} // namespace devloop
