#pragma once
#include "agent.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "prompt.hpp"

#include <atomic>
#include <cstdint>
#include <string_view>

namespace devloop {

enum class CycleStatus { Succeeded, Failed, Interrupted };

std::string_view to_string(CycleStatus s);

struct CycleOutcome {
  int index{0};
  CycleStatus status{CycleStatus::Failed};
  std::int64_t duration_sec{0};
  int exit_code{-1};
};

class CycleRunner {
public:
  CycleRunner(const Config& cfg, Agent& agent, const std::atomic_bool& stop);

  CycleOutcome run_cycle(int index);

  const Ledger& success_ledger() const { return success_; }
  const Ledger& error_ledger() const { return errors_; }

private:
  Agent& agent_;
  const std::atomic_bool& stop_;
  PromptArtifact prompt_;
  Ledger success_;
  Ledger errors_;
};

} // namespace devloop
