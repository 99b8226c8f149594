#include <devloop/clock.hpp>
#include <devloop/log.hpp>
#include <devloop/runner.hpp>

#include <spdlog/spdlog.h>

#include <chrono>

namespace devloop {

std::string_view to_string(CycleStatus s) {
  switch (s) {
  case CycleStatus::Succeeded:
    return "succeeded";
  case CycleStatus::Failed:
    return "failed";
  case CycleStatus::Interrupted:
    return "interrupted";
  }
  return "failed";
}

CycleRunner::CycleRunner(const Config &cfg, Agent &agent,
                         const std::atomic_bool &stop)
    : agent_(agent), stop_(stop), prompt_(cfg.prompt_file),
      success_(cfg.success_ledger()), errors_(cfg.error_ledger()) {}

CycleOutcome CycleRunner::run_cycle(int index) {
  CycleOutcome outcome;
  outcome.index = index;

  spdlog::info("starting development cycle {}", index);

  if (prompt_.refresh()) {
    spdlog::info("[cycle {}] prompt artifact changed since previous cycle "
                 "(xxh3 {} -> {})",
                 index, prompt_.previous().value_or("missing"),
                 prompt_.current().value_or("missing"));
  }
  if (!prompt_.current())
    spdlog::warn("[cycle {}] prompt artifact {} is not readable", index,
                 prompt_.path().string());

  spdlog::info("exec: {}", agent_.describe(prompt_.path()));

  auto started = std::chrono::steady_clock::now();
  AgentResult r = agent_.invoke(
      prompt_.path(), [](std::string_view line) { log::agent_output(line); },
      stop_);
  auto elapsed = std::chrono::steady_clock::now() - started;
  outcome.duration_sec =
      std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
  outcome.exit_code = r.exit_code;

  if (r.interrupted) {
    spdlog::warn("[cycle {}] interrupted after {}s, no outcome recorded", index,
                 outcome.duration_sec);
    outcome.status = CycleStatus::Interrupted;
    return outcome;
  }

  LedgerRecord rec;
  rec.timestamp = timestamp_now();
  rec.cycle = index;

  if (r.ok()) {
    outcome.status = CycleStatus::Succeeded;
    log::success("development cycle {} finished in {}s ✓", index,
                 outcome.duration_sec);
    rec.success = true;
    rec.duration_sec = outcome.duration_sec;
    (void)success_.append(rec);
    return outcome;
  }

  outcome.status = CycleStatus::Failed;
  if (!r.launched)
    spdlog::error("development cycle {} failed: {}", index, r.error);
  else
    spdlog::error("development cycle {} failed (exit code {})", index,
                  r.exit_code);
  rec.success = false;
  (void)errors_.append(rec);
  return outcome;
}

} // namespace devloop
