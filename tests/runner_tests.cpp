#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "test_support.hpp"

#include <devloop/ledger.hpp>
#include <devloop/runner.hpp>

#include <atomic>

using namespace devloop;
using devloop_test::FakeAgent;
using devloop_test::make_tmpdir;
using devloop_test::write_file;

TEST_CASE("Cycle outcome follows the agent exit code") {
  auto dir = make_tmpdir("devloop_runner_");
  auto cfg = devloop_test::make_config(dir);
  std::atomic_bool stop{false};
  FakeAgent agent;
  agent.exit_codes = {0, 2};

  CycleRunner runner(cfg, agent, stop);
  auto first = runner.run_cycle(1);
  CHECK(first.status == CycleStatus::Succeeded);
  auto second = runner.run_cycle(2);
  CHECK(second.status == CycleStatus::Failed);
  CHECK(second.exit_code == 2);

  auto ok = runner.success_ledger().read();
  auto bad = runner.error_ledger().read();
  REQUIRE(ok.size() == 1);
  REQUIRE(bad.size() == 1);
  CHECK(ok[0].cycle == 1);
  CHECK(ok[0].duration_sec);
  CHECK(bad[0].cycle == 2);
}

TEST_CASE("Interrupted cycle leaves no ledger record") {
  auto dir = make_tmpdir("devloop_runner_int_");
  auto cfg = devloop_test::make_config(dir);
  std::atomic_bool stop{false};
  FakeAgent agent;
  agent.stop_at = 1;
  agent.stop_flag = &stop;

  CycleRunner runner(cfg, agent, stop);
  auto out = runner.run_cycle(1);
  CHECK(out.status == CycleStatus::Interrupted);
  CHECK(runner.success_ledger().count() == 0);
  CHECK(runner.error_ledger().count() == 0);
}

TEST_CASE("Process agent runs the prompt through the configured program") {
  auto dir = make_tmpdir("devloop_runner_proc_");
  auto cfg = devloop_test::make_config(dir);
  // <program> <args...> <prompt>: with /bin/sh and no args the prompt runs
  // as a script.
  cfg.agent_program = "/bin/sh";
  cfg.agent_args.clear();
  write_file(cfg.prompt_file, "echo working\nexit 0\n");

  std::atomic_bool stop{false};
  ProcessAgent agent(cfg);
  CHECK(agent.describe(cfg.prompt_file) ==
        "/bin/sh " + cfg.prompt_file.string());

  CycleRunner runner(cfg, agent, stop);
  CHECK(runner.run_cycle(1).status == CycleStatus::Succeeded);

  write_file(cfg.prompt_file, "exit 4\n");
  auto out = runner.run_cycle(2);
  CHECK(out.status == CycleStatus::Failed);
  CHECK(out.exit_code == 4);
  CHECK(runner.success_ledger().count() == 1);
  CHECK(runner.error_ledger().count() == 1);
}

TEST_CASE("Agent that cannot be launched is a failed cycle") {
  auto dir = make_tmpdir("devloop_runner_missing_");
  auto cfg = devloop_test::make_config(dir);
  cfg.agent_program = (dir / "no-such-agent").string();

  std::atomic_bool stop{false};
  ProcessAgent agent(cfg);
  CHECK(agent.command_line(cfg.prompt_file) ==
        std::vector<std::string>{cfg.agent_program,
                                 "--dangerously-skip-permissions", "-p",
                                 cfg.prompt_file.string()});

  CycleRunner runner(cfg, agent, stop);
  auto out = runner.run_cycle(1);
  CHECK(out.status == CycleStatus::Failed);
  CHECK(runner.error_ledger().count() == 1);
  CHECK(runner.success_ledger().count() == 0);
}
