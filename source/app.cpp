#include <devloop/agent.hpp>
#include <devloop/app.hpp>
#include <devloop/cli.hpp>
#include <devloop/git.hpp>
#include <devloop/log.hpp>
#include <devloop/loop.hpp>
#include <devloop/prereq.hpp>
#include <devloop/signals.hpp>
#include <devloop/stats.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <type_traits>

#ifndef DEVLOOP_VERSION
#define DEVLOOP_VERSION "unknown"
#endif
#ifndef DEVLOOP_BUILD_TIME
#define DEVLOOP_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;

namespace devloop {

static void print_help(const char *argv0) {
  fmt::print(
      R"(devloop - automated development loop (agent + git auto-commit)

Usage: {0} [options]

Options:
  -h, --help            show this help
  -d, --delay SECONDS   delay between cycles (default: 10)
  -l, --loops COUNT     maximum number of cycles (default: 50)
  -s, --stats           show statistics only
  -c, --clean           remove log and ledger files
  -p, --prompt PATH     prompt file passed to the agent (default: ./prompt.md)
      --log-file PATH   combined log file (default: ./dev_loop.log)
      --docs DIR        documentation directory (default: docs)
      --agent PROGRAM   agent executable (default: claude)
  -v, --verbose         debug logging
      --version         print version

Examples:
  {0}                   run with defaults
  {0} -d 60 -l 10       60s between cycles, at most 10 cycles
  {0} -s                show statistics
  {0} -c                remove log files
)",
      argv0);
}

static bool setup_file_logging(const Config &cfg) {
  try {
    log::setup(cfg.log_file, cfg.verbose);
    return true;
  } catch (const spdlog::spdlog_ex &e) {
    spdlog::error("cannot open log file {}: {}", cfg.log_file.string(),
                  e.what());
    return false;
  }
}

static int clean_logs(const Config &cfg) {
  log::setup_console(cfg.verbose);
  spdlog::info("cleaning log files...");
  int rc = 0;
  for (const auto &p :
       {cfg.log_file, cfg.success_ledger(), cfg.error_ledger()}) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
      spdlog::error("cannot remove {}: {}", p.string(), ec.message());
      rc = 1;
    }
  }
  if (rc == 0)
    log::success("log files cleaned ✓");
  return rc;
}

static int run_loop(const Overrides &o) {
  std::string error;
  auto paths = make_config(o, false, error);
  if (!paths || !setup_file_logging(*paths))
    return 1;

  auto cfg = make_config(o, true, error);
  if (!cfg) {
    spdlog::error("{}", error);
    return 1;
  }

  spdlog::info("automated development loop starting");
  std::error_code ec;
  spdlog::info("working directory: {}", fs::current_path(ec).string());

  if (!check_prerequisites(*cfg))
    return 1;

  signals::install_shutdown_handlers();

  GitRepo repo(cfg->work_dir, cfg->git_program);
  ProcessAgent agent(*cfg);
  StatisticsReporter reporter(*cfg);
  LoopController loop(*cfg, repo, agent, reporter, signals::shutdown_flag());
  int rc = loop.run();
  log::shutdown();
  return rc;
}

int App::run(int argc, char **argv) {
  const char *argv0 = argc > 0 ? argv[0] : "devloop";

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    print_help(argv0);
    return 1;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help(argv0);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          fmt::print("devloop {} (built {})\n", DEVLOOP_VERSION,
                     DEVLOOP_BUILD_TIME);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStats>) {
          std::string error;
          auto cfg = make_config(c.o, false, error);
          if (!cfg || !setup_file_logging(*cfg))
            return 1;
          StatisticsReporter reporter(*cfg);
          (void)reporter.report();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdClean>) {
          std::string error;
          auto cfg = make_config(c.o, false, error);
          if (!cfg)
            return 1;
          return clean_logs(*cfg);

        } else {
          return run_loop(c.o);
        }
      },
      *pr.cmd);
}

} // namespace devloop
