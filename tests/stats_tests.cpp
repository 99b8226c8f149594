#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "test_support.hpp"

#include <devloop/io.hpp>
#include <devloop/prereq.hpp>
#include <devloop/stats.hpp>

using namespace devloop;
using devloop_test::make_tmpdir;
using devloop_test::write_file;

TEST_CASE("Statistics from ledgers and docs") {
  auto dir = make_tmpdir("devloop_stats_");
  auto cfg = devloop_test::make_config(dir);
  write_file(cfg.success_ledger(),
             "2024-05-01 10:00:00 - Loop 1: SUCCESS (10s)\n"
             "2024-05-01 10:01:00 - Loop 2: SUCCESS (20s)\n");
  write_file(cfg.error_ledger(), "2024-05-01 10:02:00 - Loop 3: FAILED\n");

  io::ensure_dir(cfg.docs_dir / "api");
  write_file(cfg.docs_dir / "index.md", "#\n");
  write_file(cfg.docs_dir / "api" / "loop.md", "#\n");
  write_file(cfg.docs_dir / "notes.txt", "x\n");

  StatisticsReporter reporter(cfg);
  auto s = reporter.report();
  CHECK(s.succeeded == 2);
  CHECK(s.failed == 1);
  CHECK(s.total() == 3);
  CHECK(s.total_duration_sec == 30);
  REQUIRE(s.avg_duration_sec);
  CHECK(*s.avg_duration_sec == 15.0);
  REQUIRE(s.doc_files);
  CHECK(*s.doc_files == 2);
}

TEST_CASE("Statistics without any files") {
  auto dir = make_tmpdir("devloop_stats_empty_");
  Config cfg;
  cfg.log_file = dir / "dev_loop.log";
  cfg.docs_dir = dir / "docs";

  auto s = StatisticsReporter(cfg).collect();
  CHECK(s.total() == 0);
  CHECK_FALSE(s.avg_duration_sec);
  CHECK_FALSE(s.doc_files);
  CHECK(count_files_with_extension(dir / "missing", ".md") == 0);
}

TEST_CASE("Prerequisite checks") {
  auto dir = make_tmpdir("devloop_prereq_");
  auto cfg = devloop_test::make_config(dir);
  cfg.agent_program = "sh";
  CHECK(find_executable("sh"));
  CHECK_FALSE(find_executable("devloop-definitely-not-installed"));
  CHECK(find_executable("/bin/sh") == std::filesystem::path("/bin/sh"));

  CHECK(check_prerequisites(cfg));
  CHECK(std::filesystem::is_directory(cfg.docs_dir));

  cfg.agent_program = "devloop-definitely-not-installed";
  CHECK_FALSE(check_prerequisites(cfg));

  cfg.agent_program = "sh";
  std::filesystem::remove(cfg.prompt_file);
  CHECK_FALSE(check_prerequisites(cfg));
}
