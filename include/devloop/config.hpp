#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace devloop {

// Built once at startup, then only read.
struct Config {
  std::filesystem::path work_dir = ".";
  std::filesystem::path prompt_file = "./prompt.md";
  std::filesystem::path log_file = "./dev_loop.log";
  std::filesystem::path docs_dir = "docs";
  std::string doc_extension = ".md";

  int loop_delay_sec = 10;
  int max_loops = 50;

  std::string agent_program = "claude";
  std::vector<std::string> agent_args = {"--dangerously-skip-permissions",
                                         "-p"};
  std::string git_program = "git";

  bool verbose = false;

  std::filesystem::path success_ledger() const;
  std::filesystem::path error_ledger() const;
};

} // namespace devloop
