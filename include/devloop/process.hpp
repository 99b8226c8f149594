#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace devloop {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
};

// Runs argv[0] from PATH in `cwd` and waits. exit_code is -1 if the child
// could not be created, 127 if exec failed, 128+N if killed by signal N.
CmdResult run_command(const std::vector<std::string>& argv,
                      const std::filesystem::path& cwd);

using LineSink = std::function<void(std::string_view line)>;

struct StreamResult {
  bool launched{false};
  int exit_code{-1};
  int exec_errno{0};
  bool interrupted{false};
};

// Runs argv with stdout and stderr merged into one pipe and hands every line
// to `on_line` as soon as it is complete. When `stop` becomes true while the
// child is still alive the call returns with interrupted=true; the child is
// neither killed nor reaped.
StreamResult run_streaming(const std::vector<std::string>& argv,
                           const std::filesystem::path& cwd,
                           const LineSink& on_line,
                           const std::atomic_bool& stop);

} // namespace devloop
