#include <devloop/agent.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstring>

namespace fs = std::filesystem;

namespace devloop {

ProcessAgent::ProcessAgent(const Config& cfg)
    : program_(cfg.agent_program), args_(cfg.agent_args),
      work_dir_(cfg.work_dir) {}

std::vector<std::string> ProcessAgent::command_line(const fs::path& prompt) const {
  std::vector<std::string> argv;
  argv.reserve(args_.size() + 2);
  argv.push_back(program_);
  argv.insert(argv.end(), args_.begin(), args_.end());
  argv.push_back(prompt.string());
  return argv;
}

std::string ProcessAgent::describe(const fs::path& prompt) const {
  return fmt::format("{}", fmt::join(command_line(prompt), " "));
}

AgentResult ProcessAgent::invoke(const fs::path& prompt,
                                 const LineSink& on_output,
                                 const std::atomic_bool& stop) {
  auto r = run_streaming(command_line(prompt), work_dir_, on_output, stop);

  AgentResult res;
  res.launched = r.launched;
  res.exit_code = r.exit_code;
  res.interrupted = r.interrupted;
  if (!r.launched)
    res.error = fmt::format("cannot execute {}: {}", program_,
                            r.exec_errno ? std::strerror(r.exec_errno)
                                         : "process creation failed");
  return res;
}

} // namespace devloop
