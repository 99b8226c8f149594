#pragma once
#include "config.hpp"
#include "process.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace devloop {

struct AgentResult {
  bool launched{false};
  int exit_code{-1};
  bool interrupted{false};
  std::string error;

  bool ok() const { return launched && !interrupted && exit_code == 0; }
};

class Agent {
public:
  virtual ~Agent() = default;

  virtual AgentResult invoke(const std::filesystem::path& prompt,
                             const LineSink& on_output,
                             const std::atomic_bool& stop) = 0;

  virtual std::string describe(const std::filesystem::path& prompt) const = 0;
};

// Runs the configured agent executable as a child process:
//   <agent_program> <agent_args...> <prompt>
class ProcessAgent final : public Agent {
public:
  explicit ProcessAgent(const Config& cfg);

  AgentResult invoke(const std::filesystem::path& prompt,
                     const LineSink& on_output,
                     const std::atomic_bool& stop) override;

  std::string describe(const std::filesystem::path& prompt) const override;

  std::vector<std::string>
  command_line(const std::filesystem::path& prompt) const;

private:
  std::string program_;
  std::vector<std::string> args_;
  std::filesystem::path work_dir_;
};

} // namespace devloop
