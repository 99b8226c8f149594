#include <devloop/io.hpp>
#include <devloop/log.hpp>
#include <devloop/prereq.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace devloop {

std::optional<fs::path> find_executable(const std::string &name) {
  if (name.empty())
    return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0)
      return fs::path(name);
    return std::nullopt;
  }

  const char *path_env = ::getenv("PATH");
  if (!path_env)
    return std::nullopt;
  std::istringstream dirs(path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    fs::path cand = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
    std::error_code ec;
    if (fs::is_regular_file(cand, ec) && ::access(cand.c_str(), X_OK) == 0)
      return cand;
  }
  return std::nullopt;
}

bool check_prerequisites(const Config &cfg) {
  spdlog::info("checking environment...");

  std::error_code ec;
  if (!fs::is_regular_file(cfg.prompt_file, ec)) {
    spdlog::error("prompt file {} does not exist!", cfg.prompt_file.string());
    return false;
  }

  if (!fs::is_directory(cfg.docs_dir, ec)) {
    spdlog::warn("{} directory does not exist, creating it...",
                 cfg.docs_dir.string());
    try {
      io::ensure_dir(cfg.docs_dir);
    } catch (const fs::filesystem_error &e) {
      spdlog::error("cannot create {}: {}", cfg.docs_dir.string(), e.what());
      return false;
    }
  }

  if (!find_executable(cfg.agent_program)) {
    spdlog::error("{} command not available, make sure it is installed",
                  cfg.agent_program);
    return false;
  }

  if (!find_executable(cfg.git_program)) {
    spdlog::error("{} command not available, please install Git",
                  cfg.git_program);
    return false;
  }

  log::success("environment check passed ✓");
  return true;
}

} // namespace devloop
