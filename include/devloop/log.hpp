#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace devloop {
namespace log {

enum class Level { Info, Success, Warn, Error };

// Console (colored) + append-only combined log file. Every record is flushed
// before the call returns; a failed write aborts the process.
// Throws spdlog::spdlog_ex when the log file cannot be opened.
void setup(const std::filesystem::path& log_file, bool verbose);

// Console only, used by commands that must not touch the log file.
void setup_console(bool verbose);

void shutdown();

void write(Level level, std::string_view message);

template <typename... Args>
void success(fmt::format_string<Args...> f, Args&&... args) {
  write(Level::Success, fmt::format(f, std::forward<Args>(args)...));
}

// Raw agent output: no timestamp, no level, one line.
void agent_output(std::string_view line);

} // namespace log
} // namespace devloop
