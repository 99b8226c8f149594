#pragma once
#include <cstddef>
#include <filesystem>
#include <string_view>

namespace devloop {
namespace io {
  void ensure_dir(const std::filesystem::path& p);

  // Appends `line` plus '\n' with O_APPEND and syncs before returning.
  // Throws std::runtime_error when the file cannot be opened or written.
  void append_line(const std::filesystem::path& path, std::string_view line);

  // Number of '\n' in the file, 0 if it does not exist.
  std::size_t count_lines(const std::filesystem::path& path);
}
} // namespace devloop
