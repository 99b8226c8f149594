#pragma once
#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace devloop {

struct Statistics {
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::optional<std::size_t> doc_files;
  std::optional<double> avg_duration_sec;
  std::int64_t total_duration_sec{0};

  std::size_t total() const { return succeeded + failed; }
};

// Regular files under `dir` (recursive) whose extension equals `ext`.
std::size_t count_files_with_extension(const std::filesystem::path& dir,
                                       const std::string& ext);

class StatisticsReporter {
public:
  explicit StatisticsReporter(const Config& cfg) : cfg_(cfg) {}
  virtual ~StatisticsReporter() = default;

  Statistics collect() const;

  // collect() and log the result. Never throws.
  virtual Statistics report();

private:
  const Config& cfg_;
};

} // namespace devloop
