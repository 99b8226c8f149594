#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace devloop {

// Tracks the content fingerprint (XXH3-64) of the prompt file across cycles.
class PromptArtifact {
public:
  explicit PromptArtifact(std::filesystem::path path)
      : path_(std::move(path)) {}

  const std::filesystem::path& path() const { return path_; }
  bool exists() const;

  std::optional<std::string> fingerprint() const;

  // Re-reads the file. The first observation only primes the state and
  // returns false; later calls return true when the contents changed.
  bool refresh();

  const std::optional<std::string>& current() const { return current_; }
  const std::optional<std::string>& previous() const { return previous_; }

private:
  std::filesystem::path path_;
  std::optional<std::string> current_;
  std::optional<std::string> previous_;
  bool primed_ = false;
};

} // namespace devloop
