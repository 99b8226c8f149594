#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devloop {

// Version-control capability consumed by the initializer and the committer.
class Repository {
public:
  virtual ~Repository() = default;

  virtual bool is_initialized() const = 0;
  virtual bool init() = 0;
  virtual bool stage_all() = 0;
  virtual bool commit(const std::string& message, bool allow_empty) = 0;

  // Staged, unstaged or untracked changes relative to HEAD.
  // std::nullopt when the state could not be queried.
  virtual std::optional<bool> has_uncommitted_changes() const = 0;
};

class GitRepo final : public Repository {
public:
  explicit GitRepo(std::filesystem::path root, std::string git = "git");

  bool is_initialized() const override;
  bool init() override;
  bool stage_all() override;
  bool commit(const std::string& message, bool allow_empty) override;
  std::optional<bool> has_uncommitted_changes() const override;

  std::optional<std::string> head() const;
  std::size_t commit_count() const;

private:
  bool run_git(const std::vector<std::string>& args, int& rc,
               std::string* out = nullptr, std::string* err = nullptr) const;
  void ensure_identity();

  std::filesystem::path root_;
  std::string git_;
};

} // namespace devloop
