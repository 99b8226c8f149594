#pragma once
#include "git.hpp"

#include <string>
#include <string_view>

namespace devloop {

enum class CommitResult { NoChanges, Committed, Failed };

std::string_view to_string(CommitResult r);

// "Auto-commit: <ts>" or "Auto-commit: <ts> [Initial]"
std::string commit_message(std::string_view timestamp, bool initial);

class CycleCommitter {
public:
  explicit CycleCommitter(Repository& repo) : repo_(repo) {}

  CommitResult commit_if_changed();

private:
  Repository& repo_;
};

} // namespace devloop
