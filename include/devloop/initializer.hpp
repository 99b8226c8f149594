#pragma once
#include "git.hpp"

#include <string>

namespace devloop {

class RepoInitializer {
public:
  explicit RepoInitializer(Repository& repo) : repo_(repo) {}

  // Creates the repository and its first snapshot commit unless it already
  // exists. Returns true when this call created it.
  // Throws std::runtime_error on failure.
  bool ensure_initialized();

private:
  Repository& repo_;
};

} // namespace devloop
