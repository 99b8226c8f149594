#pragma once
#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace devloop {

std::optional<std::filesystem::path> find_executable(const std::string& name);

// Logs every problem found. Creates the docs directory when missing.
bool check_prerequisites(const Config& cfg);

} // namespace devloop
