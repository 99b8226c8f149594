#pragma once
#include <chrono>
#include <string>

namespace devloop {

// Local wall-clock time as "YYYY-MM-DD HH:MM:SS".
std::string timestamp_now();
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace devloop
