#include <devloop/clock.hpp>

#include <ctime>

namespace devloop {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf);
}

std::string timestamp_now() {
  return format_timestamp(std::chrono::system_clock::now());
}

} // namespace devloop
