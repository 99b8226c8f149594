#include <devloop/config.hpp>

namespace fs = std::filesystem;

namespace devloop {

fs::path Config::success_ledger() const {
  fs::path p = log_file;
  p += ".success";
  return p;
}

fs::path Config::error_ledger() const {
  fs::path p = log_file;
  p += ".error";
  return p;
}

} // namespace devloop
