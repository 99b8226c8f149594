#include <devloop/prompt.hpp>

#include <fstream>
#include <iterator>
#include <sstream>
#include <xxhash.h>

namespace fs = std::filesystem;

namespace devloop {

bool PromptArtifact::exists() const {
  std::error_code ec;
  return fs::is_regular_file(path_, ec);
}

std::optional<std::string> PromptArtifact::fingerprint() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in)
    return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  auto h = XXH3_64bits(data.data(), data.size());
  std::ostringstream oss;
  oss << std::hex << h;
  return oss.str();
}

bool PromptArtifact::refresh() {
  auto now = fingerprint();
  previous_ = current_;
  current_ = now;
  if (!primed_) {
    primed_ = true;
    return false;
  }
  return previous_ != current_;
}

} // namespace devloop
