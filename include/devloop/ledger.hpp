#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devloop {

struct LedgerRecord {
  std::string timestamp;
  int cycle{0};
  bool success{false};
  std::optional<std::int64_t> duration_sec;
};

// "<ts> - Loop <n>: SUCCESS (<d>s)" or "<ts> - Loop <n>: FAILED"
std::string format_record(const LedgerRecord& rec);
std::optional<LedgerRecord> parse_record(std::string_view line);

// Append-only outcome ledger, one record per line. Existing lines are never
// rewritten.
class Ledger {
public:
  explicit Ledger(std::filesystem::path path) : path_(std::move(path)) {}

  bool append(const LedgerRecord& rec);

  std::size_t count() const;
  std::vector<LedgerRecord> read() const;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace devloop
