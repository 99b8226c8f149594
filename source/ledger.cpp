#include <devloop/io.hpp>
#include <devloop/ledger.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <stdexcept>

namespace devloop {

std::string format_record(const LedgerRecord &rec) {
  if (rec.success)
    return fmt::format("{} - Loop {}: SUCCESS ({}s)", rec.timestamp, rec.cycle,
                       rec.duration_sec.value_or(0));
  return fmt::format("{} - Loop {}: FAILED", rec.timestamp, rec.cycle);
}

template <typename T> static bool to_number(std::string_view s, T &out) {
  if (s.empty())
    return false;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

std::optional<LedgerRecord> parse_record(std::string_view line) {
  if (!line.empty() && line.back() == '\r')
    line.remove_suffix(1);

  constexpr std::string_view kSep = " - Loop ";
  auto sep = line.find(kSep);
  if (sep == std::string_view::npos)
    return std::nullopt;

  LedgerRecord rec;
  rec.timestamp = std::string(line.substr(0, sep));

  auto rest = line.substr(sep + kSep.size());
  auto colon = rest.find(": ");
  if (colon == std::string_view::npos || !to_number(rest.substr(0, colon), rec.cycle))
    return std::nullopt;

  auto verdict = rest.substr(colon + 2);
  if (verdict == "FAILED") {
    rec.success = false;
    return rec;
  }

  constexpr std::string_view kOk = "SUCCESS (";
  if (verdict.substr(0, kOk.size()) != kOk || verdict.size() < kOk.size() + 2 ||
      verdict.substr(verdict.size() - 2) != "s)")
    return std::nullopt;
  std::int64_t d = 0;
  if (!to_number(verdict.substr(kOk.size(), verdict.size() - kOk.size() - 2), d))
    return std::nullopt;
  rec.success = true;
  rec.duration_sec = d;
  return rec;
}

bool Ledger::append(const LedgerRecord &rec) {
  try {
    io::append_line(path_, format_record(rec));
    return true;
  } catch (const std::exception &e) {
    spdlog::error("[ledger] append to {} failed: {}", path_.string(), e.what());
    return false;
  }
}

std::size_t Ledger::count() const { return io::count_lines(path_); }

std::vector<LedgerRecord> Ledger::read() const {
  std::vector<LedgerRecord> out;
  std::ifstream in(path_);
  std::string line;
  while (std::getline(in, line)) {
    if (auto rec = parse_record(line))
      out.push_back(std::move(*rec));
  }
  return out;
}

} // namespace devloop
