#include <devloop/ledger.hpp>
#include <devloop/stats.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace devloop {

std::size_t count_files_with_extension(const fs::path &dir,
                                       const std::string &ext) {
  std::size_t n = 0;
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return 0;
  fs::recursive_directory_iterator it(
      dir, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code e2;
    if (it->is_regular_file(e2) && it->path().extension() == ext)
      ++n;
  }
  return n;
}

Statistics StatisticsReporter::collect() const {
  Statistics s;
  Ledger ok(cfg_.success_ledger());
  Ledger failed(cfg_.error_ledger());
  s.succeeded = ok.count();
  s.failed = failed.count();

  std::size_t timed = 0;
  for (const auto &rec : ok.read()) {
    if (!rec.duration_sec)
      continue;
    s.total_duration_sec += *rec.duration_sec;
    ++timed;
  }
  if (timed > 0)
    s.avg_duration_sec =
        static_cast<double>(s.total_duration_sec) / static_cast<double>(timed);

  std::error_code ec;
  if (fs::is_directory(cfg_.docs_dir, ec))
    s.doc_files = count_files_with_extension(cfg_.docs_dir, cfg_.doc_extension);
  return s;
}

Statistics StatisticsReporter::report() {
  Statistics s = collect();
  spdlog::info("=== development loop statistics ===");
  spdlog::info("successful cycles: {}", s.succeeded);
  spdlog::info("failed cycles: {}", s.failed);
  spdlog::info("total cycles: {}", s.total());
  if (s.avg_duration_sec)
    spdlog::info("agent time: {}s total, {:.1f}s average", s.total_duration_sec,
                 *s.avg_duration_sec);
  if (s.doc_files)
    spdlog::info("documentation files ({}): {}", cfg_.doc_extension,
                 *s.doc_files);
  return s;
}

} // namespace devloop
