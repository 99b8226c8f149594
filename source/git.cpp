#include <devloop/git.hpp>
#include <devloop/process.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace devloop {

static std::string trim_right(std::string s) {
  while (!s.empty() &&
         (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
    s.pop_back();
  return s;
}

GitRepo::GitRepo(fs::path root, std::string git)
    : root_(std::move(root)), git_(std::move(git)) {}

bool GitRepo::run_git(const std::vector<std::string> &args, int &rc,
                      std::string *out, std::string *err) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(git_);
  argv.insert(argv.end(), args.begin(), args.end());

  auto r = run_command(argv, root_);
  rc = r.exit_code;
  if (rc != 0)
    spdlog::debug("[git] {} -> rc={} {}", fmt::join(args, " "), rc,
                  trim_right(r.err));
  else
    spdlog::debug("[git] {}", fmt::join(args, " "));
  if (out)
    *out = std::move(r.out);
  if (err)
    *err = std::move(r.err);
  return rc == 0;
}

bool GitRepo::is_initialized() const {
  std::error_code ec;
  return fs::exists(root_ / ".git", ec);
}

void GitRepo::ensure_identity() {
  int rc = 0;
  std::string out;
  if (run_git({"config", "user.email"}, rc, &out) && !trim_right(out).empty())
    return;
  if (!run_git({"config", "user.name", "devloop"}, rc) ||
      !run_git({"config", "user.email", "devloop@localhost"}, rc))
    spdlog::warn("[git] cannot set local committer identity (rc={})", rc);
}

bool GitRepo::init() {
  int rc = 0;
  std::string out, err;
  if (!run_git({"init", "-q"}, rc, &out, &err)) {
    spdlog::error("[git] init failed: rc={} err={}", rc, trim_right(err));
    return false;
  }
  ensure_identity();
  return true;
}

bool GitRepo::stage_all() {
  int rc = 0;
  std::string err;
  if (!run_git({"add", "-A"}, rc, nullptr, &err)) {
    spdlog::error("[git] add failed: rc={} err={}", rc, trim_right(err));
    return false;
  }
  return true;
}

bool GitRepo::commit(const std::string &message, bool allow_empty) {
  std::vector<std::string> args{"commit", "-q", "-m", message};
  if (allow_empty)
    args.push_back("--allow-empty");

  int rc = 0;
  std::string out, err;
  if (!run_git(args, rc, &out, &err)) {
    auto detail = trim_right(err.empty() ? out : err);
    spdlog::error("[git] commit failed: rc={} err={}", rc, detail);
    return false;
  }
  return true;
}

std::optional<bool> GitRepo::has_uncommitted_changes() const {
  int rc = 0;
  std::string out, err;
  if (!run_git({"status", "--porcelain"}, rc, &out, &err)) {
    spdlog::error("[git] status failed: rc={} err={}", rc, trim_right(err));
    return std::nullopt;
  }
  return !trim_right(out).empty();
}

std::optional<std::string> GitRepo::head() const {
  if (!is_initialized())
    return std::nullopt;
  int rc = 0;
  std::string out;
  if (!run_git({"rev-parse", "HEAD"}, rc, &out))
    return std::nullopt;
  return trim_right(out);
}

std::size_t GitRepo::commit_count() const {
  int rc = 0;
  std::string out;
  if (!run_git({"rev-list", "--count", "HEAD"}, rc, &out))
    return 0;
  return static_cast<std::size_t>(std::strtoull(out.c_str(), nullptr, 10));
}

} // namespace devloop
