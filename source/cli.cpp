#include <devloop/cli.hpp>

#include <charconv>
#include <limits>
#include <string_view>

namespace devloop {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

std::optional<int> parse_positive(std::string_view s) {
  if (s.empty())
    return std::nullopt;
  for (char c : s)
    if (c < '0' || c > '9')
      return std::nullopt;
  int v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size() || v < 1)
    return std::nullopt;
  return v;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  Overrides o;

  // Value-taking flag; a missing value is an error.
  auto take = [&](int &i, std::string_view flag,
                  std::optional<std::string> &dst) -> bool {
    if (!has_arg(i, argc)) {
      r.error = std::string(flag) + " requires a value";
      return false;
    }
    dst = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "-h" || a == "--help") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    }
    if (a == "-s" || a == "--stats") {
      r.cmd = CmdStats{o};
      return r;
    }
    if (a == "-c" || a == "--clean") {
      r.cmd = CmdClean{o};
      return r;
    }

    if (a == "-d" || a == "--delay") {
      if (!take(i, a, o.delay))
        return r;
    } else if (a == "-l" || a == "--loops") {
      if (!take(i, a, o.loops))
        return r;
    } else if (a == "-p" || a == "--prompt") {
      if (!take(i, a, o.prompt))
        return r;
    } else if (a == "--log-file") {
      if (!take(i, a, o.log_file))
        return r;
    } else if (a == "--docs") {
      if (!take(i, a, o.docs_dir))
        return r;
    } else if (a == "--agent") {
      if (!take(i, a, o.agent))
        return r;
    } else if (a == "-v" || a == "--verbose") {
      o.verbose = true;
    } else {
      r.error = "unknown argument: " + std::string(a);
      return r;
    }
  }

  r.cmd = CmdRun{o};
  return r;
}

std::optional<Config> make_config(const Overrides &o, bool validate_numbers,
                                  std::string &error) {
  Config cfg;
  if (o.prompt)
    cfg.prompt_file = *o.prompt;
  if (o.log_file)
    cfg.log_file = *o.log_file;
  if (o.docs_dir)
    cfg.docs_dir = *o.docs_dir;
  if (o.agent)
    cfg.agent_program = *o.agent;
  cfg.verbose = o.verbose;

  if (!validate_numbers)
    return cfg;

  if (o.delay) {
    auto v = parse_positive(*o.delay);
    if (!v) {
      error = "loop delay must be a positive integer (got '" + *o.delay + "')";
      return std::nullopt;
    }
    cfg.loop_delay_sec = *v;
  }
  if (o.loops) {
    auto v = parse_positive(*o.loops);
    if (!v) {
      error = "max loops must be a positive integer (got '" + *o.loops + "')";
      return std::nullopt;
    }
    cfg.max_loops = *v;
  }
  return cfg;
}

} // namespace devloop
