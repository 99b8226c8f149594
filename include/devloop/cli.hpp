#pragma once
#include "config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace devloop {

struct Overrides {
  std::optional<std::string> delay;
  std::optional<std::string> loops;
  std::optional<std::string> prompt;
  std::optional<std::string> log_file;
  std::optional<std::string> docs_dir;
  std::optional<std::string> agent;
  bool verbose = false;
};

struct CmdRun {
  Overrides o;
};
struct CmdStats {
  Overrides o;
};
struct CmdClean {
  Overrides o;
};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdRun, CmdStats, CmdClean, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char** argv);

// ^[0-9]+$, >= 1 and representable as int.
std::optional<int> parse_positive(std::string_view s);

// Defaults overridden by flags. Numeric values are validated only when
// `validate_numbers` is set; on failure `error` is filled.
std::optional<Config> make_config(const Overrides& o, bool validate_numbers,
                                  std::string& error);

} // namespace devloop
