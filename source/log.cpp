#include <devloop/log.hpp>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

namespace devloop {
namespace log {

namespace {

constexpr const char *kMainName = "devloop";
constexpr const char *kSuccessName = "devloop.success";
constexpr const char *kAgentName = "devloop.agent";
constexpr const char *kPattern = "%^[%Y-%m-%d %H:%M:%S] %*:%$ %v";

std::shared_ptr<spdlog::logger> g_success;
std::shared_ptr<spdlog::logger> g_agent;

// %* -> SUCCESS / INFO / WARN / ERROR / DEBUG
class LevelLabel : public spdlog::custom_flag_formatter {
public:
  void format(const spdlog::details::log_msg &msg, const std::tm &,
              spdlog::memory_buf_t &dest) override {
    std::string_view label = label_for(msg);
    dest.append(label.data(), label.data() + label.size());
  }

  std::unique_ptr<custom_flag_formatter> clone() const override {
    return std::make_unique<LevelLabel>();
  }

private:
  static std::string_view label_for(const spdlog::details::log_msg &msg) {
    std::string_view name(msg.logger_name.data(), msg.logger_name.size());
    if (name == kSuccessName)
      return "SUCCESS";
    switch (msg.level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
      return "DEBUG";
    case spdlog::level::info:
      return "INFO";
    case spdlog::level::warn:
      return "WARN";
    default:
      return "ERROR";
    }
  }
};

std::unique_ptr<spdlog::formatter> make_formatter() {
  auto f = std::make_unique<spdlog::pattern_formatter>();
  f->add_flag<LevelLabel>('*').set_pattern(kPattern);
  return f;
}

void on_write_failure(const std::string &msg) {
  std::fprintf(stderr, "devloop: log write failed: %s\n", msg.c_str());
  std::abort();
}

void prepare(const std::shared_ptr<spdlog::logger> &lg) {
  lg->flush_on(spdlog::level::trace);
  lg->set_error_handler(on_write_failure);
}

void install(const std::shared_ptr<spdlog::sinks::sink> &file_sink,
             const std::shared_ptr<spdlog::sinks::sink> &agent_file_sink,
             bool verbose) {
  auto console = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
  console->set_color(spdlog::level::info, console->blue);
  console->set_color(spdlog::level::warn, console->yellow_bold);
  console->set_color(spdlog::level::err, console->red);
  console->set_color(spdlog::level::debug, console->cyan);

  auto success_console =
      std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
  success_console->set_color(spdlog::level::info, success_console->green);

  std::vector<spdlog::sink_ptr> main_sinks{console};
  std::vector<spdlog::sink_ptr> success_sinks{success_console};
  std::vector<spdlog::sink_ptr> agent_sinks{
      std::make_shared<spdlog::sinks::stdout_sink_mt>()};
  if (file_sink) {
    main_sinks.push_back(file_sink);
    success_sinks.push_back(file_sink);
  }
  if (agent_file_sink)
    agent_sinks.push_back(agent_file_sink);

  auto main_logger = std::make_shared<spdlog::logger>(
      kMainName, main_sinks.begin(), main_sinks.end());
  main_logger->set_formatter(make_formatter());
  main_logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  prepare(main_logger);

  auto success_logger = std::make_shared<spdlog::logger>(
      kSuccessName, success_sinks.begin(), success_sinks.end());
  success_logger->set_formatter(make_formatter());
  prepare(success_logger);

  auto agent_logger = std::make_shared<spdlog::logger>(
      kAgentName, agent_sinks.begin(), agent_sinks.end());
  agent_logger->set_pattern("%v");
  prepare(agent_logger);

  spdlog::set_default_logger(main_logger);
  g_success = std::move(success_logger);
  g_agent = std::move(agent_logger);
}

} // namespace

void setup(const std::filesystem::path &log_file, bool verbose) {
  // The agent logger keeps its own handle on the same file so raw output can
  // use a bare "%v" pattern; both append and flush every record.
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      log_file.string(), false);
  auto agent_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      log_file.string(), false);
  install(file_sink, agent_file_sink, verbose);
}

void setup_console(bool verbose) { install(nullptr, nullptr, verbose); }

void shutdown() {
  spdlog::default_logger()->flush();
  if (g_success)
    g_success->flush();
  if (g_agent)
    g_agent->flush();
  g_success.reset();
  g_agent.reset();
  spdlog::set_default_logger(
      std::make_shared<spdlog::logger>(
          kMainName, std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>()));
}

void write(Level level, std::string_view message) {
  spdlog::string_view_t msg(message.data(), message.size());
  switch (level) {
  case Level::Info:
    spdlog::default_logger_raw()->log(spdlog::level::info, msg);
    break;
  case Level::Success:
    if (g_success)
      g_success->log(spdlog::level::info, msg);
    else
      spdlog::default_logger_raw()->log(spdlog::level::info, msg);
    break;
  case Level::Warn:
    spdlog::default_logger_raw()->log(spdlog::level::warn, msg);
    break;
  case Level::Error:
    spdlog::default_logger_raw()->log(spdlog::level::err, msg);
    break;
  }
}

void agent_output(std::string_view line) {
  spdlog::string_view_t msg(line.data(), line.size());
  if (g_agent)
    g_agent->log(spdlog::level::info, msg);
  else
    spdlog::default_logger_raw()->log(spdlog::level::info, msg);
}

} // namespace log
} // namespace devloop
