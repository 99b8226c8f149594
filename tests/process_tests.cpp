#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "test_support.hpp"

#include <devloop/process.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace devloop;
using devloop_test::make_tmpdir;

TEST_CASE("run_command captures output and exit code") {
  auto dir = make_tmpdir("devloop_proc_");
  auto r = run_command({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, dir);
  CHECK(r.exit_code == 3);
  CHECK(r.out == "out\n");
  CHECK(r.err == "err\n");

  r = run_command({"/bin/sh", "-c", "pwd"}, dir);
  CHECK(r.exit_code == 0);
  CHECK(std::filesystem::equivalent(r.out.substr(0, r.out.size() - 1), dir));
}

TEST_CASE("run_command survives a child flooding stderr") {
  auto dir = make_tmpdir("devloop_proc_flood_");
  auto r = run_command(
      {"/bin/sh", "-c",
       "head -c 200000 /dev/zero | tr '\\0' x 1>&2; echo done"},
      dir);
  CHECK(r.exit_code == 0);
  CHECK(r.out == "done\n");
  CHECK(r.err.size() == 200000);
  CHECK(r.err.find_first_not_of('x') == std::string::npos);
}

TEST_CASE("run_command reports a missing program") {
  auto r = run_command({"/nonexistent/devloop-prog"}, ".");
  CHECK(r.exit_code == 127);
}

TEST_CASE("run_streaming delivers merged lines in order") {
  auto dir = make_tmpdir("devloop_stream_");
  std::vector<std::string> lines;
  std::atomic_bool stop{false};

  auto r = run_streaming(
      {"/bin/sh", "-c", "echo one; echo two 1>&2; printf 'three'; exit 5"}, dir,
      [&](std::string_view l) { lines.emplace_back(l); }, stop);

  CHECK(r.launched);
  CHECK_FALSE(r.interrupted);
  CHECK(r.exit_code == 5);
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "one");
  CHECK(lines[1] == "two");
  CHECK(lines[2] == "three");
}

TEST_CASE("run_streaming reports exec failure") {
  std::atomic_bool stop{false};
  int seen = 0;
  auto r = run_streaming({"/nonexistent/devloop-agent", "-p", "x"}, ".",
                         [&](std::string_view) { ++seen; }, stop);
  CHECK_FALSE(r.launched);
  CHECK(r.exec_errno != 0);
  CHECK(seen == 0);
}

TEST_CASE("run_streaming returns promptly when stop is raised") {
  std::atomic_bool stop{false};
  std::thread raiser([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stop.store(true);
  });
  auto started = std::chrono::steady_clock::now();
  auto r = run_streaming({"/bin/sh", "-c", "echo begin; exec sleep 5"}, ".",
                         [](std::string_view) {}, stop);
  raiser.join();
  auto elapsed = std::chrono::steady_clock::now() - started;

  CHECK(r.launched);
  CHECK(r.interrupted);
  CHECK(elapsed < std::chrono::seconds(3));
}
