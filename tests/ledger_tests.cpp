#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "test_support.hpp"

#include <devloop/ledger.hpp>

using namespace devloop;
using devloop_test::make_tmpdir;
using devloop_test::write_file;

TEST_CASE("Ledger record text") {
  LedgerRecord ok{"2024-05-01 10:00:00", 3, true, 42};
  CHECK(format_record(ok) == "2024-05-01 10:00:00 - Loop 3: SUCCESS (42s)");

  LedgerRecord bad{"2024-05-01 10:05:00", 4, false, std::nullopt};
  CHECK(format_record(bad) == "2024-05-01 10:05:00 - Loop 4: FAILED");

  auto parsed = parse_record("2024-05-01 10:00:00 - Loop 12: SUCCESS (7s)");
  REQUIRE(parsed);
  CHECK(parsed->timestamp == "2024-05-01 10:00:00");
  CHECK(parsed->cycle == 12);
  CHECK(parsed->success);
  CHECK(parsed->duration_sec == 7);

  parsed = parse_record("2024-05-01 10:00:00 - Loop 2: FAILED\r");
  REQUIRE(parsed);
  CHECK_FALSE(parsed->success);
  CHECK_FALSE(parsed->duration_sec);

  CHECK_FALSE(parse_record("garbage"));
  CHECK_FALSE(parse_record("ts - Loop x: FAILED"));
  CHECK_FALSE(parse_record("ts - Loop 1: SUCCESS (s)"));
}

TEST_CASE("Ledger appends and counts records") {
  auto dir = make_tmpdir("devloop_ledger_");
  Ledger ledger(dir / "dev_loop.log.success");
  CHECK(ledger.count() == 0);
  CHECK(ledger.read().empty());

  REQUIRE(ledger.append({"2024-05-01 10:00:00", 1, true, 5}));
  REQUIRE(ledger.append({"2024-05-01 10:01:00", 2, true, 9}));
  CHECK(ledger.count() == 2);

  auto recs = ledger.read();
  REQUIRE(recs.size() == 2);
  CHECK(recs[0].cycle == 1);
  CHECK(recs[1].duration_sec == 9);
}

TEST_CASE("Ledger keeps records written before") {
  auto dir = make_tmpdir("devloop_ledger_keep_");
  auto path = dir / "dev_loop.log.error";
  write_file(path, "2024-01-01 00:00:00 - Loop 1: FAILED\n");

  Ledger ledger(path);
  REQUIRE(ledger.append({"2024-01-02 00:00:00", 1, false, std::nullopt}));
  CHECK(ledger.count() == 2);
  CHECK(devloop_test::read_file(path) ==
        "2024-01-01 00:00:00 - Loop 1: FAILED\n"
        "2024-01-02 00:00:00 - Loop 1: FAILED\n");
}

TEST_CASE("Ledger append into a missing directory fails softly") {
  auto dir = make_tmpdir("devloop_ledger_missing_");
  Ledger ledger(dir / "no" / "such" / "ledger");
  CHECK_FALSE(ledger.append({"ts", 1, false, std::nullopt}));
  CHECK(ledger.count() == 0);
}
