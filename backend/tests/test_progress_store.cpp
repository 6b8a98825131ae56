#include "../src/storage/ProgressStore.hpp"
#include "../src/core/CardCatalog.hpp"
#include "../src/utils/TimeFormat.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "test_support.hpp"

using testing_support::kDay;
using testing_support::kMay1;
using testing_support::TempDir;
using testing_support::TestSuite;

namespace {

void test_timestamps(TestSuite& suite) {
  suite.require(TimeFormat::toRfc3339(kMay1) == "2024-05-01T00:00:00Z", "UTC timestamps end in Z");

  std::time_t t = 0;
  suite.require(TimeFormat::fromRfc3339("2024-05-01T00:00:00Z", t) && t == kMay1, "parse Z");
  suite.require(TimeFormat::fromRfc3339("2024-05-01T02:00:00+02:00", t) && t == kMay1, "parse positive offset");
  suite.require(TimeFormat::fromRfc3339("2024-04-30T19:30:00-04:30", t) && t == kMay1, "parse negative offset");
  suite.require(TimeFormat::fromRfc3339("2024-05-01T00:00:00.123456789Z", t) && t == kMay1,
                "fractional seconds are dropped");
  suite.require(TimeFormat::fromRfc3339("0001-01-01T00:00:00Z", t), "zero time parses");

  suite.require(!TimeFormat::fromRfc3339("2024-05-01", t), "date only rejected");
  suite.require(!TimeFormat::fromRfc3339("2024-13-01T00:00:00Z", t), "month 13 rejected");
  suite.require(!TimeFormat::fromRfc3339("2024-02-30T00:00:00Z", t), "Feb 30 rejected");
  suite.require(!TimeFormat::fromRfc3339("2024-05-01T00:00:00", t), "missing zone rejected");
  suite.require(!TimeFormat::fromRfc3339("2024-05-01T00:00:00Zjunk", t), "trailing junk rejected");

  suite.require(TimeFormat::daysFromCivil(1970, 1, 1) == 0, "epoch day 0");
  suite.require(TimeFormat::utcDayNumber(kMay1 + kDay - 1) == TimeFormat::utcDayNumber(kMay1), "same UTC day");
  suite.require(TimeFormat::utcDayNumber(-1) == -1, "negative times floor");
  suite.require(TimeFormat::localMidnight(kMay1 + 5 * 3600) == kMay1, "local midnight in UTC");
}

PlayerRecord sample_player() {
  PlayerRecord p;
  p.name = "Alice";
  p.cards["c1"] = ProgressEntry{2, 1, 3, 1, kMay1 + 42};
  p.cards["c2"] = ProgressEntry{6, 4, 5, 0, kMay1 + kDay};
  p.history = {HistoryEvent{"c1", kMay1 + 40, false}, HistoryEvent{"c1", kMay1 + 42, true}};
  p.total_answered = 2;
  return p;
}

void test_round_trip(TestSuite& suite) {
  TempDir dir("store_round_trip");
  const std::string path = dir.file("player_progress.json");

  ProgressStore store(path);
  suite.require(store.load().isOk(), "missing file loads");
  suite.require(store.collection().empty(), "missing file is an empty collection");

  store.collection()["abc"] = sample_player();
  store.collection()["def"].name = "Bob";
  suite.require(store.save().isOk(), "save succeeds");

  ProgressStore reloaded(path);
  suite.require(reloaded.load().isOk(), "reload succeeds");
  suite.require(reloaded.collection().size() == 2, "two players reloaded");

  const PlayerRecord* alice = reloaded.findPlayer("abc");
  suite.require(alice != nullptr, "player abc present");
  if (alice) {
    suite.require(alice->name == "Alice" && alice->total_answered == 2, "name and total preserved");
    const PlayerRecord original = sample_player();
    for (const auto& p : original.cards) {
      auto it = alice->cards.find(p.first);
      suite.require(it != alice->cards.end(), "entry " + p.first + " present");
      if (it == alice->cards.end()) continue;
      suite.require(it->second.box == p.second.box, "box preserved for " + p.first);
      suite.require(it->second.streak == p.second.streak, "streak preserved for " + p.first);
      suite.require(it->second.passed == p.second.passed, "passed preserved for " + p.first);
      suite.require(it->second.failed == p.second.failed, "failed preserved for " + p.first);
      suite.require(it->second.last_reviewed == p.second.last_reviewed, "last_reviewed preserved for " + p.first);
    }
    suite.require(alice->history.size() == 2, "history preserved");
    suite.require(alice->history[1].timestamp == kMay1 + 42 && alice->history[1].correct, "history event preserved");
  }
  suite.require(reloaded.findPlayer("zzz") == nullptr, "unknown player is null");

  const std::string text = testing_support::read_file(path);
  suite.require(text.find("\n  \"abc\": {\n    \"name\": \"Alice\"") != std::string::npos,
                "two-space indentation with fields in declaration order");
  suite.require(text.find("\"last_reviewed\": \"2024-05-01T00:00:42Z\"") != std::string::npos,
                "timestamps as RFC 3339");
}

void test_empty_and_malformed(TestSuite& suite) {
  TempDir dir("store_malformed");
  const std::string path = dir.file("player_progress.json");

  testing_support::write_file(path, "");
  ProgressStore empty(path);
  suite.require(empty.load().isOk() && empty.collection().empty(), "empty file is an empty collection");

  testing_support::write_file(path, "  \n");
  suite.require(empty.load().isOk() && empty.collection().empty(), "blank file is an empty collection");

  testing_support::write_file(path, "{ not json");
  ProgressStore broken(path);
  Status st = broken.load();
  suite.require(!st.isOk() && st.kind() == ErrorKind::MalformedData, "invalid JSON -> MalformedData");

  testing_support::write_file(path, "[1, 2]");
  st = broken.load();
  suite.require(st.kind() == ErrorKind::MalformedData, "array at top level -> MalformedData");

  testing_support::write_file(path, R"({"p1": {"name": "X", "cards": {"c1": {"box": "two"}}}})");
  st = broken.load();
  suite.require(st.kind() == ErrorKind::MalformedData, "string box -> MalformedData");

  testing_support::write_file(path, R"({"p1": {"name": "X", "cards": {"c1": {"box": 4294967297}}}})");
  st = broken.load();
  suite.require(st.kind() == ErrorKind::MalformedData, "box beyond int range -> MalformedData");

  testing_support::write_file(path, R"({"p1": {"name": "X", "total_answered": -9999999999}})");
  st = broken.load();
  suite.require(st.kind() == ErrorKind::MalformedData, "count below int range -> MalformedData");

  testing_support::write_file(path, R"({"p1": {"name": "X", "history": [{"card_id": "c1", "timestamp": "yesterday"}]}})");
  st = broken.load();
  suite.require(st.kind() == ErrorKind::MalformedData, "bad timestamp -> MalformedData");
}

void test_invalid_utf8_name(TestSuite& suite) {
  TempDir dir("store_latin1");
  const std::string path = dir.file("player_progress.json");

  ProgressStore store(path);
  store.collection()["p1"].name = "Ren\xe9";
  suite.require(store.save().isOk(), "Latin-1 name saves");

  ProgressStore reloaded(path);
  suite.require(reloaded.load().isOk(), "file with replaced bytes reloads");
  const PlayerRecord* p1 = reloaded.findPlayer("p1");
  suite.require(p1 && p1->name == "Ren\xef\xbf\xbd", "invalid byte stored as U+FFFD");
}

void test_single_player_layout(TestSuite& suite) {
  TempDir dir("store_single");
  const std::string path = dir.file("progress.json");

  // Older single-player files: no passed/failed counters,
  // nanosecond timestamps with an offset.
  testing_support::write_file(path, R"({
  "c1": {
    "box": 3,
    "streak": 2,
    "last_reviewed": "2024-05-01T02:00:00.123456789+02:00"
  }
})");

  ProgressStore store(path, ProgressLayout::SinglePlayer);
  suite.require(store.load().isOk(), "legacy file loads");
  const ProgressEntry& e = store.singlePlayer().cards["c1"];
  suite.require(e.box == 3 && e.streak == 2, "box and streak read");
  suite.require(e.passed == 0 && e.failed == 0, "missing counters default to 0");
  suite.require(e.last_reviewed == kMay1, "offset timestamp read");

  store.singlePlayer().cards["c2"].box = 1;
  suite.require(store.save().isOk(), "legacy save succeeds");
  const std::string text = testing_support::read_file(path);
  suite.require(text.find("\"name\"") == std::string::npos, "single-player file has no player wrapper");
  suite.require(text.find("\"c2\": {") != std::string::npos, "card ids at top level");
}

void test_catalog(TestSuite& suite) {
  CardCatalog catalog;
  Status st = CardCatalog::parse(
      R"([{"id": "c1", "language": "python", "tags": ["lists", "basics"], "prompt": "p", "solution": "s"},
          {"id": "c2", "language": "lua", "tags": [], "prompt": "q", "solution": "t"}])",
      "cards.json", catalog);
  suite.require(st.isOk(), "catalog parses");
  suite.require(catalog.size() == 2, "two cards");
  const Card* c1 = catalog.find("c1");
  suite.require(c1 && c1->language == "python" && c1->tags.size() == 2, "card fields read");
  suite.require(catalog.find("c3") == nullptr, "unknown id not found");

  st = CardCatalog::parse("[]", "cards.json", catalog);
  suite.require(st.isOk() && catalog.empty(), "empty array is an empty catalog");

  st = CardCatalog::parse("", "cards.json", catalog);
  suite.require(st.kind() == ErrorKind::MalformedData, "empty file -> MalformedData");

  st = CardCatalog::parse(R"({"id": "c1"})", "cards.json", catalog);
  suite.require(st.kind() == ErrorKind::MalformedData, "object instead of array -> MalformedData");

  st = CardCatalog::parse(R"([{"id": "c1", "tags": "oops"}])", "cards.json", catalog);
  suite.require(st.kind() == ErrorKind::MalformedData, "tags must be an array");

  st = CardCatalog::parse(R"([{"id": "c1"}, {"id": "c1"}])", "cards.json", catalog);
  suite.require(st.kind() == ErrorKind::MalformedData, "duplicate ids -> MalformedData");

  TempDir dir("catalog_missing");
  st = CardCatalog::loadFromFile(dir.file("cards.json"), catalog);
  suite.require(st.kind() == ErrorKind::Configuration, "missing cards.json -> Configuration");
}

}  // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);
  testing_support::use_utc();
  TestSuite suite;

  test_timestamps(suite);
  test_round_trip(suite);
  test_empty_and_malformed(suite);
  test_invalid_utf8_name(suite);
  test_single_player_layout(suite);
  test_catalog(suite);

  return suite.finish("progress store");
}
