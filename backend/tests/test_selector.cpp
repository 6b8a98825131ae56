#include "../src/core/BoxSchedule.hpp"
#include "../src/core/CardCatalog.hpp"
#include "../src/core/Selector.hpp"
#include "../src/core/WeightedSampler.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "test_support.hpp"

using testing_support::TestSuite;

namespace {

CardCatalog make_catalog(int count) {
  std::vector<Card> cards;
  for (int i = 1; i <= count; ++i) {
    const std::string id = "c" + std::to_string(i);
    cards.emplace_back(id, "prompt " + id, "solution " + id);
  }
  return CardCatalog(cards);
}

void test_sampler_boundaries(TestSuite& suite) {
  WeightedSampler sampler({16, 8, 4, 2, 1});
  suite.require(sampler.totalWeight() == 31, "total weight 31");
  suite.require(sampler.indexFor(0) == 0, "draw 0 -> box 1");
  suite.require(sampler.indexFor(15) == 0, "draw 15 -> box 1");
  suite.require(sampler.indexFor(16) == 1, "draw 16 -> box 2");
  suite.require(sampler.indexFor(23) == 1, "draw 23 -> box 2");
  suite.require(sampler.indexFor(24) == 2, "draw 24 -> box 3");
  suite.require(sampler.indexFor(28) == 3, "draw 28 -> box 4");
  suite.require(sampler.indexFor(30) == 4, "draw 30 -> box 5");

  WeightedSampler sparse({0, 5, 0, 3});
  suite.require(sparse.totalWeight() == 8, "zero weights do not count");
  suite.require(sparse.indexFor(0) == 1, "first draw skips zero-weight index");
  suite.require(sparse.indexFor(4) == 1, "draw 4 -> index 1");
  suite.require(sparse.indexFor(5) == 3, "draw 5 skips zero-weight index 2");

  WeightedSampler none({0, 0});
  suite.require(none.empty(), "all-zero weights are empty");
}

void test_schedule(TestSuite& suite) {
  BoxSchedule standard;
  suite.require(standard.boxCount() == 5, "default has 5 boxes");
  suite.require(standard.weightFor(1) == 16 && standard.weightFor(5) == 1, "default weights 16..1");
  suite.require(standard.weightFor(0) == 0 && standard.weightFor(6) == 0, "out-of-range boxes weigh 0");
  suite.require(standard.isMastered(6) && !standard.isMastered(5), "box 6 is mastered");

  BoxSchedule three = BoxSchedule::halving(3);
  suite.require(three.boxWeights() == std::vector<int>({4, 2, 1}), "halving(3) = 4,2,1");
  suite.require(BoxSchedule::halving(5).boxWeights() == standard.boxWeights(), "halving(5) equals default");
}

void test_ensure_entries(TestSuite& suite) {
  CardCatalog catalog = make_catalog(3);
  BoxSchedule schedule;
  std::mt19937_64 rng(7);
  Selector selector(schedule, rng);

  PlayerRecord player;
  player.cards["c2"].box = 4;
  int created = selector.ensureEntries(catalog, player, testing_support::kMay1);
  suite.require(created == 2, "two missing entries created");
  suite.require(player.cards["c1"].box == 1 && player.cards["c1"].streak == 0, "new entry box 1 streak 0");
  suite.require(player.cards["c1"].last_reviewed == testing_support::kMay1, "new entry stamped with now");
  suite.require(player.cards["c2"].box == 4, "existing entry untouched");
  suite.require(selector.ensureEntries(catalog, player, testing_support::kMay1) == 0, "second call creates nothing");
}

void test_done_sentinel(TestSuite& suite) {
  BoxSchedule schedule;
  std::mt19937_64 rng(11);
  Selector selector(schedule, rng);
  PlayerRecord player;

  CardCatalog empty;
  suite.require(selector.select(empty, player) == nullptr, "empty catalog -> done");

  CardCatalog catalog = make_catalog(4);
  for (const auto& c : catalog.cards()) player.cards[c.id].box = 6 + static_cast<int>(player.cards.size());
  suite.require(selector.select(catalog, player) == nullptr, "all mastered -> done");

  player.cards["c3"].box = 5;
  for (int i = 0; i < 50; ++i) {
    const Card* card = selector.select(catalog, player);
    suite.require(card != nullptr && card->id == "c3", "only the box-5 card is eligible");
  }

  player.cards["c3"].box = 0;
  player.cards["c4"].box = -2;
  suite.require(selector.select(catalog, player) == nullptr, "boxes below 1 are discarded");
}

void test_never_out_of_range(TestSuite& suite) {
  CardCatalog catalog = make_catalog(20);
  BoxSchedule schedule;
  std::mt19937_64 rng(2024);
  Selector selector(schedule, rng);

  std::uniform_int_distribution<int> box_dist(-1, 8);
  for (int round = 0; round < 200; ++round) {
    PlayerRecord player;
    bool any_eligible = false;
    for (const auto& c : catalog.cards()) {
      int box = box_dist(rng);
      player.cards[c.id].box = box;
      if (box >= 1 && box <= 5) any_eligible = true;
    }
    const Card* card = selector.select(catalog, player);
    suite.require((card != nullptr) == any_eligible, "done iff no card in boxes 1..5");
    if (card) {
      int box = player.cards[card->id].box;
      suite.require(box >= 1 && box <= 5, "selected card is in boxes 1..5");
    }
  }
}

void test_distribution(TestSuite& suite) {
  CardCatalog catalog = make_catalog(5);
  BoxSchedule schedule;
  std::mt19937_64 rng(123456);
  Selector selector(schedule, rng);

  PlayerRecord player;
  for (int i = 1; i <= 5; ++i) player.cards["c" + std::to_string(i)].box = i;

  const int trials = 62000;
  std::map<int, int> hits;
  for (int i = 0; i < trials; ++i) {
    const Card* card = selector.select(catalog, player);
    hits[player.cards[card->id].box]++;
  }
  const double weights[] = {16, 8, 4, 2, 1};
  for (int box = 1; box <= 5; ++box) {
    double observed = static_cast<double>(hits[box]) / trials;
    double expected = weights[box - 1] / 31.0;
    suite.require(std::fabs(observed - expected) < 0.01,
                  "box " + std::to_string(box) + " frequency " + std::to_string(observed) + " ~ " +
                      std::to_string(expected));
  }

  // Only non-empty boxes count: boxes 1 and 3 -> 16/20 and 4/20.
  PlayerRecord sparse;
  sparse.cards["c1"].box = 1;
  sparse.cards["c2"].box = 3;
  sparse.cards["c3"].box = 3;
  sparse.cards["c4"].box = 7;
  sparse.cards["c5"].box = 9;
  std::map<std::string, int> card_hits;
  const int sparse_trials = 40000;
  for (int i = 0; i < sparse_trials; ++i) {
    card_hits[selector.select(catalog, sparse)->id]++;
  }
  suite.require(card_hits.count("c4") == 0 && card_hits.count("c5") == 0, "mastered cards never drawn");
  double box1 = static_cast<double>(card_hits["c1"]) / sparse_trials;
  double box3 = static_cast<double>(card_hits["c2"] + card_hits["c3"]) / sparse_trials;
  suite.require(std::fabs(box1 - 0.8) < 0.01, "box 1 frequency ~ 0.8");
  suite.require(std::fabs(box3 - 0.2) < 0.01, "box 3 frequency ~ 0.2");
  double c2 = static_cast<double>(card_hits["c2"]) / sparse_trials;
  suite.require(std::fabs(c2 - 0.1) < 0.01, "cards within a box are drawn uniformly");
}

void test_custom_schedule(TestSuite& suite) {
  CardCatalog catalog = make_catalog(2);
  BoxSchedule schedule = BoxSchedule::halving(3);
  std::mt19937_64 rng(5);
  Selector selector(schedule, rng);

  PlayerRecord player;
  player.cards["c1"].box = 4;
  player.cards["c2"].box = 3;
  for (int i = 0; i < 20; ++i) {
    const Card* card = selector.select(catalog, player);
    suite.require(card && card->id == "c2", "box 4 is mastered with three boxes");
  }
}

void test_seeded_selection_is_repeatable(TestSuite& suite) {
  CardCatalog catalog = make_catalog(10);
  BoxSchedule schedule;
  PlayerRecord player;
  for (int i = 1; i <= 10; ++i) player.cards["c" + std::to_string(i)].box = 1 + i % 5;

  std::mt19937_64 rng1(99);
  std::mt19937_64 rng2(99);
  Selector s1(schedule, rng1);
  Selector s2(schedule, rng2);
  bool same = true;
  for (int i = 0; i < 100; ++i) {
    if (s1.select(catalog, player) != s2.select(catalog, player)) same = false;
  }
  suite.require(same, "same seed gives the same sequence");
}

}  // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);
  TestSuite suite;

  test_sampler_boundaries(suite);
  test_schedule(suite);
  test_ensure_entries(suite);
  test_done_sentinel(suite);
  test_never_out_of_range(suite);
  test_distribution(suite);
  test_custom_schedule(suite);
  test_seeded_selection_is_repeatable(suite);

  return suite.finish("selector");
}
