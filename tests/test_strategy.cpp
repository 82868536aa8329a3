#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <f1mc/strategy.hpp>

using namespace f1mc;
using Catch::Approx;

namespace {

RaceConfig short_race() {
  RaceConfig cfg;
  cfg.total_laps = 30;
  cfg.pit_lap = 15;
  cfg.reliability = 1.0;
  return cfg;
}

} // namespace

TEST_CASE("pit_window") {
  SECTION("standard race distance") {
    auto w = pit_window(50);
    REQUIRE(w.first == 10);
    REQUIRE(w.last == 40);
    auto laps = w.laps();
    REQUIRE(laps.size() == 16);
    REQUIRE(laps.front() == 10);
    REQUIRE(laps.back() == 40);
  }

  SECTION("short race clamps to five laps from either end") {
    auto w = pit_window(20);
    REQUIRE(w.first == 5);
    REQUIRE(w.last == 15);
    REQUIRE(w.laps() == std::vector<int>{5, 7, 9, 11, 13, 15});
  }

  SECTION("truncation, not rounding") {
    auto w = pit_window(57); // int(11.4), int(45.6)
    REQUIRE(w.first == 11);
    REQUIRE(w.last == 45);
  }

  SECTION("too short for any stop") {
    auto w = pit_window(8);
    REQUIRE(w.empty());
    REQUIRE(w.laps().empty());
  }
}

TEST_CASE("optimize_strategy evaluates every compound and pit lap") {
  StrategyOptions opts;
  opts.sims_per_cell = 5;
  opts.seed = 3;

  auto g = optimize_strategy(short_race(), opts);
  REQUIRE(g.has_value());
  REQUIRE(g->viable());
  REQUIRE(g->dropped == 0);
  REQUIRE(g->cells.size() == 3 * pit_window(30).laps().size());

  // compound-major, pit lap ascending
  REQUIRE(g->cells.front().compound == TyreCompound::Soft);
  REQUIRE(g->cells.back().compound == TyreCompound::Hard);
  REQUIRE(g->cells[0].pit_lap < g->cells[1].pit_lap);

  for (const auto& c : g->cells) {
    REQUIRE(c.finishers == 5);
    REQUIRE(c.expected_time_s > 0.0);
    REQUIRE(g->best->expected_time_s <= c.expected_time_s);
  }
}

TEST_CASE("optimize_strategy is deterministic and worker independent") {
  StrategyOptions serial;
  serial.sims_per_cell = 4;
  serial.seed = 11;
  serial.workers = 1;
  StrategyOptions threaded = serial;
  threaded.workers = 3;

  auto a = optimize_strategy(short_race(), serial);
  auto b = optimize_strategy(short_race(), serial);
  auto c = optimize_strategy(short_race(), threaded);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(c.has_value());
  REQUIRE(a->cells.size() == c->cells.size());
  for (std::size_t i = 0; i < a->cells.size(); ++i) {
    REQUIRE(a->cells[i].expected_time_s == b->cells[i].expected_time_s);
    REQUIRE(a->cells[i].expected_time_s == c->cells[i].expected_time_s);
  }
  REQUIRE(a->best->compound == c->best->compound);
  REQUIRE(a->best->pit_lap == c->best->pit_lap);
}

TEST_CASE("optimize_strategy with no finishers has no best strategy") {
  RaceConfig cfg = short_race();
  cfg.reliability = 0.0;
  StrategyOptions opts;
  opts.sims_per_cell = 3;

  auto g = optimize_strategy(cfg, opts);
  REQUIRE(g.has_value());
  REQUIRE_FALSE(g->viable());
  REQUIRE(g->cells.empty());
  REQUIRE(g->dropped == 3 * pit_window(30).laps().size());
}

TEST_CASE("optimize_strategy on a race too short for a stop") {
  RaceConfig cfg;
  cfg.total_laps = 8;
  cfg.pit_lap = 4;
  auto g = optimize_strategy(cfg, StrategyOptions{});
  REQUIRE(g.has_value());
  REQUIRE(g->cells.empty());
  REQUIRE_FALSE(g->best.has_value());
}

TEST_CASE("optimize_strategy rejects an invalid base") {
  RaceConfig cfg;
  cfg.base_lap_s = 0.0;
  REQUIRE_FALSE(optimize_strategy(cfg, StrategyOptions{}).has_value());
}
