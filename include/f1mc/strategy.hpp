#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <f1mc/config.hpp>
#include <f1mc/tyre.hpp>

namespace f1mc {

struct StrategyOptions {
  int sims_per_cell = 50;
  std::uint32_t seed = 42;
  unsigned workers = 1;   // 0 = one per hardware thread
};

struct StrategyCell {
  TyreCompound compound = TyreCompound::Medium;
  int pit_lap = 0;
  double expected_time_s = 0.0;  // mean over finishing repetitions
  int finishers = 0;
};

struct StrategyGridResult {
  std::vector<StrategyCell> cells;  // compound-major, pit lap ascending
  std::optional<StrategyCell> best; // nullopt: no viable strategy
  std::size_t dropped = 0;          // cells where every repetition DNF'd

  bool viable() const { return best.has_value(); }
};

struct PitWindow {
  int first = 0;
  int last = -1;
  int stride = 2;

  bool empty() const { return last < first; }
  std::vector<int> laps() const;
};

// [max(5, int(0.2*laps)), min(laps-5, int(0.8*laps))], stride 2.
PitWindow pit_window(int total_laps);

// Grid search over every compound and every pit lap in pit_window(base.total_laps).
// Each cell runs opts.sims_per_cell races of `base` with that compound and pit
// lap and the safety car disabled; repetition r of cell c draws from
// make_stream(opts.seed, c, r). Returns nullopt only if `base` is invalid.
std::optional<StrategyGridResult> optimize_strategy(const RaceConfig& base,
                                                    const StrategyOptions& opts);

} // namespace f1mc
