#include <f1mc/strategy.hpp>
#include <algorithm>
#include <f1mc/log.hpp>
#include <f1mc/parallel.hpp>
#include <f1mc/race.hpp>

namespace f1mc {

std::vector<int> PitWindow::laps() const {
  std::vector<int> out;
  if (empty() || stride <= 0) return out;
  for (int l = first; l <= last; l += stride) out.push_back(l);
  return out;
}

PitWindow pit_window(int total_laps) {
  PitWindow w;
  w.first = std::max(5, static_cast<int>(total_laps * 0.2));
  w.last  = std::min(total_laps - 5, static_cast<int>(total_laps * 0.8));
  return w;
}

std::optional<StrategyGridResult> optimize_strategy(const RaceConfig& base,
                                                    const StrategyOptions& opts) {
  if (auto err = validate_race_config(base)) {
    log_warn("optimize_strategy: " + describe(*err));
    return std::nullopt;
  }

  const auto pit_laps = pit_window(base.total_laps).laps();
  std::vector<StrategyCell> grid;
  grid.reserve(kAllCompounds.size() * pit_laps.size());
  for (TyreCompound c : kAllCompounds) {
    for (int lap : pit_laps) {
      StrategyCell cell;
      cell.compound = c;
      cell.pit_lap = lap;
      grid.push_back(cell);
    }
  }

  const int reps = std::max(0, opts.sims_per_cell);
  parallel_for(grid.size(), opts.workers, [&](std::size_t i) {
    StrategyCell& cell = grid[i];
    RaceConfig cfg = base;
    cfg.compound = cell.compound;
    cfg.pit_lap = cell.pit_lap;
    cfg.safety_car = false;

    double sum = 0.0;
    for (int r = 0; r < reps; ++r) {
      auto rng = make_stream(opts.seed, static_cast<std::uint32_t>(i),
                             static_cast<std::uint32_t>(r));
      const auto outcome = simulate_race(cfg, rng);
      if (outcome && outcome->finished()) {
        sum += outcome->total_time_s;
        ++cell.finishers;
      }
    }
    if (cell.finishers > 0) cell.expected_time_s = sum / cell.finishers;
  });

  StrategyGridResult res;
  res.cells.reserve(grid.size());
  for (const auto& cell : grid) {
    if (cell.finishers == 0) { ++res.dropped; continue; }
    res.cells.push_back(cell);
    if (!res.best || cell.expected_time_s < res.best->expected_time_s) res.best = cell;
  }

  if (!res.best) {
    log_warn("optimize_strategy: no viable strategy (" + std::to_string(grid.size()) +
             " cells evaluated)");
  }
  return res;
}

} // namespace f1mc
