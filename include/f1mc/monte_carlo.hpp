#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>
#include <f1mc/config.hpp>

namespace f1mc {

struct MonteCarloOptions {
  std::size_t simulations = 1000;
  std::uint32_t seed = 42;
  unsigned workers = 1;   // 0 = one per hardware thread
  // Called after each run with (completed, total). May be invoked from
  // worker threads concurrently.
  std::function<void(std::size_t, std::size_t)> on_progress;
};

// One row per simulated race, DNFs included.
struct RunRecord {
  std::size_t sim_id = 0;
  int  laps_completed = 0;
  bool finished = false;
  double total_time_s = 0.0;      // 0 when !finished
  double avg_lap_time_s = 0.0;    // 0 when !finished
  int  safety_car_laps = 0;
};

struct MonteCarloSummary {
  std::size_t simulations = 0;
  std::size_t finished = 0;
  std::vector<double> finish_times_s;  // finished runs, in run order
  std::vector<RunRecord> runs;

  double finish_rate() const {
    return simulations == 0 ? 0.0 : static_cast<double>(finished) / static_cast<double>(simulations);
  }
  bool all_dnf() const { return finished == 0; }
};

struct FinishStats {
  double mean_s = 0.0;
  double p5_s = 0.0;
  double p95_s = 0.0;
  double min_s = 0.0;
  double max_s = 0.0;
  double stddev_s = 0.0;  // sample (n-1); 0 for a single finisher
};

struct Histogram {
  double lo_s = 0.0;
  double hi_s = 0.0;
  std::vector<std::size_t> counts;

  double bin_width() const {
    return counts.empty() ? 0.0 : (hi_s - lo_s) / static_cast<double>(counts.size());
  }
};

// Runs `opts.simulations` independent races of `cfg`. Run i draws from
// make_stream(opts.seed, i), so the summary does not depend on opts.workers.
// nullopt if cfg is invalid.
std::optional<MonteCarloSummary> run_monte_carlo(const RaceConfig& cfg,
                                                 const MonteCarloOptions& opts);

// nullopt when no run finished.
std::optional<FinishStats> finish_stats(const MonteCarloSummary& s);

// Equal-width bins over [min, max] of the finishing times; the last bin is
// closed on the right. nullopt when no run finished or bins == 0.
std::optional<Histogram> finish_histogram(const MonteCarloSummary& s, std::size_t bins = 40);

// Linear interpolation between order statistics; pct in [0, 100].
// `values` must not be empty.
double percentile(std::vector<double> values, double pct);

} // namespace f1mc
