#include <f1mc/monte_carlo.hpp>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <f1mc/log.hpp>
#include <f1mc/parallel.hpp>
#include <f1mc/race.hpp>

namespace f1mc {

std::optional<MonteCarloSummary> run_monte_carlo(const RaceConfig& cfg,
                                                 const MonteCarloOptions& opts) {
  if (auto err = validate_race_config(cfg)) {
    log_warn("run_monte_carlo: " + describe(*err));
    return std::nullopt;
  }

  const std::size_t n = opts.simulations;
  std::vector<RunRecord> runs(n);
  std::atomic<std::size_t> done{0};

  parallel_for(n, opts.workers, [&](std::size_t i) {
    auto rng = make_stream(opts.seed, static_cast<std::uint32_t>(i));
    // cfg is already validated, so simulate_race always yields an outcome
    const auto outcome = simulate_race(cfg, rng);

    RunRecord& r = runs[i];
    r.sim_id = i;
    if (outcome) {
      r.finished = outcome->finished();
      r.laps_completed = outcome->laps_completed();
      r.safety_car_laps = outcome->safety_car_laps();
      if (r.finished) {
        r.total_time_s = outcome->total_time_s;
        r.avg_lap_time_s = outcome->mean_lap_time();
      }
    }

    const std::size_t completed = done.fetch_add(1, std::memory_order_relaxed) + 1;
    if (opts.on_progress) opts.on_progress(completed, n);
  });

  MonteCarloSummary s;
  s.simulations = n;
  s.finish_times_s.reserve(n);
  for (const auto& r : runs) {
    if (!r.finished) continue;
    ++s.finished;
    s.finish_times_s.push_back(r.total_time_s);
  }
  s.runs = std::move(runs);

  log_debug("run_monte_carlo: " + std::to_string(s.finished) + "/" +
            std::to_string(s.simulations) + " finished");
  return s;
}

double percentile(std::vector<double> values, double pct) {
  std::sort(values.begin(), values.end());
  const double p = std::clamp(pct, 0.0, 100.0) / 100.0;
  const double rank = p * static_cast<double>(values.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
  const std::size_t hi = std::min(values.size() - 1, lo + 1);
  const double frac = rank - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

std::optional<FinishStats> finish_stats(const MonteCarloSummary& s) {
  const auto& v = s.finish_times_s;
  if (v.empty()) return std::nullopt;

  FinishStats st;
  double sum = 0.0;
  for (double t : v) sum += t;
  const double n = static_cast<double>(v.size());
  st.mean_s = sum / n;

  double sq = 0.0;
  for (double t : v) sq += (t - st.mean_s) * (t - st.mean_s);
  st.stddev_s = v.size() > 1 ? std::sqrt(sq / (n - 1.0)) : 0.0;

  const auto [mn, mx] = std::minmax_element(v.begin(), v.end());
  st.min_s = *mn;
  st.max_s = *mx;
  st.p5_s = percentile(v, 5.0);
  st.p95_s = percentile(v, 95.0);
  return st;
}

std::optional<Histogram> finish_histogram(const MonteCarloSummary& s, std::size_t bins) {
  const auto& v = s.finish_times_s;
  if (v.empty() || bins == 0) return std::nullopt;

  const auto [mn, mx] = std::minmax_element(v.begin(), v.end());
  Histogram h;
  h.lo_s = *mn;
  h.hi_s = *mx;
  if (h.hi_s <= h.lo_s) {
    // single distinct value: widen so it lands in a middle bin
    h.lo_s -= 0.5;
    h.hi_s += 0.5;
  }
  h.counts.assign(bins, 0);

  const double width = h.bin_width();
  for (double t : v) {
    std::size_t b = static_cast<std::size_t>((t - h.lo_s) / width);
    if (b >= bins) b = bins - 1;
    ++h.counts[b];
  }
  return h;
}

} // namespace f1mc
