#include <f1mc/analysis_runner.hpp>
#include <chrono>
#include <f1mc/log.hpp>
#include <f1mc/parallel.hpp>

namespace f1mc {

const char* to_string(JobKind k) {
  switch (k) {
    case JobKind::None:       return "idle";
    case JobKind::MonteCarlo: return "monte-carlo";
    case JobKind::SingleRace: return "single race";
    case JobKind::Optimize:   return "strategy optimizer";
  }
  return "unknown";
}

void AnalysisRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&AnalysisRunner::thread_main_, this);
}

void AnalysisRunner::stop() {
  if (!running_.load()) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    running_.store(false);
  }
  cv_.notify_all();
  if (th_.joinable()) th_.join();
}

void AnalysisRunner::request(JobKind kind, const RaceConfig& cfg) {
  if (kind == JobKind::None) return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_ = Job{kind, cfg};
  }
  cv_.notify_all();
}

void AnalysisRunner::wait_idle() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [&]{ return (!pending_ && !busy_) || !running_.load(); });
}

void AnalysisRunner::run_job_(const Job& job, AnalysisSnapshot& snap) {
  const std::uint32_t seed = base_seed.load() + static_cast<std::uint32_t>(job_counter_);
  const unsigned w = workers.load();
  const auto t0 = std::chrono::steady_clock::now();

  switch (job.kind) {
    case JobKind::MonteCarlo: {
      MonteCarloOptions opts;
      opts.simulations = mc_simulations.load();
      opts.seed = seed;
      opts.workers = w;
      progress_total_.store(opts.simulations);
      opts.on_progress = [this](std::size_t done, std::size_t) {
        progress_done_.store(done, std::memory_order_relaxed);
      };
      auto summary = run_monte_carlo(job.cfg, opts);
      if (!summary) { snap.last_error = "invalid configuration"; break; }
      snap.stats = finish_stats(*summary);
      snap.histogram = finish_histogram(*summary);
      if (summary->all_dnf()) {
        snap.last_error = "all simulations resulted in DNF";
      }
      snap.monte_carlo = std::move(summary);
      break;
    }
    case JobKind::SingleRace: {
      auto rng = make_stream(seed, 0);
      progress_total_.store(1);
      auto race = simulate_race(job.cfg, rng);
      if (!race) { snap.last_error = "invalid configuration"; break; }
      snap.race = std::move(race);
      break;
    }
    case JobKind::Optimize: {
      StrategyOptions opts;
      opts.sims_per_cell = sims_per_cell.load();
      opts.seed = seed;
      opts.workers = w;
      auto grid = optimize_strategy(job.cfg, opts);
      if (!grid) { snap.last_error = "invalid configuration"; break; }
      if (!grid->viable()) snap.last_error = "no viable strategy: every cell DNF'd";
      snap.strategy = std::move(grid);
      break;
    }
    case JobKind::None:
      break;
  }

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - t0).count();
  log_info(std::string(to_string(job.kind)) + " finished in " + std::to_string(ms) + " ms");
}

void AnalysisRunner::thread_main_() {
  AnalysisSnapshot snap{};

  while (true) {
    Job job{};
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&]{ return pending_.has_value() || !running_.load(); });
      if (!running_.load()) break;
      job = *pending_;
      pending_.reset();
      busy_ = true;
    }

    ++job_counter_;
    progress_done_.store(0);
    progress_total_.store(0);
    snap.running = job.kind;
    snap.config = job.cfg;
    snap.last_error.clear();
    buffer_.publish(snap);

    run_job_(job, snap);

    snap.running = JobKind::None;
    ++snap.jobs_completed;
    if (!snap.last_error.empty()) log_warn(snap.last_error);
    buffer_.publish(snap);
    progress_done_.store(0);
    progress_total_.store(0);

    {
      std::lock_guard<std::mutex> lk(mu_);
      busy_ = false;
    }
    cv_.notify_all();
  }

  std::lock_guard<std::mutex> lk(mu_);
  busy_ = false;
  cv_.notify_all();
}

} // namespace f1mc
