#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <f1mc/config.hpp>
#include <f1mc/latest_buffer.hpp>
#include <f1mc/monte_carlo.hpp>
#include <f1mc/race.hpp>
#include <f1mc/strategy.hpp>

namespace f1mc {

enum class JobKind : int {
  None = 0,
  MonteCarlo = 1,
  SingleRace = 2,
  Optimize = 3,
};

const char* to_string(JobKind k);

// Everything a UI needs to draw the latest results. Each result slot keeps
// the most recent completed job of that kind.
struct AnalysisSnapshot {
  std::uint64_t jobs_completed = 0;
  JobKind running = JobKind::None;
  RaceConfig config;                         // config of the last started job

  std::optional<MonteCarloSummary> monte_carlo;
  std::optional<FinishStats> stats;          // nullopt with results = all DNF
  std::optional<Histogram> histogram;
  std::optional<RaceOutcome> race;
  std::optional<StrategyGridResult> strategy;
  std::string last_error;
};

// Owns a worker thread that executes analysis jobs and publishes snapshots.
class AnalysisRunner {
public:
  AnalysisRunner() = default;
  ~AnalysisRunner() { stop(); }
  AnalysisRunner(const AnalysisRunner&) = delete;
  AnalysisRunner& operator=(const AnalysisRunner&) = delete;

  void start();
  void stop();

  // Queues a job; replaces a queued job that has not started yet.
  // Safe to call from the UI thread.
  void request(JobKind kind, const RaceConfig& cfg);

  // Blocks until the queue is empty and no job is running.
  void wait_idle();

  LatestBuffer<AnalysisSnapshot>& buffer() { return buffer_; }
  const LatestBuffer<AnalysisSnapshot>& buffer() const { return buffer_; }

  // Progress of the running job: (done, total). Both 0 when idle.
  std::pair<std::size_t, std::size_t> progress() const {
    return {progress_done_.load(std::memory_order_relaxed),
            progress_total_.load(std::memory_order_relaxed)};
  }

  // Control surface (read when a job starts)
  std::atomic<std::size_t> mc_simulations{2000};
  std::atomic<int> sims_per_cell{50};
  std::atomic<unsigned> workers{0};
  std::atomic<std::uint32_t> base_seed{42};

private:
  struct Job { JobKind kind; RaceConfig cfg; };

  void thread_main_();
  void run_job_(const Job& job, AnalysisSnapshot& snap);

  std::thread th_;
  std::atomic<bool> running_{false};

  std::mutex mu_;
  std::condition_variable cv_;
  std::optional<Job> pending_;
  bool busy_ = false;

  LatestBuffer<AnalysisSnapshot> buffer_;
  std::atomic<std::size_t> progress_done_{0};
  std::atomic<std::size_t> progress_total_{0};
  std::uint64_t job_counter_ = 0;
};

} // namespace f1mc
