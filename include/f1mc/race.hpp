// include/f1mc/race.hpp
#pragma once
#include <optional>
#include <random>
#include <vector>
#include <f1mc/config.hpp>

namespace f1mc {

// One completed lap. Immutable once appended to a RaceOutcome.
struct LapRecord {
  int    lap = 0;
  double lap_time_s = 0.0;
  double power_hp = 0.0;
  double rpm = 0.0;
  double temperature_c = 0.0;
  double engine_deg = 0.0;        // after this lap's wear
  double fuel_penalty_s = 0.0;
  double tyre_penalty_s = 0.0;
  bool   safety_car = false;
};

struct RaceOutcome {
  double total_time_s = 0.0;      // completed laps only; meaningless when dnf
  std::vector<LapRecord> laps;
  bool dnf = false;
  std::optional<int> dnf_lap;

  bool finished() const { return !dnf; }
  int laps_completed() const { return dnf ? dnf_lap.value_or(0) : static_cast<int>(laps.size()); }
  int safety_car_laps() const;
  // Mean of recorded lap times (0 with no laps).
  double mean_lap_time() const;
};

// Reference power for the lap-time power term; more power is faster.
inline constexpr double kReferencePowerHp = 900.0;
inline constexpr double kPowerTimePerHp = 0.002;

// Runs one race lap by lap. All randomness comes from `rng`.
// Returns nullopt (before any draw) if `cfg` fails validate_race_config.
std::optional<RaceOutcome> simulate_race(const RaceConfig& cfg, std::mt19937& rng);

} // namespace f1mc
