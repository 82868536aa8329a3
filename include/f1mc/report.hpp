#pragma once
#include <fstream>
#include <ostream>
#include <string>
#include <f1mc/monte_carlo.hpp>
#include <f1mc/race.hpp>
#include <f1mc/strategy.hpp>

namespace f1mc {

// lap,lap_time,power,rpm,temp,engine_deg,fuel_penalty,tyre_deg,safety_car
void write_laps_csv(std::ostream& out, const RaceOutcome& race);

// sim_id,laps_completed,finished,total_time,avg_lap_time,safety_car_laps
// (times are empty for DNF rows)
void write_runs_csv(std::ostream& out, const MonteCarloSummary& s);

// compound,pit_lap,expected_time,finishers
void write_grid_csv(std::ostream& out, const StrategyGridResult& g);

// "1:31.234" style; "--" for negative/non-finite.
std::string format_race_time(double seconds);

// Writes `value` through `writer` into `path`; false if the file cannot be written.
template <class T>
bool save_csv(const std::string& path, const T& value,
              void (*writer)(std::ostream&, const T&)) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  writer(f, value);
  return static_cast<bool>(f);
}

} // namespace f1mc
