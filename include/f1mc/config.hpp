#pragma once
#include <istream>
#include <optional>
#include <string>
#include <f1mc/tyre.hpp>

namespace f1mc {

struct RaceConfig {
  double base_lap_s = 90.0;       // fresh tyres, no fuel
  double lap_std_s = 0.5;         // per-lap noise
  int    total_laps = 50;
  int    pit_lap = 25;            // lap that receives pit_loss_s
  double pit_loss_s = 22.0;
  double engine_stress = 1.0;     // 0.5 conservative .. 2.0 push
  double reliability = 0.98;      // 1 - base per-lap failure probability
  double fuel_load_kg = 110.0;
  TyreCompound compound = TyreCompound::Medium;
  bool   safety_car = true;
  double deg_factor = 1.0;        // track abrasiveness
};

struct ConfigError {
  std::string field;
  std::string message;
};

// nullopt when the configuration can be simulated.
std::optional<ConfigError> validate_race_config(const RaceConfig& cfg);

std::string describe(const ConfigError& err);

// key = value lines overlaid on `defaults`. '#' starts a comment; blank lines
// are skipped. Unknown keys and unparsable values fail the whole load.
// Keys: base_lap, lap_std, laps, pit_lap, pit_loss, engine_stress,
// reliability, fuel_load, tyre_compound, safety_car, deg_factor.
std::optional<RaceConfig> race_config_from_stream(std::istream& in,
                                                  const RaceConfig& defaults,
                                                  std::string* error_message);

// Filesystem wrapper; fails if the file cannot be opened.
std::optional<RaceConfig> load_race_config(const std::string& path,
                                           const RaceConfig& defaults,
                                           std::string* error_message);

// Applies a single key/value pair (same keys as the file format).
bool set_config_value(RaceConfig& cfg, const std::string& key, const std::string& value,
                      std::string* error_message);

} // namespace f1mc
