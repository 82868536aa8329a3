#include <f1mc/race.hpp>
#include <f1mc/engine.hpp>
#include <f1mc/fuel.hpp>
#include <f1mc/log.hpp>
#include <f1mc/safety_car.hpp>
#include <f1mc/tyre.hpp>

namespace f1mc {

int RaceOutcome::safety_car_laps() const {
  int n = 0;
  for (const auto& l : laps) if (l.safety_car) ++n;
  return n;
}

double RaceOutcome::mean_lap_time() const {
  if (laps.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& l : laps) sum += l.lap_time_s;
  return sum / static_cast<double>(laps.size());
}

std::optional<RaceOutcome> simulate_race(const RaceConfig& cfg, std::mt19937& rng) {
  if (auto err = validate_race_config(cfg)) {
    log_warn("simulate_race: " + describe(*err));
    return std::nullopt;
  }

  RaceOutcome out;
  out.laps.reserve(static_cast<std::size_t>(cfg.total_laps));

  double engine_deg = 0.0;
  int stint_lap = 0;
  SafetyCarState sc;
  std::uniform_real_distribution<double> U(0.0, 1.0);

  for (int lap = 1; lap <= cfg.total_laps; ++lap) {
    ++stint_lap;

    const bool sc_active = sc.begin_lap(lap, cfg.total_laps, cfg.safety_car, rng);

    const EngineTelemetry tel = sample_engine_telemetry(engine_deg, rng);
    const double power = engine_power(tel.throttle_pct, tel.rpm, engine_deg);
    const double fuel = fuel_penalty(lap, cfg.fuel_load_kg);
    const TyreWear tyre = tyre_degradation(stint_lap, cfg.compound, cfg.deg_factor);

    double lap_time = 0.0;
    if (sc_active) {
      lap_time = cfg.base_lap_s + kSafetyCarLapPenalty_s;
    } else {
      lap_time = cfg.base_lap_s + fuel + tyre.penalty_s + tyre.grip_bonus_s
               - (power - kReferencePowerHp) * kPowerTimePerHp;
      if (cfg.lap_std_s > 0.0) {
        std::normal_distribution<double> noise(0.0, cfg.lap_std_s);
        lap_time += noise(rng);
      }
    }

    // Failure risk reflects the wear carried into this lap.
    if (U(rng) < engine_failure_probability(cfg.reliability, engine_deg)) {
      out.dnf = true;
      out.dnf_lap = lap;
      break;
    }

    if (lap == cfg.pit_lap) {
      lap_time += cfg.pit_loss_s;
      stint_lap = 0;
    }

    engine_deg = advance_engine_degradation(engine_deg, cfg.engine_stress, lap,
                                            cfg.total_laps, rng);
    out.total_time_s += lap_time;

    LapRecord rec;
    rec.lap = lap;
    rec.lap_time_s = lap_time;
    rec.power_hp = power;
    rec.rpm = tel.rpm;
    rec.temperature_c = tel.temperature_c;
    rec.engine_deg = engine_deg;
    rec.fuel_penalty_s = fuel;
    rec.tyre_penalty_s = tyre.penalty_s;
    rec.safety_car = sc_active;
    out.laps.push_back(rec);
  }

  return out;
}

} // namespace f1mc
