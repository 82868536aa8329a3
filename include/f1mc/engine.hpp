#pragma once
#include <random>

namespace f1mc {

inline constexpr double kBasePowerHp = 1000.0;
inline constexpr double kReferenceRpm = 15000.0;

struct EngineTelemetry {
  double rpm = 0.0;
  double throttle_pct = 0.0;
  double temperature_c = 0.0;
};

// base_power * (throttle/100) * (rpm/15000) * (1 - degradation). Pure.
double engine_power(double throttle_pct, double rpm, double degradation);

// One lap of wear. Stress and race progress both accelerate it; a zero-mean
// perturbation is added and the result is clamped to [0, 1].
double advance_engine_degradation(double current, double stress, int lap, int total_laps,
                                  std::mt19937& rng);

// rpm ~ N(12000, 400), throttle ~ U[85, 100], temp = 90 + deg*220 + N(0, 1.5).
EngineTelemetry sample_engine_telemetry(double degradation, std::mt19937& rng);

// Per-lap failure probability: (1 - reliability) * (1 + degradation * 10).
double engine_failure_probability(double reliability, double degradation);

} // namespace f1mc
