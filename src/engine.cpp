#include <f1mc/engine.hpp>

namespace f1mc {

static constexpr double kBaseWearRate = 0.0001;
static constexpr double kWearNoiseStd = 0.0002;
static constexpr double kRpmMean = 12000.0;
static constexpr double kRpmStd = 400.0;
static constexpr double kThrottleMin = 85.0;
static constexpr double kThrottleMax = 100.0;
static constexpr double kTempBase = 90.0;
static constexpr double kTempPerDeg = 220.0;
static constexpr double kTempNoiseStd = 1.5;

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

double engine_power(double throttle_pct, double rpm, double degradation) {
  return kBasePowerHp * (throttle_pct / 100.0) * (rpm / kReferenceRpm) * (1.0 - degradation);
}

double advance_engine_degradation(double current, double stress, int lap, int total_laps,
                                  std::mt19937& rng) {
  const double stress_factor = 1.0 + (stress - 1.0) * 0.5;
  const double progress = total_laps > 0 ? static_cast<double>(lap) / total_laps : 0.0;
  const double progress_factor = 1.0 + progress * 0.5;
  const double wear = kBaseWearRate * stress_factor * progress_factor;

  std::normal_distribution<double> noise(0.0, kWearNoiseStd);
  return clamp01(current + wear + noise(rng));
}

EngineTelemetry sample_engine_telemetry(double degradation, std::mt19937& rng) {
  std::normal_distribution<double> rpm(kRpmMean, kRpmStd);
  std::uniform_real_distribution<double> throttle(kThrottleMin, kThrottleMax);
  std::normal_distribution<double> temp_noise(0.0, kTempNoiseStd);

  EngineTelemetry t;
  t.rpm = rpm(rng);
  t.throttle_pct = throttle(rng);
  t.temperature_c = kTempBase + degradation * kTempPerDeg + temp_noise(rng);
  return t;
}

double engine_failure_probability(double reliability, double degradation) {
  return (1.0 - reliability) * (1.0 + degradation * 10.0);
}

} // namespace f1mc
