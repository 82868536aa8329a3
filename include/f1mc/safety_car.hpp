#pragma once
#include <random>

namespace f1mc {

inline constexpr double kSafetyCarLapPenalty_s = 30.0;

// Onset probability for a lap: start-of-race incidents on laps 1-3,
// late-race incidents in the final five laps.
double safety_car_probability(int lap, int total_laps);

// Bernoulli draw against safety_car_probability. Deterministic with caller rng.
bool safety_car_deployed(int lap, int total_laps, std::mt19937& rng);

// Uniform in {3, 4, 5, 6}.
int safety_car_duration(std::mt19937& rng);

struct SafetyCarState {
  bool active = false;
  int laps_remaining = 0;

  // Start-of-lap transition. When inactive (and enabled) a deployment may be
  // drawn; an active period is decremented and clears when it reaches zero.
  // Returns whether the lap is run behind the safety car.
  bool begin_lap(int lap, int total_laps, bool enabled, std::mt19937& rng);
};

} // namespace f1mc
