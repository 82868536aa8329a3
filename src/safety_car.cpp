#include <f1mc/safety_car.hpp>

namespace f1mc {

double safety_car_probability(int lap, int total_laps) {
  if (lap <= 3) return 0.035;
  if (lap >= total_laps - 5) return 0.020;
  return 0.012;
}

bool safety_car_deployed(int lap, int total_laps, std::mt19937& rng) {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  return U(rng) < safety_car_probability(lap, total_laps);
}

int safety_car_duration(std::mt19937& rng) {
  std::uniform_int_distribution<int> laps(3, 6);
  return laps(rng);
}

bool SafetyCarState::begin_lap(int lap, int total_laps, bool enabled, std::mt19937& rng) {
  if (enabled && !active && safety_car_deployed(lap, total_laps, rng)) {
    active = true;
    laps_remaining = safety_car_duration(rng);
  }
  if (active) {
    --laps_remaining;
    if (laps_remaining <= 0) {
      active = false;
      laps_remaining = 0;
    }
  }
  return active;
}

} // namespace f1mc
