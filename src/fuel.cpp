#include <f1mc/fuel.hpp>
#include <algorithm>

namespace f1mc {

double fuel_penalty(int lap, double starting_fuel_kg, double burn_rate) {
  const double remaining = std::max(0.0, starting_fuel_kg - lap * burn_rate);
  return remaining * kFuelTimePerKg;
}

} // namespace f1mc
