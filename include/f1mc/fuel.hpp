#pragma once

namespace f1mc {

inline constexpr double kDefaultBurnRateKgPerLap = 2.1;
inline constexpr double kFuelTimePerKg = 0.03;

// Lap time cost of the fuel still on board after `lap` laps.
// Never negative; zero once lap * burn_rate >= starting_fuel_kg.
double fuel_penalty(int lap, double starting_fuel_kg,
                    double burn_rate = kDefaultBurnRateKgPerLap);

} // namespace f1mc
