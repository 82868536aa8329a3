#pragma once
#include <array>
#include <optional>
#include <string>

namespace f1mc {

enum class TyreCompound : int {
  Soft = 0,
  Medium = 1,
  Hard = 2,
};

inline constexpr std::array<TyreCompound, 3> kAllCompounds{
  TyreCompound::Soft, TyreCompound::Medium, TyreCompound::Hard};

struct CompoundSpec {
  double grip_bonus_s = 0.0;  // additive per lap, negative = faster
  double base_deg_s   = 0.0;  // seconds lost per stint lap before the cliff
  int    cliff_lap    = 0;    // stint lap after which wear turns exponential
};

const CompoundSpec& compound_spec(TyreCompound c);

// "soft" / "medium" / "hard" (lower case).
const char* to_string(TyreCompound c);

// Case-insensitive; also accepts "s", "m", "h". nullopt for anything else.
std::optional<TyreCompound> tyre_compound_from_string(const std::string& value);

struct TyreWear {
  double penalty_s = 0.0;
  double grip_bonus_s = 0.0;
};

// Linear up to and including the cliff lap, then
// 0.15 * deg_factor * (1.2^(stint_lap - cliff) - 1) on top of the cliff value.
TyreWear tyre_degradation(int stint_lap, TyreCompound compound, double deg_factor);

} // namespace f1mc
