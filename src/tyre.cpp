#include <f1mc/tyre.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace f1mc {

namespace {

constexpr double kCliffScale = 0.15;
constexpr double kCliffBase  = 1.2;

const std::array<CompoundSpec, 3> kCompoundTable{{
  {-0.8, 0.030, 12},  // soft
  { 0.0, 0.018, 22},  // medium
  { 0.5, 0.010, 35},  // hard
}};

} // namespace

const CompoundSpec& compound_spec(TyreCompound c) {
  return kCompoundTable[static_cast<std::size_t>(c)];
}

const char* to_string(TyreCompound c) {
  switch (c) {
    case TyreCompound::Soft:   return "soft";
    case TyreCompound::Medium: return "medium";
    case TyreCompound::Hard:   return "hard";
  }
  return "medium";
}

std::optional<TyreCompound> tyre_compound_from_string(const std::string& value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (char c : value) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lowered == "soft" || lowered == "s")   return TyreCompound::Soft;
  if (lowered == "medium" || lowered == "m") return TyreCompound::Medium;
  if (lowered == "hard" || lowered == "h")   return TyreCompound::Hard;
  return std::nullopt;
}

TyreWear tyre_degradation(int stint_lap, TyreCompound compound, double deg_factor) {
  const CompoundSpec& spec = compound_spec(compound);
  const double slope = spec.base_deg_s * deg_factor;
  const int lap = std::max(0, stint_lap);

  TyreWear w;
  w.grip_bonus_s = spec.grip_bonus_s;
  if (lap <= spec.cliff_lap) {
    w.penalty_s = slope * lap;
  } else {
    const int over = lap - spec.cliff_lap;
    w.penalty_s = slope * spec.cliff_lap
                + kCliffScale * deg_factor * (std::pow(kCliffBase, over) - 1.0);
  }
  return w;
}

} // namespace f1mc
