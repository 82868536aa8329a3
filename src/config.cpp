#include <f1mc/config.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace f1mc {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static bool to_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    out = std::stod(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

static bool to_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    out = std::stoi(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

static bool to_bool(const std::string& s, bool& out) {
  const auto v = lower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "on")  { out = true;  return true; }
  if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
  return false;
}

std::optional<ConfigError> validate_race_config(const RaceConfig& cfg) {
  auto fail = [](const char* field, const char* msg) {
    return std::optional<ConfigError>(ConfigError{field, msg});
  };
  if (!(cfg.base_lap_s > 0.0))  return fail("base_lap", "must be > 0");
  if (!(cfg.lap_std_s >= 0.0))  return fail("lap_std", "must be >= 0");
  if (cfg.total_laps <= 0)      return fail("laps", "must be > 0");
  if (cfg.pit_lap < 1 || cfg.pit_lap > cfg.total_laps) {
    return fail("pit_lap", "must lie within [1, laps]");
  }
  if (!(cfg.pit_loss_s > 0.0))  return fail("pit_loss", "must be > 0");
  if (!(cfg.engine_stress >= 0.5 && cfg.engine_stress <= 2.0)) {
    return fail("engine_stress", "must lie within [0.5, 2.0]");
  }
  if (!(cfg.reliability >= 0.0 && cfg.reliability <= 1.0)) {
    return fail("reliability", "must lie within [0, 1]");
  }
  if (!(cfg.fuel_load_kg >= 0.0)) return fail("fuel_load", "must be >= 0");
  if (!(cfg.deg_factor > 0.0))    return fail("deg_factor", "must be > 0");
  const int c = static_cast<int>(cfg.compound);
  if (c < 0 || c >= static_cast<int>(kAllCompounds.size())) {
    return fail("tyre_compound", "unknown compound");
  }
  return std::nullopt;
}

std::string describe(const ConfigError& err) {
  return "invalid " + err.field + ": " + err.message;
}

bool set_config_value(RaceConfig& cfg, const std::string& key, const std::string& value,
                      std::string* error_message) {
  const std::string k = lower(trim(key));
  const std::string v = trim(value);
  bool ok = false;

  if      (k == "base_lap")      ok = to_double(v, cfg.base_lap_s);
  else if (k == "lap_std")       ok = to_double(v, cfg.lap_std_s);
  else if (k == "laps")          ok = to_int(v, cfg.total_laps);
  else if (k == "pit_lap")       ok = to_int(v, cfg.pit_lap);
  else if (k == "pit_loss")      ok = to_double(v, cfg.pit_loss_s);
  else if (k == "engine_stress") ok = to_double(v, cfg.engine_stress);
  else if (k == "reliability")   ok = to_double(v, cfg.reliability);
  else if (k == "fuel_load")     ok = to_double(v, cfg.fuel_load_kg);
  else if (k == "safety_car")    ok = to_bool(v, cfg.safety_car);
  else if (k == "deg_factor")    ok = to_double(v, cfg.deg_factor);
  else if (k == "tyre_compound") {
    if (auto c = tyre_compound_from_string(v)) { cfg.compound = *c; ok = true; }
  } else {
    if (error_message) *error_message = "unknown key '" + k + "'";
    return false;
  }

  if (!ok && error_message) *error_message = "bad value '" + v + "' for " + k;
  return ok;
}

std::optional<RaceConfig> race_config_from_stream(std::istream& in,
                                                  const RaceConfig& defaults,
                                                  std::string* error_message) {
  RaceConfig cfg = defaults;
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
    const std::string raw = trim(line);
    if (raw.empty()) continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      if (error_message) *error_message = "line " + std::to_string(line_no) + ": expected key = value";
      return std::nullopt;
    }
    std::string err;
    if (!set_config_value(cfg, raw.substr(0, eq), raw.substr(eq + 1), &err)) {
      if (error_message) *error_message = "line " + std::to_string(line_no) + ": " + err;
      return std::nullopt;
    }
  }
  return cfg;
}

std::optional<RaceConfig> load_race_config(const std::string& path,
                                           const RaceConfig& defaults,
                                           std::string* error_message) {
  std::ifstream f(path);
  if (!f) {
    if (error_message) *error_message = "cannot open config file: " + path;
    return std::nullopt;
  }
  return race_config_from_stream(f, defaults, error_message);
}

} // namespace f1mc
