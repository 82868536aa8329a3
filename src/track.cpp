#include <f1mc/track.hpp>
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

static std::vector<std::string> split_csv_line(const std::string& line) {
  // No quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return cols.size() >= 3 && (lower(cols[0]) == "venue" || lower(cols[0]) == "key");
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

static std::optional<Venue> parse_venue_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;
  bool ok1 = false, ok2 = false;
  const double pit = to_double_safe(cols[1], ok1);
  const double deg = to_double_safe(cols[2], ok2);
  if (!(ok1 && ok2)) return std::nullopt;
  if (pit <= 0.0 || deg <= 0.0) return std::nullopt;
  return Venue{key, pit, deg};
}

static std::vector<Venue> make_catalog_builtin() {
  return {
    {"Monaco",      25.0, 0.8},
    {"Monza",       24.0, 0.7},
    {"Silverstone", 23.0, 1.1},
    {"Bahrain",     22.5, 1.4},
    {"Spa",         21.0, 1.0},
    {"Montreal",    18.0, 0.9},
    {"Suzuka",      22.0, 1.2},
    {"Singapore",   28.0, 0.9},
  };
}

const std::vector<Venue>& venue_catalog() {
  static const std::vector<Venue> cat = make_catalog_builtin();
  return cat;
}

std::optional<Venue> venue_match_in(const std::vector<Venue>& cat, const std::string& name) {
  const std::string haystack = lower(name);
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Venue& v){
    return !v.key.empty() && haystack.find(lower(v.key)) != std::string::npos;
  });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::optional<Venue> venue_match(const std::string& name) {
  return venue_match_in(venue_catalog(), name);
}

VenueConstants venue_constants_in(const std::vector<Venue>& cat, const std::string& name) {
  if (auto v = venue_match_in(cat, name)) return VenueConstants{v->pit_loss_s, v->deg_factor};
  return VenueConstants{};
}

VenueConstants venue_constants(const std::string& name) {
  return venue_constants_in(venue_catalog(), name);
}

std::vector<Venue> venue_catalog_from_csv_stream(std::istream& in) {
  std::vector<Venue> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (auto row = parse_venue_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<Venue>> load_venue_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return venue_catalog_from_csv_stream(f);
}

} // namespace f1mc
