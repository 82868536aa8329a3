#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace f1mc {

struct Venue {
  std::string key;          // e.g., "Silverstone"
  double pit_loss_s;        // pit lane + stationary time lost
  double deg_factor;        // tyre abrasiveness multiplier
};

struct VenueConstants {
  double pit_loss_s = 22.0;
  double deg_factor = 1.0;
};

// Built-in catalog of historical defaults.
const std::vector<Venue>& venue_catalog();

// First catalog entry whose key appears (case-insensitive) inside `name`,
// e.g. "British Grand Prix - Silverstone" -> Silverstone.
std::optional<Venue> venue_match_in(const std::vector<Venue>& cat, const std::string& name);
std::optional<Venue> venue_match(const std::string& name);

// Never fails: falls back to VenueConstants{} (22.0 s, 1.0) without a match.
VenueConstants venue_constants(const std::string& name);
VenueConstants venue_constants_in(const std::vector<Venue>& cat, const std::string& name);

// Stream-based CSV loader: venue,pit_loss_s,deg_factor.
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<Venue> venue_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Venue>> load_venue_catalog_csv(const std::string& path);

} // namespace f1mc
