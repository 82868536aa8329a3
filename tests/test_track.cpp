#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <f1mc/track.hpp>

using namespace f1mc;
using Catch::Approx;

static std::string csv_minimal = R"(venue,pit_loss_s,deg_factor
Zandvoort,21.5,1.3
Imola,27.0,0.9
)";

static std::string csv_with_noise = R"( key , pit_loss_s , deg_factor
# comment lines are ignored
Zandvoort , 21.5 , 1.3
, , ,
Baku, -1 , 1.0
Imola, 27.0 , 0.9
)";

TEST_CASE("venue_match finds the catalog key inside an event name") {
  auto v = venue_match("British Grand Prix - Silverstone");
  REQUIRE(v.has_value());
  REQUIRE(v->key == "Silverstone");
  REQUIRE(v->pit_loss_s == Approx(23.0));
  REQUIRE(v->deg_factor == Approx(1.1));

  REQUIRE(venue_match("MONACO")->key == "Monaco");
  REQUIRE_FALSE(venue_match("Las Vegas Grand Prix").has_value());
}

TEST_CASE("venue_constants falls back to defaults") {
  auto known = venue_constants("Bahrain Grand Prix");
  REQUIRE(known.pit_loss_s == Approx(22.5));
  REQUIRE(known.deg_factor == Approx(1.4));

  auto unknown = venue_constants("Miami");
  REQUIRE(unknown.pit_loss_s == Approx(22.0));
  REQUIRE(unknown.deg_factor == Approx(1.0));
}

TEST_CASE("venue_catalog_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto cat = venue_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);

  auto z = venue_match_in(cat, "Dutch GP Zandvoort");
  REQUIRE(z.has_value());
  REQUIRE(z->pit_loss_s == Approx(21.5));
  REQUIRE(z->deg_factor == Approx(1.3));

  auto c = venue_constants_in(cat, "Imola");
  REQUIRE(c.pit_loss_s == Approx(27.0));
}

TEST_CASE("venue_catalog_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto cat = venue_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);
  REQUIRE(venue_match_in(cat, "Zandvoort").has_value());
  REQUIRE(venue_match_in(cat, "Imola").has_value());
  REQUIRE_FALSE(venue_match_in(cat, "Baku").has_value());
}

TEST_CASE("load_venue_catalog_csv returns nullopt on missing file") {
  auto none = load_venue_catalog_csv("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}
