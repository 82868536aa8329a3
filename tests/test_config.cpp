#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <f1mc/config.hpp>

using namespace f1mc;
using Catch::Approx;

TEST_CASE("default configuration is valid") {
  RaceConfig cfg;
  REQUIRE_FALSE(validate_race_config(cfg).has_value());
  REQUIRE(cfg.total_laps == 50);
  REQUIRE(cfg.pit_lap == 25);
  REQUIRE(cfg.compound == TyreCompound::Medium);
}

TEST_CASE("validate_race_config rejects bad fields") {
  RaceConfig cfg;

  SECTION("pit lap outside the race") {
    cfg.pit_lap = 51;
    auto err = validate_race_config(cfg);
    REQUIRE(err.has_value());
    REQUIRE(err->field == "pit_lap");
  }

  SECTION("zero laps") {
    cfg.total_laps = 0;
    cfg.pit_lap = 0;
    REQUIRE(validate_race_config(cfg)->field == "laps");
  }

  SECTION("negative variability") {
    cfg.lap_std_s = -0.1;
    REQUIRE(validate_race_config(cfg)->field == "lap_std");
  }

  SECTION("reliability above one") {
    cfg.reliability = 1.01;
    REQUIRE(validate_race_config(cfg)->field == "reliability");
  }

  SECTION("engine stress outside [0.5, 2]") {
    cfg.engine_stress = 2.5;
    auto err = validate_race_config(cfg);
    REQUIRE(err->field == "engine_stress");
    REQUIRE(describe(*err) == "invalid engine_stress: must lie within [0.5, 2.0]");
  }

  SECTION("zero variability is allowed") {
    cfg.lap_std_s = 0.0;
    REQUIRE_FALSE(validate_race_config(cfg).has_value());
  }
}

TEST_CASE("race_config_from_stream overlays defaults") {
  std::istringstream ss(R"(# qualifying pace
base_lap = 88.5
laps = 57
pit_lap = 20    # early stop
tyre_compound = Soft
safety_car = off

reliability=0.99
)");
  std::string err;
  auto cfg = race_config_from_stream(ss, RaceConfig{}, &err);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->base_lap_s == Approx(88.5));
  REQUIRE(cfg->total_laps == 57);
  REQUIRE(cfg->pit_lap == 20);
  REQUIRE(cfg->compound == TyreCompound::Soft);
  REQUIRE_FALSE(cfg->safety_car);
  REQUIRE(cfg->reliability == Approx(0.99));
  // untouched keys keep their defaults
  REQUIRE(cfg->pit_loss_s == Approx(22.0));
  REQUIRE(cfg->fuel_load_kg == Approx(110.0));
}

TEST_CASE("race_config_from_stream reports the failing line") {
  SECTION("unknown key") {
    std::istringstream ss("laps = 40\nwing_angle = 3\n");
    std::string err;
    REQUIRE_FALSE(race_config_from_stream(ss, RaceConfig{}, &err).has_value());
    REQUIRE(err == "line 2: unknown key 'wing_angle'");
  }

  SECTION("unparsable value") {
    std::istringstream ss("laps = forty\n");
    std::string err;
    REQUIRE_FALSE(race_config_from_stream(ss, RaceConfig{}, &err).has_value());
    REQUIRE(err == "line 1: bad value 'forty' for laps");
  }

  SECTION("missing separator") {
    std::istringstream ss("\nlaps 40\n");
    std::string err;
    REQUIRE_FALSE(race_config_from_stream(ss, RaceConfig{}, &err).has_value());
    REQUIRE(err == "line 2: expected key = value");
  }
}

TEST_CASE("set_config_value") {
  RaceConfig cfg;
  std::string err;
  REQUIRE(set_config_value(cfg, "engine_stress", "1.5", &err));
  REQUIRE(cfg.engine_stress == Approx(1.5));
  REQUIRE(set_config_value(cfg, "SAFETY_CAR", "no", &err));
  REQUIRE_FALSE(cfg.safety_car);
  REQUIRE_FALSE(set_config_value(cfg, "tyre_compound", "wet", &err));
  REQUIRE(cfg.compound == TyreCompound::Medium);
}

TEST_CASE("load_race_config fails on a missing file") {
  std::string err;
  REQUIRE_FALSE(load_race_config("no_such_config.cfg", RaceConfig{}, &err).has_value());
  REQUIRE(err == "cannot open config file: no_such_config.cfg");
}
