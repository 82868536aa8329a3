#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <sstream>
#include <f1mc/report.hpp>

using namespace f1mc;

TEST_CASE("format_race_time") {
  REQUIRE(format_race_time(5025.5) == "1:23:45.500");
  REQUIRE(format_race_time(91.234) == "1:31.234");
  REQUIRE(format_race_time(5.5) == "5.500");
  REQUIRE(format_race_time(0.0) == "0.000");
  REQUIRE(format_race_time(-1.0) == "--");
  REQUIRE(format_race_time(std::nan("")) == "--");
}

TEST_CASE("write_runs_csv leaves DNF times empty") {
  MonteCarloSummary s;
  RunRecord fin;
  fin.sim_id = 0;
  fin.laps_completed = 50;
  fin.finished = true;
  fin.total_time_s = 4600.5;
  fin.avg_lap_time_s = 92.01;
  fin.safety_car_laps = 2;
  RunRecord dnf;
  dnf.sim_id = 1;
  dnf.laps_completed = 17;
  s.runs = {fin, dnf};

  std::ostringstream out;
  write_runs_csv(out, s);
  REQUIRE(out.str() ==
          "sim_id,laps_completed,finished,total_time,avg_lap_time,safety_car_laps\n"
          "0,50,1,4600.5,92.01,2\n"
          "1,17,0,,,0\n");
}

TEST_CASE("write_laps_csv writes one row per lap") {
  RaceOutcome race;
  LapRecord l;
  l.lap = 1;
  l.lap_time_s = 120.0;
  l.power_hp = 800.0;
  l.rpm = 12000.0;
  l.temperature_c = 90.0;
  l.engine_deg = 0.001;
  l.fuel_penalty_s = 3.0;
  l.tyre_penalty_s = 0.5;
  l.safety_car = true;
  race.laps.push_back(l);

  std::ostringstream out;
  write_laps_csv(out, race);
  REQUIRE(out.str() ==
          "lap,lap_time,power,rpm,temp,engine_deg,fuel_penalty,tyre_deg,safety_car\n"
          "1,120,800,12000,90,0.001,3,0.5,1\n");
}

TEST_CASE("write_grid_csv names the compound") {
  StrategyGridResult g;
  StrategyCell c;
  c.compound = TyreCompound::Soft;
  c.pit_lap = 12;
  c.expected_time_s = 4550.25;
  c.finishers = 50;
  g.cells.push_back(c);

  std::ostringstream out;
  write_grid_csv(out, g);
  REQUIRE(out.str() == "compound,pit_lap,expected_time,finishers\nsoft,12,4550.25,50\n");
}

TEST_CASE("save_csv fails on an unwritable path") {
  StrategyGridResult g;
  REQUIRE_FALSE(save_csv("no_such_dir/grid.csv", g, &write_grid_csv));
}
