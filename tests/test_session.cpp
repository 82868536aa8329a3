#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <sstream>
#include <f1mc/session.hpp>

using namespace f1mc;
using Catch::Approx;

namespace {

SessionLap lap(const char* driver, int n, double t, bool in = false, bool out = false) {
  SessionLap l;
  l.year = 2024;
  l.event = "British Grand Prix";
  l.session = "R";
  l.driver = driver;
  l.lap_number = n;
  l.lap_time_s = t;
  l.pit_in = in;
  l.pit_out = out;
  return l;
}

void seed(SessionStore& store) {
  std::string err;
  const SessionLap laps[] = {
    lap("VER", 1, 92.0), lap("VER", 2, 90.0), lap("VER", 3, 91.0, true),
    lap("VER", 4, 110.0, false, true), lap("VER", 5, 90.5), lap("VER", 6, 89.5),
    lap("HAM", 1, 92.5), lap("HAM", 2, 90.8),
  };
  for (const auto& l : laps) REQUIRE(store.record_lap(l, &err));
}

} // namespace

TEST_CASE("SessionStore summarizes a driver's race pace") {
  SessionStore store;
  std::string err;
  REQUIRE(store.open(":memory:", &err));
  REQUIRE(store.is_open());
  seed(store);

  SessionKey key;
  key.year = 2024;
  key.event = "british";
  key.session = "r";

  SessionSummary s;
  REQUIRE(store.summarize(key, "ver", &s, &err));
  // clean laps: 92.0, 90.0, 90.5, 89.5
  REQUIRE(s.base_lap_s == Approx(90.25));
  REQUIRE(s.lap_std_s == Approx(std::sqrt(3.5 / 3.0)));
  REQUIRE(s.total_laps == 6);
  REQUIRE(s.pit_laps == std::vector<int>{3});
  REQUIRE(s.event == "British Grand Prix");
}

TEST_CASE("SessionStore lists drivers in a session") {
  SessionStore store;
  std::string err;
  REQUIRE(store.open(":memory:", &err));
  seed(store);

  SessionKey key;
  key.event = "Grand Prix";
  std::vector<std::string> drivers;
  REQUIRE(store.drivers(key, &drivers, &err));
  REQUIRE(drivers == std::vector<std::string>{"HAM", "VER"});

  key.session = "Q";
  REQUIRE(store.drivers(key, &drivers, &err));
  REQUIRE(drivers.empty());
}

TEST_CASE("SessionStore reports missing calibration data") {
  SessionStore store;
  std::string err;

  SECTION("closed store") {
    SessionSummary s;
    REQUIRE_FALSE(store.summarize(SessionKey{}, "VER", &s, &err));
    REQUIRE(err.rfind("calibration unavailable: ", 0) == 0);
  }

  SECTION("unknown driver") {
    REQUIRE(store.open(":memory:", &err));
    seed(store);
    SessionKey key;
    key.event = "British";
    SessionSummary s;
    REQUIRE_FALSE(store.summarize(key, "ALO", &s, &err));
    REQUIRE(err.rfind("calibration unavailable: ", 0) == 0);
  }
}

TEST_CASE("apply_calibration") {
  RaceConfig base;

  SECTION("venue only keeps the driver numbers") {
    auto cfg = apply_calibration(base, nullptr, VenueConstants{25.0, 0.8});
    REQUIRE(cfg.pit_loss_s == Approx(25.0));
    REQUIRE(cfg.deg_factor == Approx(0.8));
    REQUIRE(cfg.base_lap_s == Approx(base.base_lap_s));
    REQUIRE(cfg.pit_lap == base.pit_lap);
  }

  SECTION("session numbers are clamped and the pit lap kept in range") {
    SessionSummary s;
    s.base_lap_s = 80.5;
    s.lap_std_s = 3.2;
    s.total_laps = 26;
    auto cfg = apply_calibration(base, &s, VenueConstants{});
    REQUIRE(cfg.base_lap_s == Approx(80.5));
    REQUIRE(cfg.lap_std_s == Approx(2.0));
    REQUIRE(cfg.total_laps == 26);
    REQUIRE(cfg.pit_lap == 13);
    REQUIRE_FALSE(validate_race_config(cfg).has_value());
  }

  SECTION("very consistent driver gets the minimum variability") {
    SessionSummary s;
    s.base_lap_s = 90.0;
    s.lap_std_s = 0.01;
    s.total_laps = 50;
    auto cfg = apply_calibration(base, &s, VenueConstants{});
    REQUIRE(cfg.lap_std_s == Approx(0.1));
    REQUIRE(cfg.pit_lap == 25);
  }
}

TEST_CASE("session_laps_from_csv_stream") {
  std::istringstream ss(R"(year,event,session,driver,lap,lap_time_s,pit_in,pit_out
# exported timing
2024, British Grand Prix, R, NOR, 1, 93.1, 0, 0
2024,British Grand Prix,R,NOR,2,slow,0,0
2024,British Grand Prix,,NOR,3,90.7,1,0
2024,British Grand Prix,R,NOR
)");
  std::size_t skipped = 0;
  auto laps = session_laps_from_csv_stream(ss, &skipped);
  REQUIRE(laps.size() == 2);
  REQUIRE(skipped == 2);
  REQUIRE(laps[0].event == "British Grand Prix");
  REQUIRE(laps[0].driver == "NOR");
  REQUIRE(laps[0].lap_time_s == Approx(93.1));
  REQUIRE(laps[1].session == "R");
  REQUIRE(laps[1].pit_in);
  REQUIRE_FALSE(laps[1].pit_out);
}

TEST_CASE("SessionStore imports a batch") {
  SessionStore store;
  std::string err;
  REQUIRE(store.open(":memory:", &err));

  std::vector<SessionLap> laps;
  for (int n = 1; n <= 5; ++n) laps.push_back(lap("LEC", n, 88.0 + n));
  REQUIRE(store.record_laps(laps, &err));
  // re-importing the same laps replaces them
  REQUIRE(store.record_laps(laps, &err));

  SessionKey key;
  key.event = "british";
  SessionSummary s;
  REQUIRE(store.summarize(key, "LEC", &s, &err));
  REQUIRE(s.total_laps == 5);
  REQUIRE(s.base_lap_s == Approx(91.0));
  REQUIRE(s.pit_laps.empty());
}

TEST_CASE("SessionStore summarizes exactly one event") {
  SessionStore store;
  std::string err;
  REQUIRE(store.open(":memory:", &err));

  std::vector<SessionLap> laps;
  for (int n = 1; n <= 50; ++n) laps.push_back(lap("VER", n, 90.0));
  for (int n = 1; n <= 70; ++n) {
    SessionLap l = lap("VER", n, 80.0 + (n % 2));
    l.event = "Hungarian Grand Prix";
    laps.push_back(l);
  }
  REQUIRE(store.record_laps(laps, &err));

  SessionKey key;
  SessionSummary s;

  SECTION("a key matching several events is rejected") {
    key.event = "Grand Prix";
    REQUIRE_FALSE(store.summarize(key, "VER", &s, &err));
    REQUIRE(err.rfind("calibration unavailable: ambiguous event", 0) == 0);
  }

  SECTION("an empty key is rejected") {
    key.event = "";
    REQUIRE_FALSE(store.summarize(key, "VER", &s, &err));
    REQUIRE(err.rfind("calibration unavailable: ambiguous event", 0) == 0);
  }

  SECTION("a distinguishing key uses only that event's laps") {
    key.event = "british";
    REQUIRE(store.summarize(key, "VER", &s, &err));
    REQUIRE(s.event == "British Grand Prix");
    REQUIRE(s.base_lap_s == Approx(90.0));
    REQUIRE(s.total_laps == 50);

    key.event = "hungarian";
    REQUIRE(store.summarize(key, "VER", &s, &err));
    REQUIRE(s.event == "Hungarian Grand Prix");
    REQUIRE(s.total_laps == 70);
    REQUIRE(s.base_lap_s < 82.0);
  }

  SECTION("a full event name wins over longer names containing it") {
    SessionLap sprint = lap("VER", 1, 95.0);
    sprint.event = "British Grand Prix Sprint Shootout";
    REQUIRE(store.record_lap(sprint, &err));
    key.event = "BRITISH GRAND PRIX";
    REQUIRE(store.summarize(key, "VER", &s, &err));
    REQUIRE(s.event == "British Grand Prix");
    REQUIRE(s.total_laps == 50);
  }
}
