#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <f1mc/config.hpp>
#include <f1mc/log.hpp>
#include <f1mc/monte_carlo.hpp>
#include <f1mc/race.hpp>
#include <f1mc/report.hpp>
#include <f1mc/session.hpp>
#include <f1mc/strategy.hpp>
#include <f1mc/track.hpp>

using namespace f1mc;

namespace {

struct CliArgs {
  std::string mode = "mc";               // race | mc | optimize | import
  std::string config_path;
  std::vector<std::string> overrides;    // key=value
  std::string venue;
  std::string venue_csv;
  std::string session_db;
  SessionKey session;
  std::string driver;
  std::size_t sims = 2000;
  int sims_per_cell = 50;
  std::uint32_t seed = 42;
  unsigned workers = 0;
  std::size_t bins = 40;
  std::string csv_out;
  std::string laps_csv;                  // import source
};

bool parse_int(const std::string& s, int* out) {
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = static_cast<int>(v);
  return true;
}

bool parse_size(const std::string& s, std::size_t* out) {
  int v = 0;
  if (!parse_int(s, &v) || v < 0) return false;
  *out = static_cast<std::size_t>(v);
  return true;
}

void print_usage() {
  std::cout <<
    "f1mc_cli <race|mc|optimize> [options]\n"
    "f1mc_cli import --session-db FILE --laps-csv FILE\n"
    "  --config FILE          key = value race configuration\n"
    "  --set KEY=VALUE        override one configuration field (repeatable)\n"
    "  --venue NAME           calibrate pit loss / degradation from the venue table\n"
    "  --venue-csv FILE       venue table to use instead of the built-in one\n"
    "  --session-db FILE      lap store for session calibration\n"
    "  --year N --gp NAME --session S --driver CODE   (--gp must name one event)\n"
    "  --sims N               Monte Carlo runs (default 2000)\n"
    "  --cell-sims N          optimizer repetitions per cell (default 50)\n"
    "  --seed N  --workers N  --bins N\n"
    "  --csv FILE             write laps / runs / grid as CSV\n"
    "  --laps-csv FILE        year,event,session,driver,lap,lap_time_s,pit_in,pit_out rows\n"
    "  --verbose              debug logging\n";
}

bool parse_args(int argc, char** argv, CliArgs* args) {
  int i = 1;
  if (i < argc && argv[i][0] != '-') args->mode = argv[i++];
  for (; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](const std::string& flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    const char* v = nullptr;
    int n = 0;
    if (a == "--config") {
      if (!(v = need(a))) return false;
      args->config_path = v;
    } else if (a == "--set") {
      if (!(v = need(a))) return false;
      args->overrides.emplace_back(v);
    } else if (a == "--venue") {
      if (!(v = need(a))) return false;
      args->venue = v;
    } else if (a == "--venue-csv") {
      if (!(v = need(a))) return false;
      args->venue_csv = v;
    } else if (a == "--session-db") {
      if (!(v = need(a))) return false;
      args->session_db = v;
    } else if (a == "--year") {
      if (!(v = need(a)) || !parse_int(v, &args->session.year)) return false;
    } else if (a == "--gp") {
      if (!(v = need(a))) return false;
      args->session.event = v;
    } else if (a == "--session") {
      if (!(v = need(a))) return false;
      args->session.session = v;
    } else if (a == "--driver") {
      if (!(v = need(a))) return false;
      args->driver = v;
    } else if (a == "--sims") {
      if (!(v = need(a)) || !parse_size(v, &args->sims)) return false;
    } else if (a == "--cell-sims") {
      if (!(v = need(a)) || !parse_int(v, &args->sims_per_cell)) return false;
    } else if (a == "--seed") {
      if (!(v = need(a)) || !parse_int(v, &n)) return false;
      args->seed = static_cast<std::uint32_t>(n);
    } else if (a == "--workers") {
      if (!(v = need(a)) || !parse_int(v, &n) || n < 0) return false;
      args->workers = static_cast<unsigned>(n);
    } else if (a == "--bins") {
      if (!(v = need(a)) || !parse_size(v, &args->bins)) return false;
    } else if (a == "--csv") {
      if (!(v = need(a))) return false;
      args->csv_out = v;
    } else if (a == "--laps-csv") {
      if (!(v = need(a))) return false;
      args->laps_csv = v;
    } else if (a == "--verbose") {
      set_log_level(LogLevel::Debug);
    } else if (a == "--help" || a == "-h") {
      print_usage();
      return false;
    } else {
      std::cerr << "Unknown argument: " << a << "\n";
      return false;
    }
  }
  if (args->mode != "race" && args->mode != "mc" && args->mode != "optimize" &&
      args->mode != "import") {
    std::cerr << "Unknown mode: " << args->mode << "\n";
    return false;
  }
  return true;
}

// Best-effort: any calibration failure leaves cfg as it was.
RaceConfig calibrate(const CliArgs& args, RaceConfig cfg) {
  std::string event_name = args.venue;
  SessionSummary summary;
  bool have_session = false;

  if (!args.session_db.empty() && !args.driver.empty() && args.session.event.empty()) {
    log_warn("calibration unavailable: --driver needs --gp to pick one event");
  } else if (!args.session_db.empty() && !args.driver.empty()) {
    SessionStore store;
    std::string err;
    if (!store.open(args.session_db, &err)) {
      log_warn("calibration unavailable: " + err);
    } else if (!store.summarize(args.session, args.driver, &summary, &err)) {
      log_warn(err);
    } else {
      have_session = true;
      if (event_name.empty()) event_name = summary.event;
      log_info("session calibration: " + summary.driver + " @ " + summary.event +
               " base=" + std::to_string(summary.base_lap_s) +
               " std=" + std::to_string(summary.lap_std_s) +
               " laps=" + std::to_string(summary.total_laps));
    }
  }

  if (event_name.empty() && !have_session) return cfg;

  VenueConstants venue{};
  if (!args.venue_csv.empty()) {
    if (auto cat = load_venue_catalog_csv(args.venue_csv)) {
      venue = venue_constants_in(*cat, event_name);
    } else {
      log_warn("cannot open venue table " + args.venue_csv + ", using built-in");
      venue = venue_constants(event_name);
    }
  } else {
    venue = venue_constants(event_name);
  }
  return apply_calibration(cfg, have_session ? &summary : nullptr, venue);
}

void print_config(const RaceConfig& c) {
  std::cout << std::fixed << std::setprecision(2)
            << "laps=" << c.total_laps << " base=" << c.base_lap_s << "s std=" << c.lap_std_s
            << " pit_lap=" << c.pit_lap << " pit_loss=" << c.pit_loss_s << "s"
            << " compound=" << to_string(c.compound) << " fuel=" << c.fuel_load_kg << "kg"
            << " stress=" << c.engine_stress << " rel=" << c.reliability
            << " deg=" << c.deg_factor << " sc=" << (c.safety_car ? "on" : "off") << "\n";
}

int run_import(const CliArgs& args) {
  if (args.session_db.empty() || args.laps_csv.empty()) {
    std::cerr << "import needs --session-db and --laps-csv\n";
    return 1;
  }
  std::ifstream in(args.laps_csv);
  if (!in) {
    std::cerr << "Cannot open " << args.laps_csv << "\n";
    return 1;
  }
  std::size_t skipped = 0;
  const auto laps = session_laps_from_csv_stream(in, &skipped);
  if (skipped > 0) log_warn("skipped " + std::to_string(skipped) + " malformed lap rows");

  SessionStore store;
  std::string err;
  if (!store.open(args.session_db, &err) || !store.record_laps(laps, &err)) {
    std::cerr << "Import failed: " << err << "\n";
    return 1;
  }
  std::cout << "Imported " << laps.size() << " laps into " << args.session_db << "\n";

  std::vector<std::string> drivers;
  if (!args.session.event.empty() && store.drivers(args.session, &drivers, &err)) {
    std::cout << "Drivers in " << args.session.year << " " << args.session.event << " "
              << args.session.session << ":";
    for (const auto& d : drivers) std::cout << " " << d;
    std::cout << "\n";
  }
  return 0;
}

int run_race(const CliArgs& args, const RaceConfig& cfg) {
  std::mt19937 rng(args.seed);
  const auto race = simulate_race(cfg, rng);
  if (!race) return 1;

  std::cout << " lap    time     power    temp  eng_deg  fuel   tyre  sc\n";
  for (const auto& l : race->laps) {
    std::cout << std::setw(4) << l.lap << "  "
              << std::setw(8) << std::setprecision(3) << l.lap_time_s << "  "
              << std::setw(7) << std::setprecision(1) << l.power_hp << "  "
              << std::setw(6) << l.temperature_c << "  "
              << std::setw(7) << std::setprecision(4) << l.engine_deg << "  "
              << std::setw(5) << std::setprecision(2) << l.fuel_penalty_s << "  "
              << std::setw(5) << l.tyre_penalty_s << "  "
              << (l.safety_car ? "SC" : "") << "\n";
  }
  if (race->dnf) {
    std::cout << "DNF on lap " << race->dnf_lap.value_or(0) << "\n";
  } else {
    std::cout << "Finished: " << format_race_time(race->total_time_s)
              << " (" << std::setprecision(2) << race->total_time_s << "s)\n";
  }
  if (!args.csv_out.empty() && !save_csv(args.csv_out, *race, &write_laps_csv)) {
    log_error("cannot write " + args.csv_out);
    return 1;
  }
  return 0;
}

int run_mc(const CliArgs& args, const RaceConfig& cfg) {
  MonteCarloOptions opts;
  opts.simulations = args.sims;
  opts.seed = args.seed;
  opts.workers = args.workers;
  const auto summary = run_monte_carlo(cfg, opts);
  if (!summary) return 1;

  std::cout << "Completed " << summary->simulations << " simulations | "
            << summary->finished << " finished races\n";
  const auto stats = finish_stats(*summary);
  if (!stats) {
    std::cout << "All simulations resulted in DNF. Reduce engine stress or increase reliability.\n";
  } else {
    std::cout << std::setprecision(2)
              << "Expected time   " << stats->mean_s << "s\n"
              << "Best case (P5)  " << stats->p5_s << "s\n"
              << "Worst case (P95)" << stats->p95_s << "s\n"
              << "Finish rate     " << 100.0 * summary->finish_rate() << "%\n";
    if (const auto h = finish_histogram(*summary, args.bins)) {
      std::size_t peak = 1;
      for (auto c : h->counts) peak = std::max(peak, c);
      for (std::size_t b = 0; b < h->counts.size(); ++b) {
        const double lo = h->lo_s + h->bin_width() * static_cast<double>(b);
        std::cout << std::setw(10) << std::setprecision(1) << lo << " | "
                  << std::string(h->counts[b] * 50 / peak, '#') << "\n";
      }
    }
  }
  if (!args.csv_out.empty() && !save_csv(args.csv_out, *summary, &write_runs_csv)) {
    log_error("cannot write " + args.csv_out);
    return 1;
  }
  return 0;
}

int run_optimize(const CliArgs& args, const RaceConfig& cfg) {
  StrategyOptions opts;
  opts.sims_per_cell = args.sims_per_cell;
  opts.seed = args.seed;
  opts.workers = args.workers;
  const auto grid = optimize_strategy(cfg, opts);
  if (!grid) return 1;

  for (const auto& c : grid->cells) {
    std::cout << std::setw(7) << to_string(c.compound) << "  lap " << std::setw(3) << c.pit_lap
              << "  " << std::setprecision(2) << c.expected_time_s << "s"
              << "  (" << c.finishers << " finished)\n";
  }
  if (!grid->best) {
    std::cout << "Optimization failed. All tested strategies resulted in DNF.\n";
  } else {
    const auto& b = *grid->best;
    std::cout << "Ideal strategy: " << to_string(b.compound) << " until lap " << b.pit_lap
              << ", expected " << format_race_time(b.expected_time_s) << "\n";
  }
  if (!args.csv_out.empty() && !save_csv(args.csv_out, *grid, &write_grid_csv)) {
    log_error("cannot write " + args.csv_out);
    return 1;
  }
  return grid->best ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (!parse_args(argc, argv, &args)) return 1;
  if (args.mode == "import") return run_import(args);

  RaceConfig cfg;
  std::string err;
  if (!args.config_path.empty()) {
    auto loaded = load_race_config(args.config_path, cfg, &err);
    if (!loaded) {
      std::cerr << "Config load failed: " << err << "\n";
      return 1;
    }
    cfg = *loaded;
  }
  cfg = calibrate(args, cfg);
  for (const auto& kv : args.overrides) {
    const auto eq = kv.find('=');
    if (eq == std::string::npos ||
        !set_config_value(cfg, kv.substr(0, eq), kv.substr(eq + 1), &err)) {
      std::cerr << "Bad --set " << kv << (err.empty() ? "" : ": " + err) << "\n";
      return 1;
    }
  }
  if (auto invalid = validate_race_config(cfg)) {
    std::cerr << describe(*invalid) << "\n";
    return 1;
  }

  print_config(cfg);
  if (args.mode == "race") return run_race(args, cfg);
  if (args.mode == "optimize") return run_optimize(args, cfg);
  return run_mc(args, cfg);
}
