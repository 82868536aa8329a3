#include <f1mc/report.hpp>
#include <cmath>
#include <cstdio>
#include <iomanip>

namespace f1mc {

void write_laps_csv(std::ostream& out, const RaceOutcome& race) {
  out << "lap,lap_time,power,rpm,temp,engine_deg,fuel_penalty,tyre_deg,safety_car\n";
  out << std::setprecision(10);
  for (const auto& l : race.laps) {
    out << l.lap << ","
        << l.lap_time_s << ","
        << l.power_hp << ","
        << l.rpm << ","
        << l.temperature_c << ","
        << l.engine_deg << ","
        << l.fuel_penalty_s << ","
        << l.tyre_penalty_s << ","
        << (l.safety_car ? 1 : 0) << "\n";
  }
}

void write_runs_csv(std::ostream& out, const MonteCarloSummary& s) {
  out << "sim_id,laps_completed,finished,total_time,avg_lap_time,safety_car_laps\n";
  out << std::setprecision(10);
  for (const auto& r : s.runs) {
    out << r.sim_id << ","
        << r.laps_completed << ","
        << (r.finished ? 1 : 0) << ",";
    if (r.finished) out << r.total_time_s << "," << r.avg_lap_time_s;
    else out << ",";
    out << "," << r.safety_car_laps << "\n";
  }
}

void write_grid_csv(std::ostream& out, const StrategyGridResult& g) {
  out << "compound,pit_lap,expected_time,finishers\n";
  out << std::setprecision(10);
  for (const auto& c : g.cells) {
    out << to_string(c.compound) << ","
        << c.pit_lap << ","
        << c.expected_time_s << ","
        << c.finishers << "\n";
  }
}

std::string format_race_time(double s) {
  if (s < 0.0 || !std::isfinite(s)) return "--";
  const long long total_ms = static_cast<long long>(std::llround(s * 1000.0));
  const long long hours = total_ms / 3600000;
  const int minutes = static_cast<int>((total_ms / 60000) % 60);
  const int secs = static_cast<int>((total_ms / 1000) % 60);
  const int ms = static_cast<int>(total_ms % 1000);
  char buf[48];
  if (hours > 0)        std::snprintf(buf, sizeof(buf), "%lld:%02d:%02d.%03d", hours, minutes, secs, ms);
  else if (minutes > 0) std::snprintf(buf, sizeof(buf), "%d:%02d.%03d", minutes, secs, ms);
  else                  std::snprintf(buf, sizeof(buf), "%d.%03d", secs, ms);
  return buf;
}

} // namespace f1mc
