#include <f1mc/session.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace f1mc {

namespace {

const char* kCreateLaps = R"SQL(
    CREATE TABLE IF NOT EXISTS session_laps (
        year INTEGER NOT NULL,
        event TEXT NOT NULL,
        session TEXT NOT NULL,
        driver TEXT NOT NULL,
        lap_number INTEGER NOT NULL,
        lap_time_s REAL NOT NULL,
        pit_in INTEGER NOT NULL DEFAULT 0,
        pit_out INTEGER NOT NULL DEFAULT 0,
        PRIMARY KEY (year, event, session, driver, lap_number)
    );
)SQL";

// RAII for prepared statements.
struct Stmt {
  sqlite3_stmt* s = nullptr;
  ~Stmt() { if (s) sqlite3_finalize(s); }
};

std::string column_text(sqlite3_stmt* s, int col) {
  const unsigned char* raw = sqlite3_column_text(s, col);
  return raw ? reinterpret_cast<const char*>(raw) : std::string{};
}

double median(std::vector<double> v) {
  std::sort(v.begin(), v.end());
  const std::size_t n = v.size();
  return (n % 2 == 1) ? v[n / 2] : 0.5 * (v[n / 2 - 1] + v[n / 2]);
}

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool to_int(const std::string& s, int& out) {
  try {
    std::size_t idx = 0;
    out = std::stoi(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

bool to_double(const std::string& s, double& out) {
  try {
    std::size_t idx = 0;
    out = std::stod(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

} // namespace

std::vector<SessionLap> session_laps_from_csv_stream(std::istream& in, std::size_t* skipped) {
  std::vector<SessionLap> out;
  std::size_t bad = 0;
  std::string line;
  bool first = true;

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    std::vector<std::string> cols;
    std::string cur;
    for (char c : raw) {
      if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
      else cur.push_back(c);
    }
    cols.push_back(trim(cur));

    const bool header = first && !cols.empty() && (cols[0] == "year" || cols[0] == "Year");
    first = false;
    if (header) continue;

    SessionLap lap;
    int pit_in = 0, pit_out = 0;
    if (cols.size() != 8 ||
        !to_int(cols[0], lap.year) ||
        !to_int(cols[4], lap.lap_number) ||
        !to_double(cols[5], lap.lap_time_s) ||
        !to_int(cols[6], pit_in) ||
        !to_int(cols[7], pit_out) ||
        cols[1].empty() || cols[3].empty()) {
      ++bad;
      continue;
    }
    lap.event = cols[1];
    lap.session = cols[2].empty() ? "R" : cols[2];
    lap.driver = cols[3];
    lap.pit_in = pit_in != 0;
    lap.pit_out = pit_out != 0;
    out.push_back(std::move(lap));
  }
  if (skipped) *skipped = bad;
  return out;
}

SessionStore::~SessionStore() {
  close();
}

void SessionStore::close() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool SessionStore::exec_(const char* sql, std::string* error_message) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    if (error_message) *error_message = err ? err : "sqlite error";
    sqlite3_free(err);
    return false;
  }
  return true;
}

bool SessionStore::open(const std::string& db_path, std::string* error_message) {
  close();
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    if (error_message) *error_message = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    close();
    return false;
  }
  if (!exec_(kCreateLaps, error_message)) {
    close();
    return false;
  }
  return true;
}

bool SessionStore::record_lap(const SessionLap& lap, std::string* error_message) {
  return record_laps(std::vector<SessionLap>{lap}, error_message);
}

bool SessionStore::record_laps(const std::vector<SessionLap>& laps, std::string* error_message) {
  if (!db_) {
    if (error_message) *error_message = "session store is not open";
    return false;
  }
  const char* insert = R"SQL(
      INSERT OR REPLACE INTO session_laps
      (year, event, session, driver, lap_number, lap_time_s, pit_in, pit_out)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?);
  )SQL";
  if (!exec_("BEGIN;", error_message)) return false;

  Stmt st;
  if (sqlite3_prepare_v2(db_, insert, -1, &st.s, nullptr) != SQLITE_OK) {
    if (error_message) *error_message = sqlite3_errmsg(db_);
    (void)exec_("ROLLBACK;", nullptr);
    return false;
  }
  for (const auto& lap : laps) {
    sqlite3_bind_int(st.s, 1, lap.year);
    sqlite3_bind_text(st.s, 2, lap.event.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.s, 3, lap.session.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.s, 4, lap.driver.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(st.s, 5, lap.lap_number);
    sqlite3_bind_double(st.s, 6, lap.lap_time_s);
    sqlite3_bind_int(st.s, 7, lap.pit_in ? 1 : 0);
    sqlite3_bind_int(st.s, 8, lap.pit_out ? 1 : 0);
    if (sqlite3_step(st.s) != SQLITE_DONE) {
      if (error_message) *error_message = sqlite3_errmsg(db_);
      sqlite3_reset(st.s);
      (void)exec_("ROLLBACK;", nullptr);
      return false;
    }
    sqlite3_reset(st.s);
    sqlite3_clear_bindings(st.s);
  }
  return exec_("COMMIT;", error_message);
}

bool SessionStore::drivers(const SessionKey& key, std::vector<std::string>* out,
                           std::string* error_message) const {
  if (!db_) {
    if (error_message) *error_message = "session store is not open";
    return false;
  }
  const char* sql = R"SQL(
      SELECT DISTINCT driver FROM session_laps
      WHERE year = ? AND instr(lower(event), lower(?)) > 0 AND upper(session) = upper(?)
      ORDER BY driver;
  )SQL";
  Stmt st;
  if (sqlite3_prepare_v2(db_, sql, -1, &st.s, nullptr) != SQLITE_OK) {
    if (error_message) *error_message = sqlite3_errmsg(db_);
    return false;
  }
  sqlite3_bind_int(st.s, 1, key.year);
  sqlite3_bind_text(st.s, 2, key.event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.s, 3, key.session.c_str(), -1, SQLITE_TRANSIENT);

  out->clear();
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) out->push_back(column_text(st.s, 0));
  if (rc != SQLITE_DONE) {
    if (error_message) *error_message = sqlite3_errmsg(db_);
    return false;
  }
  return true;
}

bool SessionStore::resolve_event_(const SessionKey& key, std::string* event,
                                  std::string* error_message) const {
  const std::string wanted = trim(key.event);
  if (wanted.empty()) {
    if (error_message) *error_message = "calibration unavailable: ambiguous event (no event name given)";
    return false;
  }
  const char* sql = R"SQL(
      SELECT DISTINCT event FROM session_laps
      WHERE year = ? AND instr(lower(event), lower(?)) > 0 AND upper(session) = upper(?)
      ORDER BY event;
  )SQL";
  Stmt st;
  if (sqlite3_prepare_v2(db_, sql, -1, &st.s, nullptr) != SQLITE_OK) {
    if (error_message) *error_message = std::string("calibration unavailable: ") + sqlite3_errmsg(db_);
    return false;
  }
  sqlite3_bind_int(st.s, 1, key.year);
  sqlite3_bind_text(st.s, 2, wanted.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.s, 3, key.session.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<std::string> matches;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) matches.push_back(column_text(st.s, 0));
  if (rc != SQLITE_DONE) {
    if (error_message) *error_message = std::string("calibration unavailable: ") + sqlite3_errmsg(db_);
    return false;
  }

  const std::string session_label = std::to_string(key.year) + " " + key.session;
  if (matches.empty()) {
    if (error_message) {
      *error_message = "calibration unavailable: no event matching '" + wanted + "' in " + session_label;
    }
    return false;
  }
  if (matches.size() > 1) {
    // A full, case-insensitive name still picks one event out of several.
    auto exact = std::find_if(matches.begin(), matches.end(), [&](const std::string& m) {
      return lower(m) == lower(wanted);
    });
    if (exact == matches.end()) {
      if (error_message) {
        std::string names;
        for (const auto& m : matches) names += (names.empty() ? "" : ", ") + m;
        *error_message = "calibration unavailable: ambiguous event '" + wanted + "' in " +
                         session_label + " (" + names + ")";
      }
      return false;
    }
    *event = *exact;
    return true;
  }
  *event = matches.front();
  return true;
}

bool SessionStore::summarize(const SessionKey& key, const std::string& driver,
                             SessionSummary* out, std::string* error_message) const {
  if (!db_) {
    if (error_message) *error_message = "calibration unavailable: session store is not open";
    return false;
  }
  std::string event;
  if (!resolve_event_(key, &event, error_message)) return false;

  const char* sql = R"SQL(
      SELECT lap_number, lap_time_s, pit_in, pit_out FROM session_laps
      WHERE year = ? AND event = ? AND upper(session) = upper(?)
        AND upper(driver) = upper(?) AND lap_time_s > 0
      ORDER BY lap_number;
  )SQL";
  Stmt st;
  if (sqlite3_prepare_v2(db_, sql, -1, &st.s, nullptr) != SQLITE_OK) {
    if (error_message) *error_message = std::string("calibration unavailable: ") + sqlite3_errmsg(db_);
    return false;
  }
  sqlite3_bind_int(st.s, 1, key.year);
  sqlite3_bind_text(st.s, 2, event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.s, 3, key.session.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.s, 4, driver.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<double> all_laps;
  std::vector<double> clean_laps;
  std::vector<int> pit_laps;
  int max_lap = 0;

  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
    const int lap = sqlite3_column_int(st.s, 0);
    const double t = sqlite3_column_double(st.s, 1);
    const bool in = sqlite3_column_int(st.s, 2) != 0;
    const bool out_lap = sqlite3_column_int(st.s, 3) != 0;
    max_lap = std::max(max_lap, lap);
    all_laps.push_back(t);
    if (in) pit_laps.push_back(lap);
    if (!in && !out_lap) clean_laps.push_back(t);
  }
  if (rc != SQLITE_DONE) {
    if (error_message) *error_message = std::string("calibration unavailable: ") + sqlite3_errmsg(db_);
    return false;
  }
  if (all_laps.empty()) {
    if (error_message) {
      *error_message = "calibration unavailable: no laps for " + driver + " in " +
                       std::to_string(key.year) + " " + event + " " + key.session;
    }
    return false;
  }

  // Fall back to every lap when all of them touch the pit lane.
  const std::vector<double>& rep = clean_laps.empty() ? all_laps : clean_laps;

  SessionSummary s;
  s.base_lap_s = median(rep);
  if (rep.size() > 1) {
    double mean = 0.0;
    for (double t : rep) mean += t;
    mean /= static_cast<double>(rep.size());
    double sq = 0.0;
    for (double t : rep) sq += (t - mean) * (t - mean);
    s.lap_std_s = std::sqrt(sq / static_cast<double>(rep.size() - 1));
  }
  s.total_laps = max_lap;
  s.pit_laps = std::move(pit_laps);
  s.driver = driver;
  s.event = event;
  *out = std::move(s);
  return true;
}

RaceConfig apply_calibration(RaceConfig cfg, const SessionSummary* session,
                             const VenueConstants& venue) {
  cfg.pit_loss_s = venue.pit_loss_s;
  cfg.deg_factor = venue.deg_factor;
  if (session) {
    if (session->base_lap_s > 0.0) cfg.base_lap_s = session->base_lap_s;
    cfg.lap_std_s = std::clamp(session->lap_std_s, 0.1, 2.0);
    if (session->total_laps > 0) cfg.total_laps = session->total_laps;
  }
  if (cfg.pit_lap < 5 || cfg.pit_lap > cfg.total_laps - 5) {
    cfg.pit_lap = std::max(1, cfg.total_laps / 2);
  }
  return cfg;
}

} // namespace f1mc
