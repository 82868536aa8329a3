#pragma once
#include <istream>
#include <string>
#include <vector>
#include <f1mc/config.hpp>
#include <f1mc/track.hpp>

struct sqlite3;

namespace f1mc {

struct SessionKey {
  int year = 2024;
  std::string event;          // case-insensitive substring naming one event, e.g. "british"
  std::string session = "R";
};

// One timed lap as imported from a timing feed.
struct SessionLap {
  int year = 0;
  std::string event;
  std::string session = "R";
  std::string driver;
  int lap_number = 0;
  double lap_time_s = 0.0;
  bool pit_in = false;
  bool pit_out = false;
};

// Numbers a race configuration can be seeded with.
struct SessionSummary {
  double base_lap_s = 0.0;        // median of laps without pit in/out
  double lap_std_s = 0.5;         // sample std of those laps
  int total_laps = 0;
  std::vector<int> pit_laps;
  std::string driver;
  std::string event;
};

// Caller-owned lap cache backed by a SQLite file (or ":memory:").
// Nothing is shared between stores; the caller decides where it lives and
// when it is opened or closed.
class SessionStore {
public:
  SessionStore() = default;
  ~SessionStore();
  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  bool open(const std::string& db_path, std::string* error_message);
  void close();
  bool is_open() const { return db_ != nullptr; }

  bool record_lap(const SessionLap& lap, std::string* error_message);
  // All-or-nothing insert of a batch, in one transaction.
  bool record_laps(const std::vector<SessionLap>& laps, std::string* error_message);

  // Distinct drivers with at least one lap in any event matching the key, sorted.
  bool drivers(const SessionKey& key, std::vector<std::string>* out,
               std::string* error_message) const;

  // Fails ("calibration unavailable") when the store is closed, the query
  // fails or the driver has no laps in the session.
  bool summarize(const SessionKey& key, const std::string& driver,
                 SessionSummary* out, std::string* error_message) const;

private:
  // Narrows key.event (a case-insensitive substring) to exactly one stored
  // event name. An empty key or several matches without an exact name fails.
  bool resolve_event_(const SessionKey& key, std::string* event,
                      std::string* error_message) const;
  bool exec_(const char* sql, std::string* error_message);

  sqlite3* db_ = nullptr;
};

// Lap rows as CSV: year,event,session,driver,lap,lap_time_s,pit_in,pit_out.
// Optional header, '#' comments and blank lines are skipped; rows with a
// wrong column count or unparsable numbers are counted in `skipped`.
std::vector<SessionLap> session_laps_from_csv_stream(std::istream& in, std::size_t* skipped);

// Copies calibration numbers into `cfg`. `session` may be null (venue only).
// lap_std is clamped to [0.1, 2.0]; the pit lap moves to laps/2 when it falls
// outside [5, laps-5].
RaceConfig apply_calibration(RaceConfig cfg, const SessionSummary* session,
                             const VenueConstants& venue);

} // namespace f1mc
