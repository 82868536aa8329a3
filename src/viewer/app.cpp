#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include <f1mc/viewer/app.hpp>
#include <f1mc/report.hpp>
#include <f1mc/session.hpp>
#include <f1mc/strategy.hpp>
#include <f1mc/track.hpp>

namespace f1mc {

namespace {

enum Field : int {
  kBaseLap = 0, kLapStd, kLaps, kPitLap, kPitLoss, kStress, kReliability,
  kFuel, kCompound, kSafetyCar, kFieldCount
};

const char* kFieldNames[kFieldCount] = {
  "Base lap (s)", "Lap variability (s)", "Total laps", "Pit lap", "Pit loss (s)",
  "Engine stress", "Reliability", "Start fuel (kg)", "Tyre compound", "Safety car",
};

const Color kPanel    = Color{24, 24, 28, 220};
const Color kText     = Color{220, 220, 230, 255};
const Color kDim      = Color{150, 150, 165, 255};
const Color kAccent   = Color{52, 152, 219, 255};
const Color kBest     = Color{80, 220, 120, 255};

Color compound_color(TyreCompound c) {
  switch (c) {
    case TyreCompound::Soft:   return Color{231, 76, 60, 255};
    case TyreCompound::Medium: return Color{241, 196, 15, 255};
    case TyreCompound::Hard:   return Color{236, 236, 236, 255};
  }
  return kText;
}

void draw_panel(int x, int y, int w, int h, const char* title) {
  DrawRectangle(x - 4, y - 4, w + 8, h + 8, Color{0, 0, 0, 80});
  DrawRectangle(x, y, w, h, kPanel);
  DrawText(title, x + 8, y + 6, 16, kText);
  DrawLine(x, y + 26, x + w, y + 26, Color{60, 60, 70, 255});
}

double step_value(double v, double step, double lo, double hi, int dir) {
  return std::clamp(v + step * dir, lo, hi);
}

// Polyline of `ys` scaled into the rect; returns the y range used.
void draw_series(const std::vector<double>& ys, int x, int y, int w, int h, Color col) {
  if (ys.size() < 2) return;
  const auto [mn, mx] = std::minmax_element(ys.begin(), ys.end());
  const double lo = *mn, hi = (*mx > *mn) ? *mx : *mn + 1.0;
  auto px = [&](std::size_t i) { return x + float(i) * w / float(ys.size() - 1); };
  auto py = [&](double v) { return y + h - float((v - lo) / (hi - lo)) * h; };
  for (std::size_t i = 1; i < ys.size(); ++i) {
    DrawLineEx({px(i - 1), py(ys[i - 1])}, {px(i), py(ys[i])}, 2.0f, col);
  }
  DrawText(TextFormat("%.2f", hi), x + 4, y, 12, kDim);
  DrawText(TextFormat("%.2f", lo), x + 4, y + h - 12, 12, kDim);
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(AnalysisRunner& runner) : runner_(runner) {}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "F1MC - Race Strategy");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::adjust_field_(int field, int dir) {
  switch (field) {
    case kBaseLap:     cfg_.base_lap_s = step_value(cfg_.base_lap_s, 0.5, 70.0, 120.0, dir); break;
    case kLapStd:      cfg_.lap_std_s = step_value(cfg_.lap_std_s, 0.1, 0.1, 2.0, dir); break;
    case kLaps:        cfg_.total_laps = std::clamp(cfg_.total_laps + dir, 30, 100); break;
    case kPitLap:      cfg_.pit_lap += dir; break;
    case kPitLoss:     cfg_.pit_loss_s = step_value(cfg_.pit_loss_s, 0.5, 15.0, 30.0, dir); break;
    case kStress:      cfg_.engine_stress = step_value(cfg_.engine_stress, 0.1, 0.5, 2.0, dir); break;
    case kReliability: cfg_.reliability = step_value(cfg_.reliability, 0.005, 0.90, 1.0, dir); break;
    case kFuel:        cfg_.fuel_load_kg = step_value(cfg_.fuel_load_kg, 5.0, 50.0, 110.0, dir); break;
    case kCompound: {
      const int n = static_cast<int>(kAllCompounds.size());
      cfg_.compound = kAllCompounds[static_cast<std::size_t>((static_cast<int>(cfg_.compound) + dir + n) % n)];
      break;
    }
    case kSafetyCar:   cfg_.safety_car = !cfg_.safety_car; break;
    default: break;
  }
  // Pit window follows the race length
  cfg_.pit_lap = std::clamp(cfg_.pit_lap, 5, std::max(5, cfg_.total_laps - 5));
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_UP))   selected_field_ = (selected_field_ + kFieldCount - 1) % kFieldCount;
  if (IsKeyPressed(KEY_DOWN)) selected_field_ = (selected_field_ + 1) % kFieldCount;
  if (IsKeyPressed(KEY_LEFT))  adjust_field_(selected_field_, -1);
  if (IsKeyPressed(KEY_RIGHT)) adjust_field_(selected_field_, +1);

  // Venue calibration: cycle through the catalog, then back to none
  if (IsKeyPressed(KEY_V)) {
    const auto& cat = venue_catalog();
    venue_idx_ = (venue_idx_ + 2) % (static_cast<int>(cat.size()) + 1) - 1;
    if (venue_idx_ >= 0) {
      const auto& v = cat[static_cast<std::size_t>(venue_idx_)];
      cfg_ = apply_calibration(cfg_, nullptr, VenueConstants{v.pit_loss_s, v.deg_factor});
    } else {
      cfg_.deg_factor = 1.0;
    }
  }

  if (IsKeyPressed(KEY_T)) lap_trace_ = (lap_trace_ + 1) % 4;

  if (IsKeyPressed(KEY_M)) runner_.request(JobKind::MonteCarlo, cfg_);
  if (IsKeyPressed(KEY_R)) runner_.request(JobKind::SingleRace, cfg_);
  if (IsKeyPressed(KEY_O)) runner_.request(JobKind::Optimize, cfg_);
  if (IsKeyPressed(KEY_ONE))   runner_.mc_simulations.store(500);
  if (IsKeyPressed(KEY_TWO))   runner_.mc_simulations.store(2000);
  if (IsKeyPressed(KEY_THREE)) runner_.mc_simulations.store(10000);
}

void ViewerApp::pump_snapshots_() {
  (void)runner_.buffer().try_consume_latest(cursor_, snap_);
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{16, 18, 22, 255});

  const int W = GetScreenWidth(), H = GetScreenHeight();
  const int pad = 16, top = 64;
  const int left_w = 330;
  const int right_x = pad + left_w + pad;
  const int right_w = W - right_x - pad;
  const int row_h = (H - top - pad * 3) / 2;

  draw_config_panel_(pad, top, left_w, H - top - pad);
  draw_histogram_(right_x, top, right_w / 2 - pad / 2, row_h);
  draw_lap_chart_(right_x + right_w / 2 + pad / 2, top, right_w / 2 - pad / 2, row_h);
  draw_strategy_(right_x, top + row_h + pad, right_w, row_h);
  draw_hud_();

  EndDrawing();
}

void ViewerApp::draw_config_panel_(int x, int y, int w, int h) {
  draw_panel(x, y, w, h, "Race parameters");
  int row = y + 36;
  for (int f = 0; f < kFieldCount; ++f) {
    char value[64];
    switch (f) {
      case kBaseLap:     std::snprintf(value, sizeof(value), "%.1f", cfg_.base_lap_s); break;
      case kLapStd:      std::snprintf(value, sizeof(value), "%.1f", cfg_.lap_std_s); break;
      case kLaps:        std::snprintf(value, sizeof(value), "%d", cfg_.total_laps); break;
      case kPitLap:      std::snprintf(value, sizeof(value), "%d", cfg_.pit_lap); break;
      case kPitLoss:     std::snprintf(value, sizeof(value), "%.1f", cfg_.pit_loss_s); break;
      case kStress:      std::snprintf(value, sizeof(value), "%.1f", cfg_.engine_stress); break;
      case kReliability: std::snprintf(value, sizeof(value), "%.3f", cfg_.reliability); break;
      case kFuel:        std::snprintf(value, sizeof(value), "%.0f", cfg_.fuel_load_kg); break;
      case kCompound:    std::snprintf(value, sizeof(value), "%s", to_string(cfg_.compound)); break;
      case kSafetyCar:   std::snprintf(value, sizeof(value), "%s", cfg_.safety_car ? "on" : "off"); break;
      default:           value[0] = '\0'; break;
    }
    const bool sel = (f == selected_field_);
    if (sel) DrawRectangle(x + 4, row - 2, w - 8, 22, Color{52, 152, 219, 60});
    DrawText(kFieldNames[f], x + 12, row, 16, sel ? kText : kDim);
    DrawText(value, x + w - 12 - MeasureText(value, 16), row, 16,
             f == kCompound ? compound_color(cfg_.compound) : kText);
    row += 26;
  }

  row += 10;
  const auto& cat = venue_catalog();
  const char* venue = venue_idx_ >= 0 ? cat[static_cast<std::size_t>(venue_idx_)].key.c_str() : "none";
  DrawText(TextFormat("Venue: %s  (deg %.1fx)", venue, cfg_.deg_factor), x + 12, row, 16, kText);
  row += 26;
  DrawText(TextFormat("MC runs: %d", static_cast<int>(runner_.mc_simulations.load())), x + 12, row, 16, kDim);
  row += 26;

  if (const auto err = validate_race_config(cfg_)) {
    DrawText(describe(*err).c_str(), x + 12, row, 14, Color{231, 76, 60, 255});
  }
}

void ViewerApp::draw_histogram_(int x, int y, int w, int h) {
  draw_panel(x, y, w, h, "Race time distribution");
  if (!snap_.monte_carlo) {
    DrawText("M: run Monte Carlo", x + 12, y + 40, 16, kDim);
    return;
  }
  const auto& mc = *snap_.monte_carlo;
  if (!snap_.stats || !snap_.histogram) {
    DrawText("All simulations resulted in DNF.", x + 12, y + 40, 16, Color{231, 76, 60, 255});
    DrawText("Reduce engine stress or increase reliability.", x + 12, y + 62, 14, kDim);
    return;
  }

  const auto& st = *snap_.stats;
  DrawText(TextFormat("mean %s   P5 %s   P95 %s   finish %.1f%%",
                      format_race_time(st.mean_s).c_str(),
                      format_race_time(st.p5_s).c_str(),
                      format_race_time(st.p95_s).c_str(),
                      100.0 * mc.finish_rate()),
           x + 12, y + 34, 14, kText);

  const auto& hist = *snap_.histogram;
  const int gx = x + 12, gy = y + 58, gw = w - 24, gh = h - 90;
  std::size_t peak = 1;
  for (auto c : hist.counts) peak = std::max(peak, c);
  const float bw = float(gw) / float(hist.counts.size());
  for (std::size_t b = 0; b < hist.counts.size(); ++b) {
    const float bh = float(gh) * float(hist.counts[b]) / float(peak);
    DrawRectangleRec({gx + bw * b + 1.0f, gy + gh - bh, bw - 2.0f, bh}, kAccent);
  }
  auto marker = [&](double t, Color c) {
    const float mx = gx + float((t - hist.lo_s) / (hist.hi_s - hist.lo_s)) * gw;
    DrawLineEx({mx, float(gy)}, {mx, float(gy + gh)}, 2.0f, c);
  };
  marker(st.p5_s, kDim);
  marker(st.mean_s, kBest);
  marker(st.p95_s, kDim);
  DrawText(TextFormat("%.1f s", hist.lo_s), gx, gy + gh + 6, 12, kDim);
  const char* hi = TextFormat("%.1f s", hist.hi_s);
  DrawText(hi, gx + gw - MeasureText(hi, 12), gy + gh + 6, 12, kDim);
}

void ViewerApp::draw_lap_chart_(int x, int y, int w, int h) {
  static const char* kTraceNames[4] = {"Lap time (s)", "Engine power (hp)",
                                       "Engine temperature (C)", "Engine wear"};
  draw_panel(x, y, w, h, TextFormat("Single race: %s  [T]", kTraceNames[lap_trace_]));
  if (!snap_.race) {
    DrawText("R: simulate one race", x + 12, y + 40, 16, kDim);
    return;
  }
  const auto& race = *snap_.race;

  std::vector<double> ys;
  ys.reserve(race.laps.size());
  for (const auto& l : race.laps) {
    switch (lap_trace_) {
      case 0: ys.push_back(l.lap_time_s); break;
      case 1: ys.push_back(l.power_hp); break;
      case 2: ys.push_back(l.temperature_c); break;
      default: ys.push_back(l.engine_deg); break;
    }
  }

  const int gx = x + 12, gy = y + 58, gw = w - 24, gh = h - 90;
  // Safety car laps shaded behind the trace
  if (race.laps.size() > 1) {
    const float lap_w = float(gw) / float(race.laps.size() - 1);
    for (std::size_t i = 0; i < race.laps.size(); ++i) {
      if (!race.laps[i].safety_car) continue;
      DrawRectangleRec({gx + lap_w * i - lap_w * 0.5f, float(gy), lap_w, float(gh)},
                       Color{241, 196, 15, 40});
    }
  }
  draw_series(ys, gx, gy, gw, gh, Color{231, 76, 60, 255});

  if (race.dnf) {
    DrawText(TextFormat("DNF on lap %d", race.dnf_lap.value_or(0)), x + 12, y + 34, 14,
             Color{231, 76, 60, 255});
  } else {
    DrawText(TextFormat("Finished: %s   SC laps: %d", format_race_time(race.total_time_s).c_str(),
                        race.safety_car_laps()),
             x + 12, y + 34, 14, kText);
  }
}

void ViewerApp::draw_strategy_(int x, int y, int w, int h) {
  draw_panel(x, y, w, h, "Strategy optimizer (expected race time vs pit lap)");
  if (!snap_.strategy) {
    DrawText("O: find optimal strategy", x + 12, y + 40, 16, kDim);
    return;
  }
  const auto& g = *snap_.strategy;
  if (!g.best) {
    DrawText("Optimization failed. All tested strategies resulted in DNF.", x + 12, y + 40, 16,
             Color{231, 76, 60, 255});
    return;
  }

  const auto& best = *g.best;
  DrawText(TextFormat("Ideal: %s until lap %d, expected %s", to_string(best.compound),
                      best.pit_lap, format_race_time(best.expected_time_s).c_str()),
           x + 12, y + 34, 14, kBest);

  double tmin = best.expected_time_s, tmax = best.expected_time_s;
  int lmin = g.cells.front().pit_lap, lmax = lmin;
  for (const auto& c : g.cells) {
    tmax = std::max(tmax, c.expected_time_s);
    lmin = std::min(lmin, c.pit_lap);
    lmax = std::max(lmax, c.pit_lap);
  }
  if (tmax <= tmin) tmax = tmin + 1.0;
  if (lmax <= lmin) lmax = lmin + 1;

  const int gx = x + 60, gy = y + 58, gw = w - 80, gh = h - 90;
  auto px = [&](int lap) { return gx + float(lap - lmin) / float(lmax - lmin) * gw; };
  auto py = [&](double t) { return gy + gh - float((t - tmin) / (tmax - tmin)) * gh; };

  for (TyreCompound comp : kAllCompounds) {
    const Color col = compound_color(comp);
    const StrategyCell* prev = nullptr;
    for (const auto& c : g.cells) {
      if (c.compound != comp) continue;
      if (prev) DrawLineEx({px(prev->pit_lap), py(prev->expected_time_s)},
                           {px(c.pit_lap), py(c.expected_time_s)}, 2.0f, col);
      DrawCircleV({px(c.pit_lap), py(c.expected_time_s)}, 3.0f, col);
      prev = &c;
    }
  }
  DrawCircleLines(int(px(best.pit_lap)), int(py(best.expected_time_s)), 8.0f, kBest);

  DrawText(TextFormat("%.1f", tmax), x + 8, gy - 6, 12, kDim);
  DrawText(TextFormat("%.1f", tmin), x + 8, gy + gh - 6, 12, kDim);
  DrawText(TextFormat("lap %d", lmin), gx, gy + gh + 6, 12, kDim);
  const char* hi = TextFormat("lap %d", lmax);
  DrawText(hi, gx + gw - MeasureText(hi, 12), gy + gh + 6, 12, kDim);

  int lx = x + w - 220;
  for (TyreCompound comp : kAllCompounds) {
    DrawRectangle(lx, y + 36, 10, 10, compound_color(comp));
    DrawText(to_string(comp), lx + 14, y + 33, 14, kText);
    lx += 70;
  }
}

void ViewerApp::draw_hud_() {
  const auto [done, total] = runner_.progress();
  char status[160];
  if (snap_.running != JobKind::None) {
    if (total > 0) {
      std::snprintf(status, sizeof(status), "Running %s... %zu/%zu", to_string(snap_.running), done, total);
    } else {
      std::snprintf(status, sizeof(status), "Running %s...", to_string(snap_.running));
    }
  } else if (!snap_.last_error.empty()) {
    std::snprintf(status, sizeof(status), "%s", snap_.last_error.c_str());
  } else {
    std::snprintf(status, sizeof(status), "Idle  (%llu jobs completed)",
                  static_cast<unsigned long long>(snap_.jobs_completed));
  }

  DrawText("Monte Carlo Race Strategy", 16, 12, 22, Color{220, 235, 220, 255});
  DrawText(status, 360, 16, 16, snap_.running != JobKind::None ? kAccent : kDim);
  DrawText("Up/Down: field | Left/Right: adjust | V: venue | M: Monte Carlo | R: single race | "
           "O: optimize | T: trace | 1-3: 500/2000/10000 runs",
           16, 40, 14, Color{190, 205, 190, 255});
}

} // namespace f1mc
