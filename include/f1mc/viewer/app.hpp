#pragma once
#include <cstdint>
#include <f1mc/analysis_runner.hpp>
#include <f1mc/config.hpp>

namespace f1mc {

// RAII application that edits the race configuration, triggers analysis
// jobs and renders the latest published results.
class ViewerApp {
public:
  explicit ViewerApp(AnalysisRunner& runner);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void adjust_field_(int field, int dir);
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_config_panel_(int x, int y, int w, int h);
  void draw_histogram_(int x, int y, int w, int h);
  void draw_lap_chart_(int x, int y, int w, int h);
  void draw_strategy_(int x, int y, int w, int h);
  void draw_hud_();

  // Dependencies
  AnalysisRunner& runner_;
  AnalysisSnapshot snap_{};
  std::uint64_t cursor_{0};

  // UI state
  RaceConfig cfg_{};
  int selected_field_{0};
  int venue_idx_{-1};      // -1 = no venue calibration
  int lap_trace_{0};       // 0 lap time, 1 power, 2 temperature, 3 engine wear
};

} // namespace f1mc
