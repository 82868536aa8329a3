#include <f1mc/analysis_runner.hpp>
#include <f1mc/viewer/app.hpp>

using namespace f1mc;

int main() {
  AnalysisRunner runner;
  runner.start();

  ViewerApp app(runner);
  const int code = app.run();

  runner.stop();
  return code;
}
