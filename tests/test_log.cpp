#include <catch2/catch_test_macros.hpp>
#include <iostream>
#include <sstream>
#include <f1mc/log.hpp>

using namespace f1mc;

namespace {

// Captures std::clog / std::cerr and restores them and the log level.
struct CapturedLog {
  std::ostringstream out, err;
  std::streambuf* old_clog;
  std::streambuf* old_cerr;
  LogLevel old_level;

  CapturedLog()
      : old_clog(std::clog.rdbuf(out.rdbuf())),
        old_cerr(std::cerr.rdbuf(err.rdbuf())),
        old_level(log_level()) {}
  ~CapturedLog() {
    std::clog.rdbuf(old_clog);
    std::cerr.rdbuf(old_cerr);
    set_log_level(old_level);
  }
};

} // namespace

TEST_CASE("messages below the threshold are suppressed") {
  CapturedLog cap;
  set_log_level(LogLevel::Warn);
  REQUIRE(log_level() == LogLevel::Warn);

  log_debug("debug line");
  log_info("info line");
  log_warn("pit window closed");
  log_error("engine failure");

  REQUIRE(cap.out.str().empty());
  REQUIRE(cap.err.str().find("[WARN] pit window closed") != std::string::npos);
  REQUIRE(cap.err.str().find("[ERROR] engine failure") != std::string::npos);
  REQUIRE(cap.err.str().find("info line") == std::string::npos);
}

TEST_CASE("debug level lets everything through to the right stream") {
  CapturedLog cap;
  set_log_level(LogLevel::Debug);

  log_debug("lap 12 sampled");
  log_info("run finished");

  REQUIRE(cap.out.str().find("[DEBUG] lap 12 sampled") != std::string::npos);
  REQUIRE(cap.out.str().find("[INFO] run finished") != std::string::npos);
  REQUIRE(cap.err.str().empty());
}
