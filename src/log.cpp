#include <f1mc/log.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace f1mc {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  const std::time_t tt = clock::to_time_t(clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  try {
    const std::string stamp = utc_timestamp();
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::ostream& out = (lvl >= LogLevel::Warn) ? std::cerr : std::clog;
    out << "[" << stamp << "][" << level_tag(lvl) << "] " << msg << '\n';
    out.flush();
  } catch (const std::exception&) {
    // best-effort
  }
}

} // namespace f1mc
