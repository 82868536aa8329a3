#pragma once
#include <string>

namespace f1mc {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide verbosity (default Info).
void set_log_level(LogLevel lvl) noexcept;
LogLevel log_level() noexcept;

// Serialized; Warn/Error go to stderr. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) noexcept  { log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg) noexcept  { log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::Error, msg); }

} // namespace f1mc
