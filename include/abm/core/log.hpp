// log.hpp — leveled diagnostics to stderr with a swappable sink
#pragma once

#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace abm {
namespace core {

enum class LogLevel : int { debug = 0, info = 1, warn = 2, error = 3, off = 4 };

using LogSink = std::function<void(LogLevel, std::string_view)>;

// Process-wide threshold. Records below it are dropped before formatting.
// Initialized from ABM_LOG_LEVEL (debug|info|warn|error|off or 0..4) on first use.
LogLevel log_level() noexcept;
void set_log_level(LogLevel level) noexcept;

// Replace the sink (default writes "[abm:<level>] msg\n" to stderr).
// Passing an empty function restores the default sink.
void set_log_sink(LogSink sink);

const char* to_string(LogLevel level) noexcept;
bool parse_log_level(std::string_view s, LogLevel& out) noexcept;

void log(LogLevel level, std::string_view msg);

inline bool log_enabled(LogLevel level) noexcept {
    return level != LogLevel::off && static_cast<int>(level) >= static_cast<int>(log_level());
}

inline void log_debug(std::string_view msg) { log(LogLevel::debug, msg); }
inline void log_info(std::string_view msg)  { log(LogLevel::info, msg); }
inline void log_warn(std::string_view msg)  { log(LogLevel::warn, msg); }
inline void log_error(std::string_view msg) { log(LogLevel::error, msg); }

} // namespace core
} // namespace abm
