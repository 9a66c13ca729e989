// log.cpp — process-wide log threshold and sink

#include "abm/core/log.hpp"
#include "abm/core/config.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>

namespace abm {
namespace core {

namespace {

LogLevel initial_level() noexcept {
    LogLevel lvl = static_cast<LogLevel>(ABM_DEFAULT_LOG_LEVEL);
    if (const char* env = std::getenv("ABM_LOG_LEVEL")) {
        LogLevel parsed;
        if (parse_log_level(env, parsed)) lvl = parsed;
    }
    return lvl;
}

std::atomic<int>& level_slot() noexcept {
    static std::atomic<int> slot{static_cast<int>(initial_level())};
    return slot;
}

// Replicate runners may log from worker threads; serialize sink access.
std::mutex& sink_mutex() {
    static std::mutex mu;
    return mu;
}

LogSink& sink_slot() {
    static LogSink sink;
    return sink;
}

void default_sink(LogLevel level, std::string_view msg) {
    std::fprintf(stderr, "[abm:%s] %.*s\n", to_string(level),
                 static_cast<int>(msg.size()), msg.data());
    std::fflush(stderr);
}

} // namespace

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel level) noexcept {
    level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lk(sink_mutex());
    sink_slot() = std::move(sink);
}

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
        case LogLevel::off:   return "off";
    }
    return "?";
}

bool parse_log_level(std::string_view s, LogLevel& out) noexcept {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "debug" || lower == "0") { out = LogLevel::debug; return true; }
    if (lower == "info"  || lower == "1") { out = LogLevel::info;  return true; }
    if (lower == "warn"  || lower == "warning" || lower == "2") { out = LogLevel::warn; return true; }
    if (lower == "error" || lower == "3") { out = LogLevel::error; return true; }
    if (lower == "off"   || lower == "none" || lower == "4") { out = LogLevel::off; return true; }
    return false;
}

void log(LogLevel level, std::string_view msg) {
    if (!log_enabled(level)) return;
    std::lock_guard<std::mutex> lk(sink_mutex());
    if (sink_slot()) sink_slot()(level, msg);
    else             default_sink(level, msg);
}

} // namespace core
} // namespace abm
