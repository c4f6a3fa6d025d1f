#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace capbox {
namespace log_utils {

enum class LogLevel : int {
    QUIET = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

void set_log_level(LogLevel level);
LogLevel log_level();

inline bool enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(log_level());
}

// Writes "[capbox] <tag>: <message>" to stderr when the level is enabled.
void log(LogLevel level, const std::string& message);

inline void warn(const std::string& message) { log(LogLevel::WARN, message); }
inline void info(const std::string& message) { log(LogLevel::INFO, message); }
inline void debug(const std::string& message) { log(LogLevel::DEBUG, message); }

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Fixed-precision number for log lines.
inline std::string fmt(double value, int precision = 3) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

}  // namespace log_utils
}  // namespace capbox
