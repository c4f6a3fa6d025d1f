#include "capbox/log_utils.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace capbox {
namespace log_utils {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
std::mutex g_write_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::WARN: return "Warning";
        case LogLevel::INFO: return "Info";
        case LogLevel::DEBUG: return "Debug";
        default: return "";
    }
}

}  // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void log(LogLevel level, const std::string& message) {
    if (level == LogLevel::QUIET || !enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[capbox] " << level_tag(level) << ": " << message << "\n";
}

}  // namespace log_utils
}  // namespace capbox
