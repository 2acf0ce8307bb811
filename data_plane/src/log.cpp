#include "slicecp/log.hpp"

#include <iostream>
#include <mutex>

namespace slicecp {

namespace {

std::mutex &log_mutex() {
    static std::mutex mutex;
    return mutex;
}

LogHandler &log_handler() {
    static LogHandler handler;
    return handler;
}

LogLevel &log_threshold() {
    static LogLevel threshold = LogLevel::Info;
    return threshold;
}

void default_handler(LogLevel level, const std::string &message) {
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    if (level == LogLevel::Error || level == LogLevel::Warning) {
        std::cerr << "slicecp: " << log_level_name(level) << ": " << message << std::endl;
    } else {
        std::cerr << "slicecp: " << message << std::endl;
    }
}

} // namespace

const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    }
    return "???";
}

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_handler() = std::move(handler);
}

void set_log_threshold(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_threshold() = level;
}

void log(LogLevel level, const std::string &message) {
    LogHandler handler;
    {
        std::lock_guard<std::mutex> lock(log_mutex());
        if (static_cast<int>(level) > static_cast<int>(log_threshold())) {
            return;
        }
        handler = log_handler();
    }
    // Called unlocked so a handler may log or replace itself.
    if (handler) {
        handler(level, message);
    } else {
        default_handler(level, message);
    }
}

} // namespace slicecp
