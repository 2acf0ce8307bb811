#pragma once

#include <functional>
#include <string>

namespace slicecp {

enum class LogLevel {
    Error = 3,
    Warning = 4,
    Info = 6,
    Debug = 7,
};

const char *log_level_name(LogLevel level) noexcept;

using LogHandler = std::function<void(LogLevel, const std::string &)>;

// Process-wide and thread-safe. The default handler writes "slicecp: <message>" to
// std::cerr; passing an empty handler restores it.
void set_log_handler(LogHandler handler);

// Messages less severe than `level` are dropped before reaching the handler.
void set_log_threshold(LogLevel level);

void log(LogLevel level, const std::string &message);

inline void log_error(const std::string &message) { log(LogLevel::Error, message); }
inline void log_warning(const std::string &message) { log(LogLevel::Warning, message); }
inline void log_info(const std::string &message) { log(LogLevel::Info, message); }
inline void log_debug(const std::string &message) { log(LogLevel::Debug, message); }

} // namespace slicecp
