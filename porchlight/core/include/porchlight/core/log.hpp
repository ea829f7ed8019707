#pragma once

#include <format>
#include <string>
#include <utility>

namespace porchlight::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

const char* log_level_to_string(LogLevel level);

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Formatted logging, e.g. log(LogLevel::Info, "[Camera] mode {}", name)
template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace porchlight::core
