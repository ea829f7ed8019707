#include <porchlight/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace porchlight::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "Trace";
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info: return "Info";
        case LogLevel::Warn: return "Warn";
        case LogLevel::Error: return "Error";
        case LogLevel::Fatal: return "Fatal";
        default: return "Unknown";
    }
}

// Pulls the "[Tag]" prefix out of a message, if present
static std::string extract_category(const char* message) {
    if (!message || message[0] != '[') return {};
    const char* end = message + 1;
    while (*end && *end != ']') ++end;
    if (*end != ']') return {};
    return std::string(message + 1, end);
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level) return;
    if (!message) return;
#ifdef _WIN32
    OutputDebugStringA(message);
    OutputDebugStringA("\n");
#endif
    std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
    std::fprintf(stream, "%s\n", message);

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (s_log_sinks.empty()) return;

    std::string category = extract_category(message);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

} // namespace porchlight::core
