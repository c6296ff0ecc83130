#pragma once

#include <format>
#include <string>
#include <utility>

namespace stacker::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

inline const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        default: return "unknown";
    }
}

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

void log(LogLevel level, const char* message);

template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    log(level, std::format(fmt, std::forward<Args>(args)...).c_str());
}

// Mirror messages to stdout (sinks still receive them when disabled)
void set_console_output(bool enabled);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace stacker::core
