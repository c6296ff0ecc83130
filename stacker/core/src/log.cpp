#include <stacker/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>
#include <atomic>

namespace stacker::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::atomic<bool> s_console_output{true};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

void log(LogLevel level, const char* message) {
    if (level < s_log_level.load()) return;
    if (s_console_output.load()) {
        std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
        std::fprintf(stream, "%s\n", message);
    }

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, "", message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level.load();
}

void set_console_output(bool enabled) {
    s_console_output = enabled;
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

} // namespace stacker::core
