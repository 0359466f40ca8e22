#include <pulse/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>

namespace pulse::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "Trace";
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info:  return "Info";
        case LogLevel::Warn:  return "Warn";
        case LogLevel::Error: return "Error";
        case LogLevel::Fatal: return "Fatal";
    }
    return "Unknown";
}

void ConsoleLogSink::log(LogLevel level, const std::string& category, const std::string& message) {
    if (level < m_min_level) return;
    if (category.empty()) {
        std::printf("[%s] %s\n", log_level_name(level), message.c_str());
    } else {
        std::printf("[%s] [%s] %s\n", log_level_name(level), category.c_str(), message.c_str());
    }
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level) return;
    std::printf("%s\n", message);

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
    return s_log_level;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (std::find(s_log_sinks.begin(), s_log_sinks.end(), sink) != s_log_sinks.end()) return;
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

} // namespace pulse::core
