#pragma once

#include <format>
#include <string>
#include <utility>

namespace pulse::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

const char* log_level_name(LogLevel level);

// Diagnostic sink interface. Fire-and-forget: sinks never report back to the caller.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

// Writes "[Level] [category] message" lines to stdout
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(LogLevel min_level = LogLevel::Trace) : m_min_level(min_level) {}

    void log(LogLevel level, const std::string& category, const std::string& message) override;

    void set_min_level(LogLevel level) { m_min_level = level; }
    LogLevel get_min_level() const { return m_min_level; }

private:
    LogLevel m_min_level;
};

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

// Register/unregister custom log sinks for the global log() functions
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace pulse::core
