#include <catch2/catch_test_macros.hpp>
#include <pulse/core/log.hpp>
#include <string>
#include <vector>

using namespace pulse::core;

namespace {

struct CapturingSink : ILogSink {
    struct Record {
        LogLevel level;
        std::string category;
        std::string message;
    };
    std::vector<Record> records;

    void log(LogLevel level, const std::string& category, const std::string& message) override {
        records.push_back({level, category, message});
    }
};

// Restores the global level and detaches the sink when a test ends
struct GlobalLogGuard {
    ILogSink* sink;
    LogLevel previous = get_log_level();

    explicit GlobalLogGuard(ILogSink* s) : sink(s) { add_log_sink(sink); }
    ~GlobalLogGuard() {
        remove_log_sink(sink);
        set_log_level(previous);
    }
};

} // namespace

TEST_CASE("Log level names", "[core][log]") {
    REQUIRE(std::string(log_level_name(LogLevel::Trace)) == "Trace");
    REQUIRE(std::string(log_level_name(LogLevel::Info)) == "Info");
    REQUIRE(std::string(log_level_name(LogLevel::Warn)) == "Warn");
    REQUIRE(std::string(log_level_name(LogLevel::Fatal)) == "Fatal");
}

TEST_CASE("Global log forwards to sinks", "[core][log]") {
    CapturingSink sink;
    GlobalLogGuard guard(&sink);
    set_log_level(LogLevel::Trace);

    SECTION("Plain message") {
        log(LogLevel::Info, "hello");
        REQUIRE(sink.records.size() == 1);
        REQUIRE(sink.records[0].level == LogLevel::Info);
        REQUIRE(sink.records[0].message == "hello");
        REQUIRE(sink.records[0].category.empty());
    }

    SECTION("Formatted message") {
        log(LogLevel::Warn, "{} has {} hp", "Player", 42);
        REQUIRE(sink.records.size() == 1);
        REQUIRE(sink.records[0].message == "Player has 42 hp");
    }

    SECTION("Removed sink receives nothing") {
        remove_log_sink(&sink);
        log(LogLevel::Info, "dropped");
        REQUIRE(sink.records.empty());
    }
}

TEST_CASE("Global log level filters", "[core][log]") {
    CapturingSink sink;
    GlobalLogGuard guard(&sink);
    set_log_level(LogLevel::Warn);

    log(LogLevel::Debug, "debug");
    log(LogLevel::Info, "info {}", 1);
    log(LogLevel::Error, "error");

    REQUIRE(sink.records.size() == 1);
    REQUIRE(sink.records[0].message == "error");
    REQUIRE(get_log_level() == LogLevel::Warn);
}

TEST_CASE("Sink registration ignores duplicates and null", "[core][log]") {
    CapturingSink sink;
    GlobalLogGuard guard(&sink);
    set_log_level(LogLevel::Info);

    add_log_sink(&sink);
    add_log_sink(nullptr);
    log(LogLevel::Info, "once");

    REQUIRE(sink.records.size() == 1);
}

TEST_CASE("ConsoleLogSink minimum level", "[core][log]") {
    ConsoleLogSink sink(LogLevel::Warn);
    REQUIRE(sink.get_min_level() == LogLevel::Warn);

    sink.set_min_level(LogLevel::Trace);
    REQUIRE(sink.get_min_level() == LogLevel::Trace);

    // Writes to stdout, must not throw
    sink.log(LogLevel::Info, "Test", "console output");
    sink.log(LogLevel::Info, "", "uncategorized output");
}
