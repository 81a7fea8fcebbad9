// ==============================================================================
// Log Facade Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "logging/log.h"
#include "test_helpers/capture_log_sink.h"

#include <string>

using namespace Harmonia;
using Harmonia::Testing::CaptureLogSink;

TEST_CASE("Log forwards entries to the installed sink", "[log]") {
    CaptureLogSink sink(LogLevel::Debug);

    Log::debug("params", "first");
    Log::warn("controller", "second");

    REQUIRE(sink.entries_.size() == 2);
    CHECK(sink.entries_[0].level == LogLevel::Debug);
    CHECK(sink.entries_[0].tag == "params");
    CHECK(sink.entries_[0].message == "first");
    CHECK(sink.entries_[1].level == LogLevel::Warn);
    CHECK(sink.entries_[1].tag == "controller");
}

TEST_CASE("Entries below the minimum level are dropped", "[log]") {
    CaptureLogSink sink(LogLevel::Warn);

    Log::debug("t", "dropped");
    Log::info("t", "dropped");
    Log::warn("t", "kept");
    Log::error("t", "kept");

    CHECK(sink.entries_.size() == 2);
    CHECK_FALSE(sink.contains("dropped"));
    CHECK(Log::isEnabled(LogLevel::Error));
    CHECK_FALSE(Log::isEnabled(LogLevel::Info));
}

TEST_CASE("Off suppresses everything", "[log]") {
    CaptureLogSink sink(LogLevel::Off);

    Log::error("t", "nothing");
    Log::write(LogLevel::Off, "t", "nothing");

    CHECK(sink.entries_.empty());
}

TEST_CASE("Capture sink restores the previous level", "[log]") {
    Log::setMinLevel(LogLevel::Error);
    {
        CaptureLogSink sink(LogLevel::Debug);
        CHECK(Log::minLevel() == LogLevel::Debug);
    }
    CHECK(Log::minLevel() == LogLevel::Error);
    Log::setMinLevel(LogLevel::Info);
}

TEST_CASE("Log level names round-trip through the parser", "[log]") {
    for (const LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                                 LogLevel::Error, LogLevel::Off}) {
        std::string lower(toString(level));
        for (auto& c : lower) c = static_cast<char>(c - 'A' + 'a');
        LogLevel parsed = LogLevel::Info;
        REQUIRE(parseLogLevel(lower, parsed));
        CHECK(parsed == level);
    }

    LogLevel untouched = LogLevel::Warn;
    CHECK_FALSE(parseLogLevel("verbose", untouched));
    CHECK_FALSE(parseLogLevel("INFO", untouched));
    CHECK(untouched == LogLevel::Warn);
}
