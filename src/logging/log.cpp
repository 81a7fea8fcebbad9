// ==============================================================================
// Log Implementation
// ==============================================================================

#include "logging/log.h"

#include <atomic>
#include <cstdio>

namespace Harmonia {

namespace {

StderrLogSink g_stderrSink;
std::atomic<ILogSink*> g_sink{&g_stderrSink};
std::atomic<LogLevel> g_minLevel{LogLevel::Info};

} // anonymous namespace

std::string_view toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

bool parseLogLevel(std::string_view text, LogLevel& level) noexcept {
    if (text == "debug") { level = LogLevel::Debug; return true; }
    if (text == "info")  { level = LogLevel::Info;  return true; }
    if (text == "warn")  { level = LogLevel::Warn;  return true; }
    if (text == "error") { level = LogLevel::Error; return true; }
    if (text == "off")   { level = LogLevel::Off;   return true; }
    return false;
}

void StderrLogSink::write(LogLevel level, std::string_view tag, std::string_view message) {
    const std::string_view levelText = toString(level);
    std::fprintf(stderr, "[%.*s] %.*s: %.*s\n",
                 static_cast<int>(levelText.size()), levelText.data(),
                 static_cast<int>(tag.size()), tag.data(),
                 static_cast<int>(message.size()), message.data());
}

void Log::setSink(ILogSink* sink) noexcept {
    g_sink.store(sink != nullptr ? sink : &g_stderrSink, std::memory_order_release);
}

void Log::setMinLevel(LogLevel level) noexcept {
    g_minLevel.store(level, std::memory_order_relaxed);
}

LogLevel Log::minLevel() noexcept {
    return g_minLevel.load(std::memory_order_relaxed);
}

bool Log::isEnabled(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= minLevel();
}

void Log::write(LogLevel level, std::string_view tag, std::string_view message) {
    if (!isEnabled(level)) {
        return;
    }
    g_sink.load(std::memory_order_acquire)->write(level, tag, message);
}

} // namespace Harmonia
